#ifndef APPLICATIONREGISTRY_H
#define APPLICATIONREGISTRY_H

#include <QHash>
#include <QList>
#include <QString>
#include <QStringList>

#include "Application.h"

/**
 * @file ApplicationRegistry.h
 * @class ApplicationRegistry
 * @brief Applications keyed by their display name.
 *
 * Inserting an application under a name that is already taken replaces the
 * earlier one, so the order in which applications are inserted decides which
 * one is kept.
 */
class ApplicationRegistry
{
public:
    ApplicationRegistry();

    void insert(const Application &application);
    void insert(const QList<Application> &applications);

    bool contains(const QString &name) const;
    ApplicationBody body(const QString &name) const;

    /**
     * Get all names, in no particular order.
     */
    QStringList names() const;

    int count() const;
    bool isEmpty() const;

    bool operator==(const ApplicationRegistry &other) const;

private:
    QHash<QString, ApplicationBody> m_applications;
};

#endif // APPLICATIONREGISTRY_H
