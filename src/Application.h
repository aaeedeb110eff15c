#ifndef APPLICATION_H
#define APPLICATION_H

#include <QString>
#include <QStringList>

/**
 * @file Application.h
 * @brief Applications as described by .desktop files.
 */

/**
 * Everything needed to launch an application.
 */
struct ApplicationBody
{
    ApplicationBody();
    ApplicationBody(const QString &path, const QStringList &exec, bool terminal);

    bool operator==(const ApplicationBody &other) const;

    QString path;     /**< Canonical path of the .desktop file it came from. */
    QStringList exec; /**< Program followed by its arguments, field codes removed. */
    bool terminal;    /**< Whether it has to run inside a terminal emulator. */
};

/**
 * @class Application
 * @brief A launchable application with the name it is shown under.
 */
class Application
{
public:
    Application();
    Application(const QString &name, const QString &path, const QStringList &exec, bool terminal);

    QString name() const;
    ApplicationBody body() const;

    /**
     * Read an application from a .desktop file.
     *
     * Files that cannot be parsed, that are hidden with NoDisplay=true, whose
     * Type is not Application, that lack Name or Exec, or whose Terminal value
     * is not a boolean are skipped.
     *
     * @param path The path to the .desktop file.
     * @param ok Set to false if the file was skipped.
     * @return The application, or a default-constructed one if skipped.
     */
    static Application fromFile(const QString &path, bool &ok);

    /**
     * Split an Exec line into program and arguments.
     *
     * The line is split on whitespace; tokens starting with '%' are field codes
     * and are dropped without substitution.
     *
     * @param execLine The raw value of the Exec key.
     * @return The remaining tokens, in order.
     */
    static QStringList execFromString(const QString &execLine);

    /**
     * Parse a boolean value, ignoring case.
     *
     * @param value The text to parse.
     * @param ok Set to false unless the value is "true" or "false".
     * @return The parsed value.
     */
    static bool booleanFromString(const QString &value, bool &ok);

private:
    QString m_name;
    ApplicationBody m_body;
};

#endif // APPLICATION_H
