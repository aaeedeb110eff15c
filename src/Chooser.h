#ifndef CHOOSER_H
#define CHOOSER_H

#include <QByteArray>
#include <QString>
#include <QStringList>

/**
 * @file Chooser.h
 * @class Chooser
 * @brief Lets the user pick an application name with an external menu program such as dmenu.
 *
 * The menu program gets one name per line on its standard input and is expected
 * to print the chosen name on its standard output. A non-zero exit status or
 * blank output means the user cancelled.
 */
class Chooser
{
public:
    enum Result {
        Selected,          /**< The user picked a name. */
        Cancelled,         /**< The menu exited with an error or printed nothing. */
        FailedToStart,     /**< The menu program could not be started. */
        UndecodableOutput  /**< The menu printed something that is not UTF-8. */
    };

    /**
     * Constructor.
     *
     * @param command The menu program followed by its arguments.
     */
    explicit Chooser(const QStringList &command);

    /**
     * Split a menu invocation such as "dmenu -i -l 10" on whitespace.
     */
    static QStringList commandFromString(const QString &menu);

    /**
     * Build what is written to the menu's standard input.
     *
     * The names are sorted by code point and each one is followed by a newline.
     *
     * @param names The names in any order.
     * @return UTF-8 encoded input for the menu.
     */
    static QByteArray inputForNames(const QStringList &names);

    /**
     * Run the menu and wait for the user's choice.
     *
     * Blocks until the menu program exits.
     *
     * @param names The names to offer.
     * @param selection Receives the chosen name, trimmed, if Selected is returned.
     * @return The outcome; errorString() describes FailedToStart and UndecodableOutput.
     */
    Result choose(const QStringList &names, QString &selection);

    QString errorString() const;

private:
    QStringList m_command;
    QString m_errorString;
};

#endif // CHOOSER_H
