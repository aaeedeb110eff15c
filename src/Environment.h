#ifndef ENVIRONMENT_H
#define ENVIRONMENT_H

#include <QProcessEnvironment>
#include <QString>

/**
 * @file Environment.h
 * @class Environment
 * @brief Read-only view of the process environment variables menulaunch cares about.
 *
 * The variables are captured once when the object is constructed. Tests pass in
 * a hand-built QProcessEnvironment instead of the real one.
 */
class Environment
{
public:
    explicit Environment(const QProcessEnvironment &env = QProcessEnvironment::systemEnvironment());

    /**
     * Get the user's home directory from $HOME.
     *
     * @param ok Set to false if $HOME is not set.
     * @return The home directory, or an empty string.
     */
    QString home(bool &ok) const;

    /**
     * Get the terminal emulator named by $TERM.
     *
     * @param ok Set to false if $TERM is not set.
     * @return The value of $TERM, or an empty string.
     */
    QString terminal(bool &ok) const;

private:
    QString variable(const QString &name, bool &ok) const;

    QProcessEnvironment m_env;
};

#endif // ENVIRONMENT_H
