#ifndef LAUNCHER_H
#define LAUNCHER_H

#include <QString>
#include <QStringList>

#include "Application.h"
#include "Environment.h"

class Launcher
{
public:
    explicit Launcher(const Environment &env);

    // Takes precedence over $TERM, even when empty
    void setTerminalOverride(const QString &terminal);

    // Override if set, else $TERM, else xterm
    QString terminalEmulator() const;

    // Program first; wrapped as "<terminal> -e <exec...>" for terminal applications
    static QStringList commandLine(const ApplicationBody &body, const QString &terminalEmulator);

    int launch(const ApplicationBody &body);

private:
    Environment m_env;
    QString m_terminalOverride;
    bool m_hasTerminalOverride;
};

#endif // LAUNCHER_H
