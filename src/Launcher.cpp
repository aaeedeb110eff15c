#include "Launcher.h"

#include <QDebug>
#include <QProcess>

Launcher::Launcher(const Environment &env)
    : m_env(env), m_hasTerminalOverride(false)
{

}

void Launcher::setTerminalOverride(const QString &terminal)
{
    m_terminalOverride = terminal;
    m_hasTerminalOverride = true;
}

QString Launcher::terminalEmulator() const
{
    if (m_hasTerminalOverride) {
        return m_terminalOverride;
    }
    bool ok = false;
    const QString terminal = m_env.terminal(ok);
    if (ok) {
        return terminal;
    }
    qWarning("could not infer terminal emulator, assuming xterm");
    return "xterm";
}

QStringList Launcher::commandLine(const ApplicationBody &body, const QString &terminalEmulator)
{
    if (!body.terminal) {
        return body.exec;
    }
    QStringList command({terminalEmulator, "-e"});
    command.append(body.exec);
    return command;
}

int Launcher::launch(const ApplicationBody &body)
{
    // How the failing command is described to the user
    QString description = body.exec.join(" ");

    QStringList command;
    if (body.terminal) {
        const QString terminal = terminalEmulator();
        command = commandLine(body, terminal);
        description = QString("%1 -e %2").arg(terminal, description);
    } else {
        command = commandLine(body, QString());
    }

    // Only possible for an Exec line that consisted of field codes alone
    if (command.isEmpty()) {
        qCritical().noquote() << QString("error when executing '%1': empty command line").arg(description);
        return 1;
    }

    QProcess p;
    p.setProgram(command.first());
    p.setArguments(command.mid(1));
    p.setProcessChannelMode(QProcess::ForwardedChannels);
    p.setInputChannelMode(QProcess::ForwardedInputChannel);

    qDebug() << "# program:" << p.program();
    qDebug() << "# args:" << p.arguments();
    qDebug() << "# desktop file:" << body.path;

    p.start();

    // Blocks until process has started
    if (!p.waitForStarted(-1)) {
        qCritical().noquote() << QString("error when executing '%1': %2").arg(description, p.errorString());
        return 1;
    }

    // The exit code of the application itself is not ours to report
    p.waitForFinished(-1);
    qDebug() << "Application exited with code" << p.exitCode();

    return 0;
}
