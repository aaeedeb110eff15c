#include "Application.h"

#include <QDebug>
#include <QRegularExpression>

#include "DesktopFile.h"

static const QString desktopEntryGroup = QStringLiteral("Desktop Entry");

ApplicationBody::ApplicationBody()
    : terminal(false)
{

}

ApplicationBody::ApplicationBody(const QString &path, const QStringList &exec, bool terminal)
    : path(path), exec(exec), terminal(terminal)
{

}

bool ApplicationBody::operator==(const ApplicationBody &other) const
{
    return path == other.path && exec == other.exec && terminal == other.terminal;
}

Application::Application()
{

}

Application::Application(const QString &name, const QString &path, const QStringList &exec, bool terminal)
    : m_name(name), m_body(path, exec, terminal)
{

}

QString Application::name() const
{
    return m_name;
}

ApplicationBody Application::body() const
{
    return m_body;
}

QStringList Application::execFromString(const QString &execLine)
{
    QStringList exec;
    const QStringList tokens = execLine.trimmed().split(QRegularExpression("\\s+", QRegularExpression::UseUnicodePropertiesOption),
                                                                QString::SkipEmptyParts);
    for (const QString &token : tokens) {
        if (token.startsWith(QLatin1Char('%'))) {
            continue;
        }
        exec.append(token);
    }
    return exec;
}

bool Application::booleanFromString(const QString &value, bool &ok)
{
    const QString lower = value.toLower();
    if (lower == "true") {
        ok = true;
        return true;
    }
    ok = (lower == "false");
    return false;
}

Application Application::fromFile(const QString &path, bool &ok)
{
    ok = false;

    DesktopFile desktopFile;
    if (!desktopFile.load(path)) {
        qDebug() << "Skipping" << path << "-" << desktopFile.errorString();
        return Application();
    }

    bool found = false;
    if (desktopFile.value(desktopEntryGroup, "NoDisplay", found) == "true") {
        qDebug() << "Skipping" << path << "- NoDisplay is set";
        return Application();
    }

    if (desktopFile.value(desktopEntryGroup, "Type", found) != "Application") {
        qDebug() << "Skipping" << path << "- not of Type Application";
        return Application();
    }

    bool hasName = false;
    bool hasExec = false;
    const QString name = desktopFile.value(desktopEntryGroup, "Name", hasName);
    const QString execLine = desktopFile.value(desktopEntryGroup, "Exec", hasExec);

    bool terminal = false;
    bool hasTerminal = false;
    const QString terminalValue = desktopFile.value(desktopEntryGroup, "Terminal", hasTerminal);
    if (hasTerminal) {
        bool isBoolean = false;
        terminal = booleanFromString(terminalValue, isBoolean);
        if (!isBoolean) {
            qDebug() << "Skipping" << path << "- Terminal is not a boolean:" << terminalValue;
            return Application();
        }
    }

    if (!hasName || !hasExec) {
        qDebug() << "Skipping" << path << "- Name or Exec missing";
        return Application();
    }

    // An Exec line made only of field codes still yields an application;
    // it fails when it is launched
    ok = true;
    return Application(name, path, execFromString(execLine), terminal);
}
