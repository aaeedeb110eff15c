#include "DesktopFile.h"

#include <QFile>
#include <QStringList>
#include <QTextCodec>

DesktopFile::DesktopFile()
{

}

bool DesktopFile::load(const QString &path)
{
    m_groups.clear();

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        m_errorString = file.errorString();
        return false;
    }
    const QByteArray data = file.readAll();
    file.close();

    // Reject anything that is not valid UTF-8 instead of guessing an encoding
    QTextCodec *codec = QTextCodec::codecForName("UTF-8");
    QTextCodec::ConverterState state;
    const QString text = codec->toUnicode(data.constData(), data.size(), &state);
    if (state.invalidChars > 0 || state.remainingChars > 0) {
        m_errorString = QString("%1 is not valid UTF-8").arg(path);
        return false;
    }

    return parse(text);
}

bool DesktopFile::parse(const QString &text)
{
    m_groups.clear();
    m_errorString.clear();

    QHash<QString, QHash<QString, QString>> groups;
    QString currentGroup;
    bool inGroup = false;

    const QStringList lines = text.split(QLatin1Char('\n'));
    for (int i = 0; i < lines.length(); i++) {
        const QString line = lines[i].trimmed();
        const int lineNumber = i + 1;

        if (line.isEmpty() || line.startsWith(QLatin1Char('#'))) {
            continue;
        }

        if (line.startsWith(QLatin1Char('['))) {
            if (!line.endsWith(QLatin1Char(']')) || line.length() < 3) {
                m_errorString = QString("line %1: malformed group header").arg(lineNumber);
                return false;
            }
            currentGroup = line.mid(1, line.length() - 2);
            if (currentGroup.contains(QLatin1Char('[')) || currentGroup.contains(QLatin1Char(']'))) {
                m_errorString = QString("line %1: malformed group header").arg(lineNumber);
                return false;
            }
            inGroup = true;
            // A repeated header continues the existing group
            groups[currentGroup];
            continue;
        }

        const int separator = line.indexOf(QLatin1Char('='));
        if (separator < 0) {
            m_errorString = QString("line %1: expected 'Key=Value'").arg(lineNumber);
            return false;
        }
        if (!inGroup) {
            m_errorString = QString("line %1: key outside of any group").arg(lineNumber);
            return false;
        }
        const QString key = line.left(separator).trimmed();
        if (key.isEmpty()) {
            m_errorString = QString("line %1: empty key").arg(lineNumber);
            return false;
        }
        groups[currentGroup].insert(key, line.mid(separator + 1).trimmed());
    }

    m_groups = groups;
    return true;
}

bool DesktopFile::contains(const QString &group, const QString &key) const
{
    return m_groups.value(group).contains(key);
}

QString DesktopFile::value(const QString &group, const QString &key, bool &ok) const
{
    ok = contains(group, key);
    if (!ok) {
        return QString();
    }
    return m_groups.value(group).value(key);
}

QString DesktopFile::errorString() const
{
    return m_errorString;
}
