#include "Chooser.h"

#include <QDebug>
#include <QProcess>
#include <QRegularExpression>
#include <QTextCodec>

#include <algorithm>

// UTF-8 byte order is code point order; QString's own comparison is by UTF-16
// code unit and differs for characters outside the BMP
static bool codePointLessThan(const QString &a, const QString &b)
{
    return a.toUtf8() < b.toUtf8();
}

Chooser::Chooser(const QStringList &command)
    : m_command(command)
{

}

QStringList Chooser::commandFromString(const QString &menu)
{
    return menu.split(QRegularExpression("\\s+", QRegularExpression::UseUnicodePropertiesOption),
                      QString::SkipEmptyParts);
}

QByteArray Chooser::inputForNames(const QStringList &names)
{
    QStringList sorted = names;
    std::sort(sorted.begin(), sorted.end(), codePointLessThan);

    QByteArray input;
    for (const QString &name : sorted) {
        input.append(name.toUtf8());
        input.append('\n');
    }
    return input;
}

Chooser::Result Chooser::choose(const QStringList &names, QString &selection)
{
    m_errorString.clear();
    selection.clear();

    if (m_command.isEmpty()) {
        m_errorString = "failed to spawn menu '': no menu program given";
        return FailedToStart;
    }

    QProcess p;
    p.setProgram(m_command.first());
    p.setArguments(m_command.mid(1));
    p.setProcessChannelMode(QProcess::SeparateChannels);

    qDebug() << "Starting menu" << m_command;
    p.start();

    // Blocks until process has started
    if (!p.waitForStarted(-1)) {
        m_errorString = QString("failed to spawn menu '%1': %2").arg(m_command.join(" "), p.errorString());
        return FailedToStart;
    }

    p.write(inputForNames(names));
    p.closeWriteChannel();

    // The user may take as long as they like
    p.waitForFinished(-1);

    const QByteArray errorOutput = p.readAllStandardError();
    if (!errorOutput.isEmpty()) {
        qDebug() << "Menu wrote to stderr:" << errorOutput;
    }

    if (p.exitStatus() != QProcess::NormalExit || p.exitCode() != 0) {
        qDebug() << "Menu exited with status" << p.exitCode() << "- treating as cancelled";
        return Cancelled;
    }

    const QByteArray output = p.readAllStandardOutput();
    QTextCodec *codec = QTextCodec::codecForName("UTF-8");
    QTextCodec::ConverterState state;
    const QString text = codec->toUnicode(output.constData(), output.size(), &state);
    if (state.invalidChars > 0 || state.remainingChars > 0) {
        m_errorString = QString("output of menu '%1' is not valid UTF-8").arg(m_command.join(" "));
        return UndecodableOutput;
    }

    selection = text.trimmed();
    if (selection.isEmpty()) {
        qDebug() << "Menu returned nothing - treating as cancelled";
        return Cancelled;
    }
    return Selected;
}

QString Chooser::errorString() const
{
    return m_errorString;
}
