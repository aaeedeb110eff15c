#include "AppDiscovery.h"

#include <QDebug>
#include <QDir>
#include <QFileInfo>

QStringList AppDiscovery::wellKnownApplicationLocations(const Environment &env, bool &ok)
{
    const QString home = env.home(ok);
    if (!ok) {
        return QStringList();
    }

    // Order matters: ~/.local/share/applications overrides /usr/share/applications
    return QStringList({"/usr/share/applications",
                        home + "/.local/share/applications"});
}

QString AppDiscovery::canonicalDesktopFilePath(const QString &path)
{
    if (!path.endsWith("desktop")) {
        return QString();
    }
    // canonicalFilePath() is empty for broken symlinks and missing files
    const QString location = QFileInfo(path).canonicalFilePath();
    if (location.isEmpty() || !QFileInfo(location).isFile()) {
        return QString();
    }
    return location;
}

QStringList AppDiscovery::desktopFilesInside(const QString &directory, bool &ok)
{
    QStringList desktopFiles;

    QFileInfo info(directory);
    if (!info.exists() || !info.isDir() || !info.isReadable()) {
        ok = false;
        return desktopFiles;
    }
    ok = true;

    // Use QDir::entryList() instead of QDirIterator because it supports sorting;
    // sorted entries make duplicate names inside one directory resolve the same way every time
    QDir dir(directory);
    const QStringList entries = dir.entryList(QDir::AllEntries | QDir::Hidden | QDir::System | QDir::NoDotAndDotDot,
                                              QDir::Name);
    for (const QString &entry : entries) {
        const QString location = canonicalDesktopFilePath(dir.filePath(entry));
        if (!location.isEmpty()) {
            desktopFiles.append(location);
        }
    }
    return desktopFiles;
}

QList<Application> AppDiscovery::applicationsInside(const QString &directory, bool &ok)
{
    QList<Application> applications;

    const QStringList candidates = desktopFilesInside(directory, ok);
    if (!ok) {
        return applications;
    }

    for (const QString &candidate : candidates) {
        bool parsed = false;
        const Application application = Application::fromFile(candidate, parsed);
        if (parsed) {
            applications.append(application);
        }
    }
    return applications;
}

ApplicationRegistry AppDiscovery::buildRegistry(const QStringList &directories)
{
    ApplicationRegistry registry;
    for (const QString &directory : directories) {
        bool ok = false;
        const QList<Application> applications = applicationsInside(directory, ok);
        if (!ok) {
            qDebug() << "Cannot read" << directory << "- skipping it";
            continue;
        }
        qDebug() << "Found" << applications.length() << "applications in" << directory;
        registry.insert(applications);
    }
    qDebug() << registry.count() << "applications in total";
    return registry;
}
