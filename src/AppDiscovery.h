#ifndef APPDISCOVERY_H
#define APPDISCOVERY_H

#include <QList>
#include <QString>
#include <QStringList>

#include "Application.h"
#include "ApplicationRegistry.h"
#include "Environment.h"

/**
 * @file AppDiscovery.h
 * @class AppDiscovery
 * @brief A class for discovering applications in directories of .desktop files.
 */
class AppDiscovery
{
public:
    /**
     * Retrieve the directories searched when none are given.
     *
     * The system-wide directory comes first so that applications of the user
     * replace system ones of the same name.
     *
     * @param env The environment to take $HOME from.
     * @param ok Set to false if $HOME is not set.
     * @return /usr/share/applications and $HOME/.local/share/applications.
     */
    static QStringList wellKnownApplicationLocations(const Environment &env, bool &ok);

    /**
     * Check whether a path looks like a .desktop file.
     *
     * Any path whose name ends in "desktop" qualifies, with or without a dot,
     * as long as it resolves to a regular file.
     *
     * @param path The path to check.
     * @return The canonical path with symlinks resolved, or an empty string.
     */
    static QString canonicalDesktopFilePath(const QString &path);

    /**
     * List the .desktop files directly inside a directory.
     *
     * @param directory The directory to list; it is not descended into.
     * @param ok Set to false if the directory does not exist or cannot be read.
     * @return Canonical paths, sorted by entry name.
     */
    static QStringList desktopFilesInside(const QString &directory, bool &ok);

    /**
     * Read all applications directly inside a directory.
     *
     * Files that do not describe a visible application are left out silently.
     *
     * @param directory The directory to search.
     * @param ok Set to false if the directory does not exist or cannot be read.
     * @return The applications found.
     */
    static QList<Application> applicationsInside(const QString &directory, bool &ok);

    /**
     * Build the registry from a list of directories.
     *
     * Directories are processed in the order given; an application found in a
     * later directory replaces one of the same name from an earlier directory.
     * Directories that cannot be read contribute nothing.
     *
     * @param directories The directories to search.
     * @return The registry, which is empty if no directory could be read.
     */
    static ApplicationRegistry buildRegistry(const QStringList &directories);
};

#endif // APPDISCOVERY_H
