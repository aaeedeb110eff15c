#ifndef DESKTOPFILE_H
#define DESKTOPFILE_H

#include <QHash>
#include <QString>

/**
 * @file DesktopFile.h
 * @class DesktopFile
 * @brief Reader for the group/key/value text format used by .desktop files.
 *
 * Only the structure is checked, not the meaning of any key. Values are stored
 * verbatim after trimming; escape sequences and localized keys get no special
 * treatment.
 */
class DesktopFile
{
public:
    DesktopFile();

    /**
     * Read and parse a file.
     *
     * @param path The path to the file.
     * @return True if the file could be read and is well-formed, false otherwise.
     *         On failure the object holds no groups.
     */
    bool load(const QString &path);

    /**
     * Parse already decoded text.
     *
     * @param text The contents of a file.
     * @return True if the text is well-formed, false otherwise.
     */
    bool parse(const QString &text);

    /**
     * Check whether a key is present in a group.
     */
    bool contains(const QString &group, const QString &key) const;

    /**
     * Get the value of a key in a group.
     *
     * @param ok Set to false if the group or the key is absent.
     * @return The value, or an empty string.
     */
    QString value(const QString &group, const QString &key, bool &ok) const;

    QString errorString() const;

private:
    QHash<QString, QHash<QString, QString>> m_groups;
    QString m_errorString;
};

#endif // DESKTOPFILE_H
