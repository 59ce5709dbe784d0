#pragma once

#include <QString>
#include <QDateTime>
#include <QVector>
#include <QtGlobal>

// One directory child on either side (local or remote).
//
// Optional fields use Qt's "null" conventions:
//   - hasSize == false      -> size unknown (directories, "..")
//   - modified.isValid()    -> modification time known
//   - permissions.isEmpty() -> no permission string (local entries, "..")
struct FileEntry
{
    QString   name;
    bool      hasSize = false;
    quint64   size    = 0;
    QDateTime modified;
    bool      isDir   = false;
    QString   permissions;   // "rwxr-xr-x" (remote only)

    bool isParent() const { return name == QLatin1String(".."); }

    // Synthetic ".." entry injected at the head of non-root listings.
    static FileEntry parentEntry();
};

// Unix mode bits -> "rwxr-xr-x".
QString formatPermissions(quint32 mode);

// Directories before files, then case-sensitive lexicographic by name.
void sortEntries(QVector<FileEntry> &entries);

// Sorts `children` and prepends ".." unless `atRoot`.
QVector<FileEntry> buildListing(QVector<FileEntry> children, bool atRoot);
