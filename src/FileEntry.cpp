#include "FileEntry.h"

#include <algorithm>

FileEntry FileEntry::parentEntry()
{
    FileEntry e;
    e.name  = QStringLiteral("..");
    e.isDir = true;
    return e;
}

QString formatPermissions(quint32 mode)
{
    static const struct { quint32 bit; char ch; } flags[] = {
        {0400, 'r'}, {0200, 'w'}, {0100, 'x'},
        {0040, 'r'}, {0020, 'w'}, {0010, 'x'},
        {0004, 'r'}, {0002, 'w'}, {0001, 'x'},
    };

    QString s;
    s.reserve(9);
    for (const auto &f : flags)
        s.append((mode & f.bit) ? QChar(f.ch) : QChar('-'));
    return s;
}

void sortEntries(QVector<FileEntry> &entries)
{
    std::stable_sort(entries.begin(), entries.end(),
                     [](const FileEntry &a, const FileEntry &b) {
        if (a.isDir != b.isDir) return a.isDir;   // dirs first
        return a.name < b.name;                   // case-sensitive
    });
}

QVector<FileEntry> buildListing(QVector<FileEntry> children, bool atRoot)
{
    // Callers strip "." / ".." from raw listings; be strict anyway so the
    // synthetic parent entry is the only one.
    children.erase(std::remove_if(children.begin(), children.end(),
                                  [](const FileEntry &e) {
                                      return e.name == QLatin1String(".") || e.isParent();
                                  }),
                   children.end());

    sortEntries(children);

    QVector<FileEntry> out;
    out.reserve(children.size() + 1);
    if (!atRoot)
        out.push_back(FileEntry::parentEntry());
    out += children;
    return out;
}
