#include "PanelModel.h"

#include <QDir>
#include <algorithm>

#include "LocalFs.h"

PanelModel::PanelModel(const QString &path)
    : m_path(path)
{
}

const FileEntry *PanelModel::currentEntry() const
{
    if (m_cursor < 0 || m_cursor >= m_entries.size())
        return nullptr;
    return &m_entries[m_cursor];
}

void PanelModel::setCursor(int index)
{
    m_cursor = index;
    clampCursor();
}

void PanelModel::moveUp()
{
    if (m_cursor > 0)
        --m_cursor;
}

void PanelModel::moveDown()
{
    if (m_cursor + 1 < m_entries.size())
        ++m_cursor;
}

void PanelModel::clampCursor()
{
    if (m_entries.isEmpty())
        m_cursor = 0;
    else
        m_cursor = std::clamp(m_cursor, 0, (int)m_entries.size() - 1);
}

// -----------------------------------------------------------------------------
// Marks
// -----------------------------------------------------------------------------
void PanelModel::toggleMark()
{
    const FileEntry *e = currentEntry();
    if (!e || e->isParent())
        return;

    if (m_marked.contains(m_cursor))
        m_marked.remove(m_cursor);
    else
        m_marked.insert(m_cursor);
}

void PanelModel::markAll()
{
    QVector<int> eligible;
    for (int i = 0; i < m_entries.size(); ++i) {
        if (!m_entries[i].isParent())
            eligible.push_back(i);
    }

    const bool allMarked = std::all_of(eligible.begin(), eligible.end(),
                                       [this](int i) { return m_marked.contains(i); });
    if (allMarked) {
        m_marked.clear();
        return;
    }
    for (int i : eligible)
        m_marked.insert(i);
}

void PanelModel::clearMarks()
{
    m_marked.clear();
}

QVector<FileEntry> PanelModel::selectedEntries() const
{
    QVector<FileEntry> out;

    if (m_marked.isEmpty()) {
        const FileEntry *e = currentEntry();
        if (e && !e->isParent())
            out.push_back(*e);
        return out;
    }

    QVector<int> indices(m_marked.begin(), m_marked.end());
    std::sort(indices.begin(), indices.end());
    for (int i : indices) {
        if (i >= 0 && i < m_entries.size() && !m_entries[i].isParent())
            out.push_back(m_entries[i]);
    }
    return out;
}

// -----------------------------------------------------------------------------
// Loading
// -----------------------------------------------------------------------------
bool PanelModel::loadLocal(QString *err)
{
    QVector<FileEntry> children;
    if (!LocalFs::listDir(m_path, &children, err))
        return false;

    m_entries = buildListing(children, LocalFs::isRoot(m_path));
    m_marked.clear();
    clampCursor();
    return true;
}

bool PanelModel::enterSelected(QString *err)
{
    if (err) err->clear();

    const FileEntry *e = currentEntry();
    if (!e || !e->isDir)
        return true;

    const QString previous = m_path;
    const int previousCursor = m_cursor;

    m_path = e->isParent() ? LocalFs::parentDir(m_path)
                           : QDir(m_path).filePath(e->name);
    m_cursor = 0;

    if (!loadLocal(err)) {
        m_path   = previous;
        m_cursor = previousCursor;
        return false;
    }
    return true;
}

bool PanelModel::goUp(QString *err)
{
    if (err) err->clear();
    if (LocalFs::isRoot(m_path))
        return true;

    const QString previous = m_path;
    const int previousCursor = m_cursor;

    m_path   = LocalFs::parentDir(m_path);
    m_cursor = 0;

    if (!loadLocal(err)) {
        m_path   = previous;
        m_cursor = previousCursor;
        return false;
    }
    return true;
}

void PanelModel::loadRemote(const QString &path, const QVector<FileEntry> &entries)
{
    m_path    = path;
    m_entries = entries;
    m_cursor  = 0;
    m_marked.clear();
}

void PanelModel::reset(const QString &path)
{
    m_path = path;
    m_entries.clear();
    m_cursor = 0;
    m_marked.clear();
}
