#include "RemotePath.h"

// -----------------------------------------------------------------------------
// stripTrailingSlash()
// -----------------------------------------------------------------------------
// "/a/b/" -> "/a/b", but "/" stays "/".
// -----------------------------------------------------------------------------
static QString stripTrailingSlash(QString s)
{
    while (s.size() > 1 && s.endsWith('/'))
        s.chop(1);
    return s;
}

QString remoteJoin(const QString &base, const QString &rel)
{
    if (base.isEmpty()) return rel;
    if (rel.isEmpty()) return base;
    if (base.endsWith('/')) return base + rel;
    return base + "/" + rel;
}

QString remoteParent(const QString &path)
{
    const QString s = stripTrailingSlash(path.trimmed());
    if (s.isEmpty() || s == "/") return s;

    const int idx = s.lastIndexOf('/');
    if (idx < 0) return QStringLiteral(".");
    if (idx == 0) return QStringLiteral("/");
    return s.left(idx);
}

QString remoteFileName(const QString &path)
{
    const QString s = stripTrailingSlash(path.trimmed());
    if (s == "/") return QString();
    const int idx = s.lastIndexOf('/');
    return idx < 0 ? s : s.mid(idx + 1);
}

bool isRemoteRoot(const QString &path)
{
    return stripTrailingSlash(path.trimmed()) == "/";
}

QString expandRemoteTilde(const QString &raw, const QString &home)
{
    if (raw == "~")
        return home;
    if (raw.startsWith("~/"))
        return stripTrailingSlash(home) == "/" ? raw.mid(1) : stripTrailingSlash(home) + raw.mid(1);
    return raw;
}
