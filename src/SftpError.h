#pragma once

#include <QString>

// SftpError
//
// Error category + human-readable cause for session, transfer and mutation
// failures. Every failure ends up as a short status line via toString().
struct SftpError
{
    enum class Kind {
        None,
        Transport,       // TCP connect / SSH handshake
        Authentication,  // credentials rejected or session not authenticated
        KeyNotFound,     // configured key file missing
        RemotePath,      // listing/stat/mutation/transfer failure on the server
        LocalIO          // local filesystem failure
    };

    Kind    kind = Kind::None;
    QString message;

    bool isError() const { return kind != Kind::None; }

    void clear()
    {
        kind = Kind::None;
        message.clear();
    }

    static SftpError transport(const QString &msg)      { return {Kind::Transport, msg}; }
    static SftpError authentication(const QString &msg) { return {Kind::Authentication, msg}; }
    static SftpError keyNotFound(const QString &path)   { return {Kind::KeyNotFound, path}; }
    static SftpError remotePath(const QString &msg)     { return {Kind::RemotePath, msg}; }
    static SftpError localIo(const QString &msg)        { return {Kind::LocalIO, msg}; }

    QString toString() const
    {
        switch (kind) {
            case Kind::None:           return QString();
            case Kind::Transport:      return QStringLiteral("Connection failed: %1").arg(message);
            case Kind::Authentication:
                return message.isEmpty() ? QStringLiteral("Authentication failed")
                                         : QStringLiteral("Authentication failed: %1").arg(message);
            case Kind::KeyNotFound:    return QStringLiteral("Key file not found: %1").arg(message);
            case Kind::RemotePath:     return QStringLiteral("Remote path error: %1").arg(message);
            case Kind::LocalIO:        return QStringLiteral("Local I/O error: %1").arg(message);
        }
        return message;
    }
};

// Small helper matching the QString* err convention used everywhere else.
static inline void setError(SftpError *err, const SftpError &e)
{
    if (err) *err = e;
}
