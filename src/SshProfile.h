#pragma once

#include <QString>

// -----------------------------
// Authentication method
// -----------------------------
enum class AuthMethod {
    Key,      // public-key file
    Password  // prompted, kept in memory only
};

static inline QString authMethodToString(AuthMethod m)
{
    switch (m) {
        case AuthMethod::Key:      return "key";
        case AuthMethod::Password: return "password";
    }
    return "key";
}

static inline AuthMethod authMethodFromString(const QString &s)
{
    const QString v = s.trimmed().toLower();
    if (v == "password") return AuthMethod::Password;
    return AuthMethod::Key;
}

struct SshProfile {
    // Connection
    QString name;
    QString host;
    int     port = 22;
    QString user;

    // Auth
    AuthMethod auth = AuthMethod::Key;
    QString keyFile;           // empty => ~/.ssh/id_rsa

    // Optional start directories (blank == absent)
    QString remoteStartPath;   // "~" / "~/..." expands to the remote login home
    QString localStartPath;    // "~" / "~/..." expands to the local home

    bool hasRemoteStartPath() const { return !remoteStartPath.trimmed().isEmpty(); }
    bool hasLocalStartPath() const  { return !localStartPath.trimmed().isEmpty(); }
};
