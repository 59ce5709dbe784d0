#pragma once

#include <QString>

// POSIX-style path helpers for remote paths.
// Remote paths always use '/', regardless of the client platform.

QString remoteJoin(const QString &base, const QString &rel);

// Parent of `path`; "/" stays "/". A relative single component yields ".".
QString remoteParent(const QString &path);

// Last path component ("" for "/").
QString remoteFileName(const QString &path);

bool isRemoteRoot(const QString &path);

// Expands a leading "~" or "~/" using `home`; anything else is returned as-is.
QString expandRemoteTilde(const QString &raw, const QString &home);
