#pragma once
#include <QString>

// Process-wide Qt message handler writing one line per record to
// <AppLocalDataLocation>/logs/<app>.log (or an explicit file), with
// size-based rotation. Falls back to stderr when the file cannot be opened.
namespace Logger {
    // `filePath` empty => default location.
    void install(const QString& appName, const QString& filePath = QString());

    // Restores the default Qt handler and closes the file.
    void uninstall();

    // 0=Errors only, 1=Normal, 2=Debug
    void setLogLevel(int level);
    int  logLevel();

    QString logFilePath();

    // Rotates `path` to path.1 .. path.<keep> once it reaches maxBytes.
    void rotateIfNeeded(const QString& path, qint64 maxBytes = 2 * 1024 * 1024, int keep = 3);
}
