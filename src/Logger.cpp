// Logger.cpp
#include "Logger.h"

#include <QAtomicInt>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QMutexLocker>
#include <QStandardPaths>
#include <QDebug>

#include <cstdio>
#include <cstdlib>

// =====================================================
// Process-wide state
// =====================================================

static QFile*     g_file = nullptr;   // open log file, null => stderr
static QMutex     g_mutex;            // guards g_file and g_path (workers log too)
static QString    g_path;
static QAtomicInt g_level(1);         // 0=Errors only, 1=Normal, 2=Debug

static QtMessageHandler g_previous = nullptr;

// A record logged from inside the handler would recurse.
static thread_local bool g_inHandler = false;

static const char* levelName(QtMsgType t)
{
    switch (t) {
        case QtDebugMsg:    return "DEBUG";
        case QtInfoMsg:     return "INFO";
        case QtWarningMsg:  return "WARN";
        case QtCriticalMsg: return "ERROR";
        case QtFatalMsg:    return "FATAL";
    }
    return "LOG";
}

// 0: WARN and above, 1: INFO and above, 2: everything.
static bool allowMessage(QtMsgType type)
{
    const int lvl = g_level.loadAcquire();
    if (type == QtFatalMsg || type == QtCriticalMsg || type == QtWarningMsg)
        return true;
    if (type == QtInfoMsg)
        return lvl >= 1;
    return lvl >= 2;
}

// One record = one physical line.
static QString oneLine(QString s)
{
    s.replace("\r\n", "\n");
    s.replace('\r', '\n');
    s.replace('\n', ' ');
    s.replace('\t', ' ');
    return s.simplified();
}

static void handler(QtMsgType type, const QMessageLogContext& ctx, const QString& msg)
{
    if (!allowMessage(type) || g_inHandler) {
        if (type == QtFatalMsg) abort();
        return;
    }
    g_inHandler = true;

    const QString ts = QDateTime::currentDateTime().toString("yyyy-MM-dd HH:mm:ss.zzz");

    QString line = QString("%1 [%2] ").arg(ts, QLatin1String(levelName(type)));
    if (ctx.file && ctx.function) {
        line += QString("%1:%2 %3 - ")
                    .arg(QFileInfo(QString::fromUtf8(ctx.file)).fileName())
                    .arg(ctx.line)
                    .arg(QString::fromUtf8(ctx.function));
    }
    line += oneLine(msg);

    const QByteArray utf8 = line.toUtf8();

    {
        QMutexLocker lock(&g_mutex);
        if (g_file && g_file->isOpen()) {
            g_file->write(utf8);
            g_file->write("\n");
            g_file->flush();
        } else {
            std::fprintf(stderr, "%s\n", utf8.constData());
            std::fflush(stderr);
        }
    }

    g_inHandler = false;

    if (type == QtFatalMsg)
        abort();
}

namespace Logger {

void rotateIfNeeded(const QString& path, qint64 maxBytes, int keep)
{
    QFileInfo fi(path);
    if (!fi.exists() || fi.size() < maxBytes)
        return;

    // path.<keep> falls off the end, path.N -> path.N+1, path -> path.1
    QFile::remove(path + "." + QString::number(keep));
    for (int i = keep - 1; i >= 1; --i) {
        const QString older = path + "." + QString::number(i);
        if (QFileInfo::exists(older))
            QFile::rename(older, path + "." + QString::number(i + 1));
    }
    QFile::rename(path, path + ".1");
}

void install(const QString& appName, const QString& filePath)
{
    QString path = QDir::cleanPath(filePath.trimmed());
    if (filePath.trimmed().isEmpty()) {
        const QString dir =
            QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation) + "/logs";
        path = dir + "/" + appName + ".log";
    }

    QDir().mkpath(QFileInfo(path).absolutePath());
    rotateIfNeeded(path);

    {
        QMutexLocker lock(&g_mutex);
        delete g_file;
        g_file = new QFile(path);
        if (!g_file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            std::fprintf(stderr, "Logger: failed to open log file: %s\n", path.toUtf8().constData());
            std::fflush(stderr);
        }
        g_path = path;
    }

    QtMessageHandler prev = qInstallMessageHandler(handler);
    if (prev != handler)
        g_previous = prev;

    qInfo().noquote() << QString("[APP] logger initialized: %1").arg(path);
}

void uninstall()
{
    qInstallMessageHandler(g_previous);
    g_previous = nullptr;

    QMutexLocker lock(&g_mutex);
    delete g_file;
    g_file = nullptr;
}

void setLogLevel(int level)
{
    g_level.storeRelease(qBound(0, level, 2));
}

int logLevel()
{
    return g_level.loadAcquire();
}

QString logFilePath()
{
    QMutexLocker lock(&g_mutex);
    return g_path;
}

} // namespace Logger
