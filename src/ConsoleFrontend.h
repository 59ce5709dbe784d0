// ConsoleFrontend.h
//
// Purpose:
//   Line-oriented front-end for AppState:
//     - reads one command per line from stdin (QSocketNotifier)
//     - 100 ms tick samples transfer progress and prints status changes
//     - runs the external editor for "edit"
//
//   Rendering is plain text; there is no full-screen UI.

#pragma once

#include <QFile>
#include <QObject>
#include <QString>
#include <QStringList>
#include <QTextStream>
#include <QTimer>
#include <QVector>

#include "AppState.h"
#include "SshProfile.h"

class QSocketNotifier;

class ConsoleFrontend : public QObject
{
    Q_OBJECT
public:
    ConsoleFrontend(AppState *state, QVector<SshProfile> profiles, QObject *parent = nullptr);
    ~ConsoleFrontend() override;

    // `initialCommand` (e.g. "connect prod") runs before the first prompt.
    void start(const QString &initialCommand = QString());

    // Executes one command line. Returns false for "quit".
    bool handleLine(const QString &line);

private slots:
    void onStdinReady();
    void onTick();

private:
    enum class Pending {
        None,
        Password,
        DeleteConfirm
    };

    void printHelp();
    void printProfiles();
    void printPanel();
    void printLayout();
    void printProgress(const char *label, const ProgressHandle &h);
    void reportStatus();
    void prompt();

    bool selectByName(const QString &name);
    void connectTo(const QString &which);
    void profileCommand(const QStringList &args);
    void editSelected();
    void setEcho(bool on);
    void quit();

    AppState           *m_state = nullptr;
    QVector<SshProfile> m_profiles;

    QFile            m_stdin;
    QSocketNotifier *m_notifier = nullptr;
    QTimer           m_tick;
    QTextStream      m_out;

    Pending m_pending = Pending::None;
    QString m_lastStatus;
    QString m_lastUploadLine;
    QString m_lastDownloadLine;
};
