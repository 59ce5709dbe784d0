/*
 * twinpane - dual-pane SFTP file manager
 *
 * Copyright (c) 2025 The twinpane authors
 *
 * Licensed under the Apache License, Version 2.0
 * http://www.apache.org/licenses/LICENSE-2.0
 */

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QTimer>

#include <sodium.h>

#include "AppConfig.h"
#include "AppState.h"
#include "ConsoleFrontend.h"
#include "LibsshSftpChannel.h"
#include "Logger.h"
#include "ProfileStore.h"

// main.cpp
// --------
// Application entry point.
//
// Responsibilities:
// - Set QCoreApplication metadata (org/app name/version) for QSettings and paths
// - Parse the command line (profiles file, log level, auto-connect profile)
// - Install logging before anything else logs
// - Load profiles (first run falls back to a Localhost profile)
// - Build AppState with the libssh channel factory and run the console front-end
//
// Notes:
// - Transfer workers still running at quit are abandoned; the process does not
//   wait for them.
int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    // Stable names: ~/.config/twinpane/twinpane/, ~/.local/share/twinpane/twinpane/
    QCoreApplication::setOrganizationName("twinpane");
    QCoreApplication::setApplicationName("twinpane");
    QCoreApplication::setApplicationVersion("0.1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Dual-pane local/SFTP file manager");
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption profilesOpt(
        "profiles", "Read connection profiles from <file> instead of the default location.", "file");
    const QCommandLineOption logLevelOpt(
        "log-level", "0 = errors only, 1 = normal, 2 = debug.", "level");
    const QCommandLineOption connectOpt(
        "profile", "Connect to the named profile at startup.", "name");

    parser.addOption(profilesOpt);
    parser.addOption(logLevelOpt);
    parser.addOption(connectOpt);
    parser.process(app);

    AppConfig config = AppConfig::load();
    if (parser.isSet(logLevelOpt)) {
        bool ok = false;
        const int lvl = parser.value(logLevelOpt).toInt(&ok);
        if (ok) config.logLevel = lvl;
    }

    Logger::install("twinpane", config.logFilePath);
    Logger::setLogLevel(config.logLevel);

    if (sodium_init() < 0) {
        qCritical().noquote() << "[APP] libsodium initialization failed";
        return 1;
    }

    if (parser.isSet(profilesOpt))
        ProfileStore::setConfigPathOverride(parser.value(profilesOpt));

    QString perr;
    QVector<SshProfile> profiles = ProfileStore::load(&perr);
    if (!perr.isEmpty())
        qWarning().noquote() << "[APP]" << perr;
    if (profiles.isEmpty()) {
        qInfo().noquote() << "[APP] no profiles found, using defaults";
        profiles = ProfileStore::defaults();
    }

    AppState state(&LibsshSftpChannel::open, config, QDir::currentPath());

    ConsoleFrontend frontend(&state, profiles);

    // Start (and optionally connect) once the event loop runs.
    const QString autoProfile = parser.value(connectOpt);
    QTimer::singleShot(0, &frontend, [&frontend, autoProfile]() {
        frontend.start(autoProfile.isEmpty() ? QString()
                                             : QString("connect \"%1\"").arg(autoProfile));
    });

    const int rc = app.exec();

    qInfo().noquote() << "[APP] exit code" << rc;
    Logger::uninstall();
    return rc;
}
