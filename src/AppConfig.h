#pragma once

#include <QString>

// Values read from QSettings at startup (organization/application set in main).
//
//   logging/level          0=Errors only, 1=Normal, 2=Debug
//   logging/filePath       absolute log file path override (empty = default)
//   ssh/connectTimeoutSec  live foreground session
//   ssh/transferTimeoutSec fresh sessions of transfer workers and edit upload
//   edit/editor            editor command (empty = auto-detect)
struct AppConfig
{
    int     logLevel           = 1;
    QString logFilePath;
    int     connectTimeoutSec  = 10;
    int     transferTimeoutSec = 30;
    QString editor;

    static AppConfig load();
};
