#include "AppConfig.h"

#include <QSettings>
#include <QtGlobal>

AppConfig AppConfig::load()
{
    QSettings s;
    AppConfig c;

    c.logLevel           = qBound(0, s.value("logging/level", 1).toInt(), 2);
    c.logFilePath        = s.value("logging/filePath", "").toString().trimmed();
    c.connectTimeoutSec  = qMax(1, s.value("ssh/connectTimeoutSec", 10).toInt());
    c.transferTimeoutSec = qMax(1, s.value("ssh/transferTimeoutSec", 30).toInt());
    c.editor             = s.value("edit/editor", "").toString().trimmed();

    return c;
}
