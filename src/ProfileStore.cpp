// ProfileStore.cpp
//
// Persistence boundary for connection profiles: locate profiles.json and
// convert profiles to and from JSON. No UI, no network.

#include "ProfileStore.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <QStandardPaths>

static QString g_pathOverride;

static QJsonObject profileToJson(const SshProfile& p)
{
    QJsonObject o;
    o["name"] = p.name;
    o["host"] = p.host;
    o["port"] = p.port;
    o["user"] = p.user;
    o["auth"] = authMethodToString(p.auth);

    if (!p.keyFile.trimmed().isEmpty())
        o["key_file"] = p.keyFile.trimmed();
    if (p.hasRemoteStartPath())
        o["remote_path"] = p.remoteStartPath.trimmed();
    if (p.hasLocalStartPath())
        o["local_path"] = p.localStartPath.trimmed();

    return o;
}

static SshProfile profileFromJson(const QJsonObject& o)
{
    SshProfile p;
    p.name = o.value("name").toString().trimmed();
    p.host = o.value("host").toString().trimmed();
    p.port = o.value("port").toInt(22);
    p.user = o.value("user").toString().trimmed();
    p.auth = authMethodFromString(o.value("auth").toString());

    p.keyFile         = o.value("key_file").toString().trimmed();
    p.remoteStartPath = o.value("remote_path").toString().trimmed();
    p.localStartPath  = o.value("local_path").toString().trimmed();

    if (p.port <= 0 || p.port > 65535)
        p.port = 22;

    return p;
}

QString ProfileStore::configPath()
{
    if (!g_pathOverride.isEmpty())
        return g_pathOverride;

    return QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation)
           + "/profiles.json";
}

void ProfileStore::setConfigPathOverride(const QString& path)
{
    g_pathOverride = path.trimmed().isEmpty() ? QString() : QDir::cleanPath(path.trimmed());
}

QVector<SshProfile> ProfileStore::defaults()
{
    SshProfile p;
    p.name = "Localhost";
    p.host = "localhost";
    p.port = 22;
    p.user = qEnvironmentVariable("USER", "user");
    p.auth = AuthMethod::Key;

    return {p};
}

bool ProfileStore::save(const QVector<SshProfile>& profiles, QString* err)
{
    QJsonArray arr;
    for (const SshProfile& p : profiles)
        arr.append(profileToJson(p));

    QJsonObject root;
    root["profiles"] = arr;

    const QString path = configPath();
    QDir().mkpath(QFileInfo(path).absolutePath());

    QFile f(path);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        if (err) *err = QString("Could not write %1: %2").arg(path, f.errorString());
        qWarning().noquote() << "[PROFILES]" << (err ? *err : QString());
        return false;
    }

    f.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    f.close();

    qInfo().noquote() << QString("[PROFILES] saved %1 profile(s) to %2").arg(profiles.size()).arg(path);

    if (err) err->clear();
    return true;
}

QVector<SshProfile> ProfileStore::load(QString* err)
{
    QVector<SshProfile> out;
    const QString path = configPath();

    QFile f(path);
    if (!f.exists()) {
        if (err) err->clear();
        return out;
    }

    if (!f.open(QIODevice::ReadOnly)) {
        if (err) *err = QString("Could not open %1: %2").arg(path, f.errorString());
        return out;
    }

    const QByteArray data = f.readAll();
    f.close();

    QJsonParseError perr;
    const QJsonDocument doc = QJsonDocument::fromJson(data, &perr);
    if (perr.error != QJsonParseError::NoError || !doc.isObject()) {
        if (err) *err = QString("Invalid JSON in %1: %2").arg(path, perr.errorString());
        qWarning().noquote() << "[PROFILES]" << (err ? *err : QString());
        return out;
    }

    const QJsonArray arr = doc.object().value("profiles").toArray();
    for (const QJsonValue& v : arr) {
        if (!v.isObject())
            continue;

        SshProfile p = profileFromJson(v.toObject());

        // Skip incomplete profiles
        if (p.host.isEmpty() || p.user.isEmpty())
            continue;

        if (p.name.isEmpty())
            p.name = QString("%1@%2").arg(p.user, p.host);

        out.push_back(p);
    }

    if (err) err->clear();
    return out;
}

const SshProfile* ProfileStore::findByName(const QVector<SshProfile>& profiles, const QString& name)
{
    for (const SshProfile& p : profiles) {
        if (p.name == name)
            return &p;
    }
    return nullptr;
}

static bool validate(const SshProfile& p, QString* err)
{
    if (p.name.trimmed().isEmpty()) {
        if (err) *err = "Profile name is empty";
        return false;
    }
    if (p.host.trimmed().isEmpty() || p.user.trimmed().isEmpty()) {
        if (err) *err = QString("Profile '%1' needs a host and a user").arg(p.name);
        return false;
    }
    return true;
}

bool ProfileStore::upsert(QVector<SshProfile>& profiles, const SshProfile& p, QString* err)
{
    if (!validate(p, err))
        return false;

    QVector<SshProfile> next = profiles;
    bool replaced = false;
    for (SshProfile& existing : next) {
        if (existing.name == p.name) {
            existing = p;
            replaced = true;
            break;
        }
    }
    if (!replaced)
        next.push_back(p);

    if (!save(next, err))
        return false;

    profiles = next;
    qInfo().noquote() << QString("[PROFILES] %1 '%2'").arg(replaced ? "updated" : "added", p.name);
    return true;
}

bool ProfileStore::remove(QVector<SshProfile>& profiles, const QString& name, QString* err)
{
    QVector<SshProfile> next = profiles;
    for (int i = 0; i < next.size(); ++i) {
        if (next[i].name != name)
            continue;

        next.removeAt(i);
        if (!save(next, err))
            return false;

        profiles = next;
        qInfo().noquote() << QString("[PROFILES] removed '%1'").arg(name);
        return true;
    }

    if (err) *err = QString("No profile '%1'").arg(name);
    return false;
}

bool ProfileStore::parseDestination(const QString& dest, SshProfile* p, QString* err)
{
    const QString d = dest.trimmed();
    const int at = d.indexOf('@');
    if (at <= 0 || at == d.size() - 1) {
        if (err) *err = QString("Expected user@host[:port], got '%1'").arg(dest);
        return false;
    }

    QString host = d.mid(at + 1);
    int port = 22;

    const int colon = host.lastIndexOf(':');
    if (colon >= 0) {
        bool ok = false;
        port = host.mid(colon + 1).toInt(&ok);
        if (!ok || port <= 0 || port > 65535) {
            if (err) *err = QString("Invalid port in '%1'").arg(dest);
            return false;
        }
        host = host.left(colon);
    }
    if (host.isEmpty()) {
        if (err) *err = QString("Expected user@host[:port], got '%1'").arg(dest);
        return false;
    }

    if (p) {
        p->user = d.left(at);
        p->host = host;
        p->port = port;
    }
    return true;
}

bool ProfileStore::setField(SshProfile* p, const QString& field, const QString& value, QString* err)
{
    if (!p)
        return false;

    const QString f = field.trimmed().toLower();
    const QString v = value.trimmed();

    if (f == "host" || f == "user") {
        if (v.isEmpty()) {
            if (err) *err = QString("'%1' cannot be empty").arg(f);
            return false;
        }
        if (f == "host") p->host = v;
        else             p->user = v;
    } else if (f == "port") {
        bool ok = false;
        const int port = v.toInt(&ok);
        if (!ok || port <= 0 || port > 65535) {
            if (err) *err = QString("Invalid port '%1'").arg(value);
            return false;
        }
        p->port = port;
    } else if (f == "auth") {
        if (v.toLower() != "key" && v.toLower() != "password") {
            if (err) *err = QString("auth must be 'key' or 'password'");
            return false;
        }
        p->auth = authMethodFromString(v);
    } else if (f == "key") {
        p->keyFile = v;
    } else if (f == "remote") {
        p->remoteStartPath = v;
    } else if (f == "local") {
        p->localStartPath = v;
    } else {
        if (err) *err = QString("Unknown field '%1'").arg(field);
        return false;
    }

    if (err) err->clear();
    return true;
}
