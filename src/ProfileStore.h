#pragma once

#include <QString>
#include <QVector>

#include "SshProfile.h"

/*
    ProfileStore
    ------------
    Static utility class persisting connection profiles as JSON.

    Schema:
        {
          "profiles": [
            { "name": "...", "host": "...", "port": 22, "user": "...",
              "auth": "key" | "password",
              "key_file": "...",        // optional
              "remote_path": "...",     // optional start directory
              "local_path": "..." }     // optional start directory
          ]
        }

    Passwords are never written.
*/
class ProfileStore
{
public:
    /*
        Absolute path of profiles.json.

        Default: <AppConfigLocation>/profiles.json. A non-empty override
        (command line --profiles, tests) replaces it.
    */
    static QString configPath();
    static void setConfigPathOverride(const QString& path);

    // One "Localhost" profile for first run.
    static QVector<SshProfile> defaults();

    /*
        Overwrites profiles.json (truncate + write), creating its directory.
        Blank start paths and key files are left out.
    */
    static bool save(const QVector<SshProfile>& profiles, QString* err = nullptr);

    /*
        Behavior:
        - file missing      -> empty list, err cleared (not an error)
        - invalid JSON      -> empty list, err set
        - no host or user   -> entry skipped
        - unknown "auth"    -> key
        - missing name      -> "user@host"
    */
    static QVector<SshProfile> load(QString* err = nullptr);

    /*
        Edits below work on a copy, save it, and only replace `profiles` when
        the file was written. Names are unique.
    */

    // Adds `p`, or replaces the profile with the same name.
    static bool upsert(QVector<SshProfile>& profiles, const SshProfile& p, QString* err = nullptr);

    static bool remove(QVector<SshProfile>& profiles, const QString& name, QString* err = nullptr);

    // "user@host" or "user@host:port".
    static bool parseDestination(const QString& dest, SshProfile* p, QString* err = nullptr);

    /*
        Sets one field by name: host, port, user, auth, key, remote, local.
        An empty value clears key/remote/local.
    */
    static bool setField(SshProfile* p, const QString& field, const QString& value, QString* err = nullptr);

    // Exact name match; nullptr if absent.
    static const SshProfile* findByName(const QVector<SshProfile>& profiles, const QString& name);
};
