// Persistent CLI settings (QSettings): engine tuning and saved connection profiles.
#pragma once
#include "smblite/SmbTypes.hpp"
#include <QString>
#include <QVector>

struct SavedProfile {
    QString name;
    smblite::ConnectionProfile profile; // password is never stored
};

namespace CliSettings {

// Transfer/* and Network/* keys over EngineOptions defaults.
smblite::EngineOptions loadEngineOptions();

QVector<SavedProfile> loadProfiles();
bool findProfile(const QString& name, SavedProfile& out);
// Adds or replaces the entry with the same name.
void saveProfile(const SavedProfile& entry);
bool removeProfile(const QString& name);

} // namespace CliSettings
