// Settings live under QSettings("smblite", "smblite"); profiles in the "profiles" array.
#include "CliSettings.hpp"
#include <QSettings>
#include <algorithm>

namespace CliSettings {

smblite::EngineOptions loadEngineOptions() {
    smblite::EngineOptions opt;
    QSettings s("smblite", "smblite");
    opt.maxAttempts = s.value("Transfer/maxAttempts", opt.maxAttempts).toInt();
    if (opt.maxAttempts < 1) opt.maxAttempts = 1;
    opt.backoffBaseMs = s.value("Transfer/backoffMs", opt.backoffBaseMs).toInt();
    if (opt.backoffBaseMs < 0) opt.backoffBaseMs = 0;
    const qulonglong chunk = s.value("Transfer/chunkSize", (qulonglong)opt.chunkSize).toULongLong();
    opt.chunkSize = chunk >= 4096 ? (std::size_t)chunk : 4096;
    // From the command line the source is a user file, not a staging copy.
    opt.deleteUploadedSource = s.value("Transfer/deleteUploadedSource", false).toBool();
    opt.timeoutSeconds = s.value("Network/timeoutSeconds", opt.timeoutSeconds).toInt();
    return opt;
}

QVector<SavedProfile> loadProfiles() {
    QVector<SavedProfile> out;
    QSettings s("smblite", "smblite");
    int n = s.beginReadArray("profiles");
    for (int i = 0; i < n; ++i) {
        s.setArrayIndex(i);
        SavedProfile e;
        e.name = s.value("name").toString();
        e.profile.server = s.value("server").toString().toStdString();
        e.profile.share = s.value("share").toString().toStdString();
        e.profile.username = s.value("user").toString().toStdString();
        e.profile.domain = s.value("domain").toString().toStdString();
        out.push_back(e);
    }
    s.endArray();
    return out;
}

bool findProfile(const QString& name, SavedProfile& out) {
    for (const auto& e : loadProfiles()) {
        if (e.name == name) {
            out = e;
            return true;
        }
    }
    return false;
}

static void writeProfiles(const QVector<SavedProfile>& profiles) {
    QSettings s("smblite", "smblite");
    // Clear previous array to avoid stale entries after deletions
    s.remove("profiles");
    s.beginWriteArray("profiles");
    for (int i = 0; i < profiles.size(); ++i) {
        s.setArrayIndex(i);
        const auto& e = profiles[i];
        s.setValue("name", e.name);
        s.setValue("server", QString::fromStdString(e.profile.server));
        s.setValue("share", QString::fromStdString(e.profile.share));
        s.setValue("user", QString::fromStdString(e.profile.username));
        s.setValue("domain", QString::fromStdString(e.profile.domain));
    }
    s.endArray();
    s.sync();
}

void saveProfile(const SavedProfile& entry) {
    QVector<SavedProfile> profiles = loadProfiles();
    bool replaced = false;
    for (auto& e : profiles) {
        if (e.name == entry.name) {
            e = entry;
            replaced = true;
        }
    }
    if (!replaced) profiles.push_back(entry);
    writeProfiles(profiles);
}

bool removeProfile(const QString& name) {
    QVector<SavedProfile> profiles = loadProfiles();
    const int before = profiles.size();
    profiles.erase(std::remove_if(profiles.begin(), profiles.end(),
                                  [&](const SavedProfile& e) { return e.name == name; }),
                   profiles.end());
    if (profiles.size() == before) return false;
    writeProfiles(profiles);
    return true;
}

} // namespace CliSettings
