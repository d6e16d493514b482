// Facade: lock -> session -> engine -> close, for every public operation.
#include "smblite/ShareAccessEngine.hpp"
#include "smblite/Log.hpp"
#include "smblite/PathResolver.hpp"
#include <exception>

namespace smblite {

namespace {

// Probed by listShares(); share enumeration is not offered by every server.
const std::vector<std::string> kCommonShares = {
    "Users", "Public", "Documents", "Downloads", "Music", "Pictures",
    "Videos", "Share", "Data", "Files", "Home", "Shared"};

Error protocolError(const std::string& msg, const std::string& detail) {
    return Error::wrap(ErrorKind::Protocol, msg, Error::make(ErrorKind::Protocol, detail));
}

} // namespace

ShareAccessEngine::ShareAccessEngine(SmbClientFactory& clients,
                                     const EngineOptions& opt,
                                     std::shared_ptr<OperationLock> lock)
    : opt_(opt),
      lock_(lock ? std::move(lock) : std::make_shared<OperationLock>()),
      sessions_(clients),
      transfers_(opt_),
      folders_(transfers_),
      renames_(opt_.chunkSize) {}

template <class F>
bool ShareAccessEngine::withSession(const char* operation, const ConnectionProfile& profile,
                                    Error& err, F&& fn) {
    err.clear();
    return lock_->withExclusiveAccess(operation, [&]() -> bool {
        LOGI("%s on %s/%s", operation, profile.server.c_str(), profile.share.c_str());
        std::unique_ptr<Session> session;
        if (!sessions_.open(profile, session, err)) {
            LOGE("%s: %s", operation, err.describe().c_str());
            return false;
        }
        bool ok = false;
        try {
            ok = fn(*session);
        } catch (const std::exception& ex) {
            // Thrown by a caller-supplied callback.
            err.set(ErrorKind::Protocol, std::string(operation) + " aborted by callback: " + ex.what());
        }
        session->close();
        if (ok) LOGD("%s: ok", operation);
        else LOGE("%s: %s", operation, err.describe().c_str());
        return ok;
    });
}

ShareAccessEngine::TrackedToken::TrackedToken(ShareAccessEngine& engine,
                                              std::unordered_set<TokenPtr>& set)
    : engine_(engine), set_(set), token_(std::make_shared<CancellationToken>()) {
    std::lock_guard<std::mutex> lk(engine_.tokensMtx_);
    set_.insert(token_);
}

ShareAccessEngine::TrackedToken::~TrackedToken() {
    std::lock_guard<std::mutex> lk(engine_.tokensMtx_);
    set_.erase(token_);
}

bool ShareAccessEngine::testConnection(const ConnectionProfile& profile, Error& err) {
    return withSession("testConnection", profile, err, [](Session&) { return true; });
}

bool ShareAccessEngine::listFiles(const ConnectionProfile& profile, const std::string& dir,
                                  std::vector<RemoteEntry>& out, Error& err) {
    out.clear();
    return withSession("listFiles", profile, err, [&](Session& s) {
        const std::string rel = path::toShareRelative(dir, s.share());
        std::vector<FileInfo> entries;
        std::string e;
        if (!s.client().list(rel, entries, e)) {
            std::string ce;
            if (!s.client().folderExists(rel, ce) && ce.empty()) {
                err.set(ErrorKind::NotFound, "folder not found: " + rel);
            } else {
                err = protocolError("cannot list " + rel, e);
            }
            return false;
        }
        out.reserve(entries.size());
        for (const auto& fi : entries) {
            if (fi.name == "." || fi.name == "..") continue;
            out.push_back(toRemoteEntry(fi, rel));
        }
        return true;
    });
}

bool ShareAccessEngine::listShares(const ConnectionProfile& profile,
                                   std::vector<std::string>& out, Error& err) {
    err.clear();
    return lock_->withExclusiveAccess("listShares", [&]() -> bool {
        LOGI("listShares on %s", profile.server.c_str());
        if (!sessions_.probeShares(profile, kCommonShares, out, err)) {
            LOGE("listShares: %s", err.describe().c_str());
            return false;
        }
        LOGD("listShares: %zu share(s) found", out.size());
        return true;
    });
}

bool ShareAccessEngine::searchFiles(const ConnectionProfile& profile, const std::string& dir,
                                    const SearchRequest& request,
                                    std::vector<RemoteEntry>& out, Error& err) {
    TrackedToken token(*this, searches_);
    return searchFiles(profile, dir, request, *token, out, err);
}

bool ShareAccessEngine::searchFiles(const ConnectionProfile& profile, const std::string& dir,
                                    const SearchRequest& request,
                                    const CancellationToken& cancel,
                                    std::vector<RemoteEntry>& out, Error& err) {
    out.clear();
    return withSession("searchFiles", profile, err, [&](Session& s) {
        SearchEngine engine;
        engine.search(s.client(), request, path::toShareRelative(dir, s.share()), cancel, out);
        return true;
    });
}

void ShareAccessEngine::cancelSearch() {
    std::lock_guard<std::mutex> lk(tokensMtx_);
    LOGI("cancelling %zu search(es)", searches_.size());
    for (const auto& t : searches_) t->cancel();
}

bool ShareAccessEngine::downloadFile(const ConnectionProfile& profile,
                                     const std::string& remote_path,
                                     const std::string& local_path, Error& err,
                                     const ProgressCB& progress) {
    TrackedToken token(*this, transfersInFlight_);
    return withSession("downloadFile", profile, err, [&](Session& s) {
        return transfers_.download(s, path::toShareRelative(remote_path, s.share()), local_path,
                                   progress, token.get(), err);
    });
}

bool ShareAccessEngine::downloadFolder(const ConnectionProfile& profile,
                                       const std::string& remote_path,
                                       const std::string& local_dir, Error& err,
                                       const FolderProgress& progress) {
    TrackedToken token(*this, transfersInFlight_);
    return withSession("downloadFolder", profile, err, [&](Session& s) {
        return folders_.downloadFolder(s, path::toShareRelative(remote_path, s.share()),
                                       local_dir, progress, token.get(), err);
    });
}

bool ShareAccessEngine::uploadFile(const ConnectionProfile& profile,
                                   const std::string& local_path,
                                   const std::string& remote_path, Error& err,
                                   const ProgressCB& progress) {
    TrackedToken token(*this, transfersInFlight_);
    return withSession("uploadFile", profile, err, [&](Session& s) {
        const std::string rel = path::toShareRelative(remote_path, s.share());
        if (rel.empty()) {
            err.set(ErrorKind::InvalidArgument, "upload target is the share root");
            return false;
        }
        return transfers_.upload(s, local_path, rel, progress, token.get(), err);
    });
}

std::size_t ShareAccessEngine::activeTransfers() const {
    std::lock_guard<std::mutex> lk(tokensMtx_);
    return transfersInFlight_.size();
}

void ShareAccessEngine::cancelTransfers() {
    std::lock_guard<std::mutex> lk(tokensMtx_);
    LOGI("cancelling %zu transfer(s)", transfersInFlight_.size());
    for (const auto& t : transfersInFlight_) t->cancel();
}

bool ShareAccessEngine::deleteFile(const ConnectionProfile& profile, const std::string& target,
                                   Error& err) {
    return withSession("deleteFile", profile, err, [&](Session& s) {
        const std::string rel = path::toShareRelative(target, s.share());
        if (rel.empty()) {
            err.set(ErrorKind::InvalidArgument, "refusing to delete the share root");
            return false;
        }
        std::string e;
        bool isDir = false;
        if (!s.client().exists(rel, isDir, e)) {
            if (!e.empty()) err = protocolError("cannot check " + rel, e);
            else err.set(ErrorKind::NotFound, "not found: " + rel);
            return false;
        }
        const bool removed = isDir ? s.client().removeDirectoryRecursive(rel, e)
                                   : s.client().removeFile(rel, e);
        if (!removed) {
            err = protocolError("cannot delete " + rel, e);
            return false;
        }
        return true;
    });
}

bool ShareAccessEngine::renameFile(const ConnectionProfile& profile, const std::string& old_path,
                                   const std::string& new_name, Error& err) {
    return withSession("renameFile", profile, err, [&](Session& s) {
        return renames_.rename(s.client(), path::toShareRelative(old_path, s.share()),
                               new_name, err);
    });
}

bool ShareAccessEngine::createDirectory(const ConnectionProfile& profile,
                                        const std::string& parent_path,
                                        const std::string& name, Error& err) {
    if (!path::isValidName(name)) {
        err.set(ErrorKind::InvalidArgument, "invalid folder name: '" + name + "'");
        return false;
    }
    return withSession("createDirectory", profile, err, [&](Session& s) {
        const std::string parent = path::toShareRelative(parent_path, s.share());
        const std::string target = path::join(parent, name);
        std::string e;
        bool isDir = false;
        if (s.client().exists(target, isDir, e)) {
            err.set(ErrorKind::AlreadyExists, "already exists: " + target);
            return false;
        }
        if (!e.empty()) {
            err = protocolError("cannot check " + target, e);
            return false;
        }
        if (!parent.empty() && !s.client().folderExists(parent, e)) {
            if (!e.empty()) err = protocolError("cannot check " + parent, e);
            else err.set(ErrorKind::NotFound, "parent folder not found: " + parent);
            return false;
        }
        if (!s.client().makeDirectory(target, e)) {
            err = protocolError("cannot create " + target, e);
            return false;
        }
        return true;
    });
}

bool ShareAccessEngine::fileExists(const ConnectionProfile& profile, const std::string& target,
                                   bool& exists, Error& err) {
    exists = false;
    return withSession("fileExists", profile, err, [&](Session& s) {
        std::string e;
        exists = s.client().fileExists(path::toShareRelative(target, s.share()), e);
        if (!e.empty()) {
            err = protocolError("cannot check " + target, e);
            return false;
        }
        return true;
    });
}

} // namespace smblite
