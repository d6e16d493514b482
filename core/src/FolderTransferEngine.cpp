// Folder download: directories are recreated locally, files go through the
// single-file download path with its own retries.
#include "smblite/FolderTransferEngine.hpp"
#include "smblite/Log.hpp"
#include "smblite/PathResolver.hpp"
#include <filesystem>

namespace smblite {

namespace fs = std::filesystem;

std::uint64_t FolderTransferEngine::countFiles(SmbClient& client, const std::string& remote_dir) {
    std::uint64_t n = 0;
    std::vector<std::string> pending{path::normalize(remote_dir)};
    while (!pending.empty()) {
        const std::string dir = pending.back();
        pending.pop_back();
        std::vector<FileInfo> entries;
        std::string e;
        if (!client.list(dir, entries, e)) {
            LOGW("cannot count files in '%s': %s", dir.c_str(), e.c_str());
            continue;
        }
        for (const auto& fi : entries) {
            if (fi.is_dir) pending.push_back(path::join(dir, fi.name));
            else ++n;
        }
    }
    return n;
}

bool FolderTransferEngine::downloadFolder(Session& session,
                                          const std::string& remote_dir,
                                          const std::string& local_dir,
                                          const FolderProgress& progress,
                                          const CancellationToken* cancel,
                                          Error& err) {
    const std::string remote = path::normalize(remote_dir);
    std::string e;
    if (!session.client().folderExists(remote, e)) {
        if (!e.empty()) {
            err = Error::wrap(ErrorKind::Protocol, "cannot check " + remote,
                              Error::make(ErrorKind::Protocol, e));
        } else {
            err.set(ErrorKind::NotFound, "folder not found: " + remote);
        }
        return false;
    }

    std::error_code ec;
    fs::create_directories(local_dir, ec);
    if (ec) {
        err.set(ErrorKind::LocalIo, "cannot create " + local_dir + ": " + ec.message());
        return false;
    }

    Counter counter;
    counter.total = countFiles(session.client(), remote);
    LOGI("downloading folder %s (%llu files) to %s", remote.c_str(),
         (unsigned long long)counter.total, local_dir.c_str());
    if (!downloadContents(session, remote, local_dir, progress, cancel, counter, err)) {
        LOGE("folder download stopped after %llu of %llu files: %s",
             (unsigned long long)counter.done, (unsigned long long)counter.total,
             err.describe().c_str());
        return false;
    }
    err.clear();
    return true;
}

bool FolderTransferEngine::downloadContents(Session& session, const std::string& remote_dir,
                                            const std::string& local_dir,
                                            const FolderProgress& progress,
                                            const CancellationToken* cancel,
                                            Counter& counter, Error& err) {
    std::vector<FileInfo> entries;
    std::string e;
    if (!session.client().list(remote_dir, entries, e)) {
        err = Error::wrap(ErrorKind::Transfer, "cannot list " + remote_dir,
                          Error::make(ErrorKind::Protocol, e));
        return false;
    }

    for (const auto& fi : entries) {
        if (cancel && cancel->isCancelled()) {
            err.set(ErrorKind::Cancelled, "folder download cancelled");
            return false;
        }
        const std::string remote = path::join(remote_dir, fi.name);
        const std::string local = (fs::path(local_dir) / fi.name).string();

        if (fi.is_dir) {
            std::error_code ec;
            fs::create_directories(local, ec);
            if (ec) {
                err.set(ErrorKind::LocalIo, "cannot create " + local + ": " + ec.message());
                return false;
            }
            if (!downloadContents(session, remote, local, progress, cancel, counter, err))
                return false;
            continue;
        }

        Error fileErr;
        if (!files_.download(session, remote, local, progress.bytes, cancel, fileErr)) {
            if (fileErr.kind == ErrorKind::Cancelled) {
                err = fileErr;
            } else {
                err = Error::wrap(ErrorKind::Transfer, "failed to download " + remote, fileErr);
            }
            return false;
        }
        ++counter.done;
        if (progress.files) progress.files(counter.done, counter.total, fi.name);
    }
    return true;
}

} // namespace smblite
