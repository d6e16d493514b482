// Download/upload with linear backoff. A failed download keeps the partial local
// file it wrote, and the next attempt appends to it after skipping that many
// remote bytes. A local file this call never opened is never resumed.
#include "smblite/TransferEngine.hpp"
#include "smblite/Log.hpp"
#include "smblite/PathResolver.hpp"
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <thread>
#include <vector>

namespace smblite {

namespace {

namespace fs = std::filesystem;

// Owns a stdio handle; close() reports flush errors, the destructor only cleans up.
class LocalFile {
public:
    LocalFile(const std::string& p, const char* mode) : f_(std::fopen(p.c_str(), mode)) {}
    ~LocalFile() { if (f_) std::fclose(f_); }
    LocalFile(const LocalFile&) = delete;
    LocalFile& operator=(const LocalFile&) = delete;

    explicit operator bool() const { return f_ != nullptr; }
    FILE* get() const { return f_; }

    std::uint64_t length() {
        if (std::fseek(f_, 0, SEEK_END) != 0) return 0;
        long cur = std::ftell(f_);
        return cur > 0 ? (std::uint64_t)cur : 0;
    }

    bool close() {
        if (!f_) return true;
        int rc = std::fclose(f_);
        f_ = nullptr;
        return rc == 0;
    }

private:
    FILE* f_ = nullptr;
};

} // namespace

bool TransferEngine::backoff(int attempt, const CancellationToken* cancel) const {
    const std::chrono::milliseconds delay(static_cast<long long>(opt_.backoffBaseMs) * attempt);
    if (cancel) {
        if (cancel->isCancelled()) return false;
        return !cancel->waitFor(delay);
    }
    if (delay.count() > 0) std::this_thread::sleep_for(delay);
    return true;
}

bool TransferEngine::ensureConnected(Session& session, Error& err) const {
    if (session.client().isConnected()) return true;
    return session.reopen(err);
}

bool TransferEngine::download(Session& session,
                              const std::string& remote_path,
                              const std::string& local_path,
                              const ProgressCB& progress,
                              const CancellationToken* cancel,
                              Error& err) {
    std::string e;
    bool isDir = false;
    if (!session.client().exists(remote_path, isDir, e) || isDir) {
        if (!e.empty()) {
            err = Error::wrap(ErrorKind::Protocol, "cannot check " + remote_path,
                              Error::make(ErrorKind::Protocol, e));
        } else {
            err.set(ErrorKind::NotFound, "file not found: " + remote_path);
        }
        LOGE("%s", err.describe().c_str());
        return false;
    }

    Error last;
    bool partialWritten = false;
    const int maxAttempts = opt_.maxAttempts > 0 ? opt_.maxAttempts : 1;
    for (int attempt = 1; attempt <= maxAttempts; ++attempt) {
        if (attempt > 1) {
            LOGI("retrying download of %s (attempt %d of %d)", remote_path.c_str(), attempt, maxAttempts);
        }
        Error attemptErr;
        bool ok = (attempt == 1 || ensureConnected(session, attemptErr)) &&
                  downloadAttempt(session.client(), remote_path, local_path, partialWritten,
                                  progress, attemptErr);
        if (ok) {
            LOGI("downloaded %s to %s", remote_path.c_str(), local_path.c_str());
            err.clear();
            return true;
        }
        LOGE("download of %s failed (attempt %d): %s", remote_path.c_str(), attempt,
             attemptErr.describe().c_str());
        last = attemptErr;
        if (attempt < maxAttempts && !backoff(attempt, cancel)) {
            err = Error::wrap(ErrorKind::Cancelled, "download cancelled: " + remote_path, last);
            return false;
        }
    }
    err = Error::wrap(ErrorKind::Transfer,
                      "download of " + remote_path + " failed after " +
                          std::to_string(maxAttempts) + " attempts",
                      last);
    return false;
}

bool TransferEngine::downloadAttempt(SmbClient& client, const std::string& remote_path,
                                     const std::string& local_path, bool& partialWritten,
                                     const ProgressCB& progress, Error& err) {
    std::string e;
    std::unique_ptr<RemoteFile> rf;
    if (!client.open(remote_path, OpenMode::Read, rf, e)) {
        err = Error::wrap(ErrorKind::Protocol, "cannot open " + remote_path + " for reading",
                          Error::make(ErrorKind::Protocol, e));
        return false;
    }
    const std::uint64_t total = rf->size();
    const std::string item = path::baseName(remote_path);

    // Retries continue from what an earlier attempt of this download left on disk.
    std::unique_ptr<LocalFile> lf;
    std::uint64_t offset = 0;
    if (partialWritten && fs::exists(local_path)) {
        lf = std::make_unique<LocalFile>(local_path, "ab");
        if (*lf) offset = lf->length();
        if (!*lf || offset > total) {
            // Partial file does not fit the remote file; start over.
            lf.reset();
            offset = 0;
        } else if (offset > 0) {
            LOGI("resuming %s at byte %llu", remote_path.c_str(), (unsigned long long)offset);
            if (!rf->skip(offset, e)) {
                err = Error::wrap(ErrorKind::Protocol, "cannot seek " + remote_path,
                                  Error::make(ErrorKind::Protocol, e));
                return false;
            }
        }
    }
    if (!lf) lf = std::make_unique<LocalFile>(local_path, "wb");
    if (!*lf) {
        err.set(ErrorKind::LocalIo, "cannot open local file for writing: " + local_path);
        return false;
    }
    partialWritten = true;

    std::vector<char> buf(opt_.chunkSize ? opt_.chunkSize : 64 * 1024);
    std::uint64_t done = offset;
    if (progress && offset > 0) progress(done, total, item);
    while (true) {
        long long n = rf->read(buf.data(), buf.size(), e);
        if (n > 0) {
            if (std::fwrite(buf.data(), 1, (std::size_t)n, lf->get()) != (std::size_t)n) {
                err.set(ErrorKind::LocalIo, "local write failed: " + local_path);
                return false;
            }
            done += (std::uint64_t)n;
            if (progress) progress(done, total, item);
        } else if (n == 0) {
            break; // EOF
        } else {
            err = Error::wrap(ErrorKind::Protocol, "remote read failed for " + remote_path,
                              Error::make(ErrorKind::Protocol, e));
            return false;
        }
    }
    if (!lf->close()) {
        err.set(ErrorKind::LocalIo, "local flush failed: " + local_path);
        return false;
    }
    if (done < total) {
        err.set(ErrorKind::Protocol, "remote stream ended early: " + std::to_string(done) +
                                         " of " + std::to_string(total) + " bytes");
        return false;
    }
    return true;
}

bool TransferEngine::upload(Session& session,
                            const std::string& local_path,
                            const std::string& remote_path,
                            const ProgressCB& progress,
                            const CancellationToken* cancel,
                            Error& err) {
    std::error_code ec;
    if (!fs::is_regular_file(local_path, ec)) {
        err.set(ErrorKind::NotFound, "local file not found: " + local_path);
        LOGE("%s", err.message.c_str());
        return false;
    }

    Error last;
    const int maxAttempts = opt_.maxAttempts > 0 ? opt_.maxAttempts : 1;
    for (int attempt = 1; attempt <= maxAttempts; ++attempt) {
        if (attempt > 1) {
            LOGI("retrying upload of %s (attempt %d of %d)", local_path.c_str(), attempt, maxAttempts);
        }
        Error attemptErr;
        bool ok = (attempt == 1 || ensureConnected(session, attemptErr)) &&
                  uploadAttempt(session.client(), local_path, remote_path, progress, attemptErr);
        if (ok) {
            LOGI("uploaded %s to %s", local_path.c_str(), remote_path.c_str());
            if (opt_.deleteUploadedSource && !fs::remove(local_path, ec)) {
                LOGW("could not delete uploaded source %s: %s", local_path.c_str(), ec.message().c_str());
            }
            err.clear();
            return true;
        }
        LOGE("upload of %s failed (attempt %d): %s", local_path.c_str(), attempt,
             attemptErr.describe().c_str());
        last = attemptErr;
        if (attempt < maxAttempts && !backoff(attempt, cancel)) {
            err = Error::wrap(ErrorKind::Cancelled, "upload cancelled: " + local_path, last);
            return false;
        }
    }
    err = Error::wrap(ErrorKind::Transfer,
                      "upload of " + local_path + " failed after " +
                          std::to_string(maxAttempts) + " attempts",
                      last);
    return false;
}

// Always sends the whole file; there is no upload resume.
bool TransferEngine::uploadAttempt(SmbClient& client, const std::string& local_path,
                                   const std::string& remote_path,
                                   const ProgressCB& progress, Error& err) {
    LocalFile lf(local_path, "rb");
    if (!lf) {
        err.set(ErrorKind::LocalIo, "cannot open local file for reading: " + local_path);
        return false;
    }
    const std::uint64_t total = lf.length();
    if (std::fseek(lf.get(), 0, SEEK_SET) != 0) {
        err.set(ErrorKind::LocalIo, "cannot rewind local file: " + local_path);
        return false;
    }

    std::string e;
    std::unique_ptr<RemoteFile> wf;
    if (!client.open(remote_path, OpenMode::Overwrite, wf, e)) {
        err = Error::wrap(ErrorKind::Protocol, "cannot open " + remote_path + " for writing",
                          Error::make(ErrorKind::Protocol, e));
        return false;
    }

    const std::string item = path::baseName(local_path);
    std::vector<char> buf(opt_.chunkSize ? opt_.chunkSize : 64 * 1024);
    std::uint64_t done = 0;
    while (true) {
        std::size_t n = std::fread(buf.data(), 1, buf.size(), lf.get());
        if (n == 0) {
            if (std::ferror(lf.get())) {
                err.set(ErrorKind::LocalIo, "local read failed: " + local_path);
                return false;
            }
            break; // EOF
        }
        const char* p = buf.data();
        std::size_t remain = n;
        while (remain > 0) {
            long long w = wf->write(p, remain, e);
            if (w <= 0) {
                err = Error::wrap(ErrorKind::Protocol, "remote write failed for " + remote_path,
                                  Error::make(ErrorKind::Protocol, w < 0 ? e : "no progress"));
                return false;
            }
            remain -= (std::size_t)w;
            p += w;
            done += (std::uint64_t)w;
            if (progress) progress(done, total, item);
        }
    }
    return true;
}

} // namespace smblite
