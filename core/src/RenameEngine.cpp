// Rename dispatch. Files are moved by copy + verify + delete because not every
// server offers a native file rename; the source is only removed once the
// target is known to be complete.
#include "smblite/RenameEngine.hpp"
#include "smblite/Log.hpp"
#include "smblite/PathResolver.hpp"
#include <vector>

namespace smblite {

namespace {

Error protocolError(const std::string& msg, const std::string& detail) {
    return Error::wrap(ErrorKind::Protocol, msg, Error::make(ErrorKind::Protocol, detail));
}

} // namespace

bool RenameEngine::rename(SmbClient& client, const std::string& old_path,
                          const std::string& new_name, Error& err) {
    if (!path::isValidName(new_name)) {
        err.set(ErrorKind::InvalidArgument, "invalid name: '" + new_name + "'");
        return false;
    }
    const std::string from = path::normalize(old_path);
    if (from.empty()) {
        err.set(ErrorKind::InvalidArgument, "cannot rename the share root");
        return false;
    }

    std::string e;
    bool isDir = false;
    if (!client.exists(from, isDir, e)) {
        if (!e.empty()) err = protocolError("cannot check " + from, e);
        else err.set(ErrorKind::NotFound, "not found: " + from);
        return false;
    }

    const std::string to = path::join(path::parentOf(from), new_name);
    LOGI("renaming %s %s -> %s", isDir ? "directory" : "file", from.c_str(), to.c_str());
    return isDir ? renameDirectory(client, from, to, err)
                 : renameFile(client, from, to, err);
}

bool RenameEngine::targetFree(SmbClient& client, const std::string& to, Error& err) {
    std::string e;
    bool isDir = false;
    if (client.exists(to, isDir, e)) {
        err.set(ErrorKind::AlreadyExists, "target already exists: " + to);
        return false;
    }
    if (!e.empty()) {
        err = protocolError("cannot check " + to, e);
        return false;
    }
    return true;
}

bool RenameEngine::renameDirectory(SmbClient& client, const std::string& from,
                                   const std::string& to, Error& err) {
    if (!targetFree(client, to, err)) return false;
    std::string e;
    if (!client.renameDirectory(from, to, e)) {
        err = protocolError("cannot rename " + from + " to " + to, e);
        return false;
    }
    return true;
}

bool RenameEngine::renameFile(SmbClient& client, const std::string& from,
                              const std::string& to, Error& err) {
    if (!targetFree(client, to, err)) return false;
    if (!copyFile(client, from, to, err)) return false;

    std::string e;
    if (!client.removeFile(from, e)) {
        // Both copies exist now; nothing is lost, but the move is incomplete.
        err = protocolError("copied to " + to + " but could not delete " + from, e);
        LOGE("%s", err.describe().c_str());
        return false;
    }
    return true;
}

bool RenameEngine::copyFile(SmbClient& client, const std::string& from,
                            const std::string& to, Error& err) {
    std::string e;
    FileInfo srcInfo{};
    if (!client.stat(from, srcInfo, e)) {
        if (!e.empty()) err = protocolError("cannot stat " + from, e);
        else err.set(ErrorKind::NotFound, "not found: " + from);
        return false;
    }

    std::unique_ptr<RemoteFile> src;
    if (!client.open(from, OpenMode::Read, src, e)) {
        err = protocolError("cannot open " + from + " for reading", e);
        return false;
    }
    std::unique_ptr<RemoteFile> dst;
    if (!client.open(to, OpenMode::CreateNew, dst, e)) {
        // Nothing of ours at `to` yet; leave it alone.
        err = protocolError("cannot create " + to, e);
        return false;
    }

    std::vector<char> buf(chunkSize_);
    std::uint64_t copied = 0;
    while (true) {
        long long n = src->read(buf.data(), buf.size(), e);
        if (n == 0) break;
        if (n < 0) {
            err = protocolError("read failed on " + from, e);
            dst.reset();
            discardTarget(client, to);
            return false;
        }
        const char* p = buf.data();
        long long remain = n;
        while (remain > 0) {
            long long w = dst->write(p, (std::size_t)remain, e);
            if (w <= 0) {
                err = protocolError("write failed on " + to, w < 0 ? e : "no progress");
                dst.reset();
                discardTarget(client, to);
                return false;
            }
            remain -= w;
            p += w;
        }
        copied += (std::uint64_t)n;
    }
    src.reset();
    dst.reset();

    if (copied != srcInfo.size) {
        err.set(ErrorKind::Integrity, "copied " + std::to_string(copied) + " of " +
                                          std::to_string(srcInfo.size) + " bytes of " + from);
        LOGE("%s", err.message.c_str());
        discardTarget(client, to);
        return false;
    }
    if (!client.fileExists(to, e)) {
        err = protocolError("target missing after copy: " + to,
                            e.empty() ? std::string("not found") : e);
        return false;
    }
    return true;
}

void RenameEngine::discardTarget(SmbClient& client, const std::string& to) {
    std::string e;
    if (!client.removeFile(to, e)) {
        LOGW("could not remove incomplete copy %s: %s", to.c_str(), e.c_str());
    } else {
        LOGD("removed incomplete copy %s", to.c_str());
    }
}

} // namespace smblite
