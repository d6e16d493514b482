// libsmb2 backend: TCP probe, NTLMSSP logon checked against IPC$, then a tree
// connect to the requested share. Errors carry the text from smb2_get_error().
#include "smblite/Smb2Client.hpp"
#include "smblite/Log.hpp"
#include "smblite/PathResolver.hpp"
#include "smblite/TcpProbe.hpp"

#include <smb2/smb2.h>
#include <smb2/libsmb2.h>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>

namespace smblite {

static const char* kSmbPort = "445";

static bool isTransportError(int rc) {
    return rc == -ECONNRESET || rc == -EPIPE || rc == -ETIMEDOUT ||
           rc == -ENOTCONN || rc == -ECONNABORTED || rc == -EHOSTUNREACH ||
           rc == -ENETUNREACH;
}

// smb2_connect_share runs negotiate, session setup and tree connect. Failures of
// the last two are reported as "Session setup failed ..." / "Tree Connect failed ...";
// anything else stopped at the socket or the dialect negotiation.
static bool reachedSessionSetup(const std::string& msg) {
    return msg.find("Session setup") != std::string::npos ||
           msg.find("Tree Connect") != std::string::npos;
}

class Smb2RemoteFile : public RemoteFile {
public:
    Smb2RemoteFile(Smb2Client& client, struct smb2fh* fh, std::uint64_t size)
        : client_(client), ctx_(client.ctx_), fh_(fh), size_(size) {}

    ~Smb2RemoteFile() override {
        // The handle dies with its context if the client was closed first.
        if (fh_ && client_.ctx_ == ctx_) smb2_close(ctx_, fh_);
    }

    long long read(char* buf, std::size_t len, std::string& err) override {
        if (!client_.ready(err)) return -1;
        const std::uint32_t maxRead = smb2_get_max_read_size(ctx_);
        std::uint32_t count = (std::uint32_t)std::min<std::size_t>(len, maxRead ? maxRead : len);
        int rc = smb2_read(ctx_, fh_, reinterpret_cast<uint8_t*>(buf), count);
        if (rc < 0) {
            err = client_.failure(rc);
            return -1;
        }
        return rc;
    }

    long long write(const char* buf, std::size_t len, std::string& err) override {
        if (!client_.ready(err)) return -1;
        const std::uint32_t maxWrite = smb2_get_max_write_size(ctx_);
        std::uint32_t count = (std::uint32_t)std::min<std::size_t>(len, maxWrite ? maxWrite : len);
        int rc = smb2_write(ctx_, fh_, (uint8_t*)buf, count);
        if (rc < 0) {
            err = client_.failure(rc);
            return -1;
        }
        return rc;
    }

    bool skip(std::uint64_t offset, std::string& err) override {
        if (!client_.ready(err)) return false;
        uint64_t cur = 0;
        int64_t rc = smb2_lseek(ctx_, fh_, (int64_t)offset, SEEK_SET, &cur);
        if (rc < 0) {
            err = client_.failure((int)rc);
            return false;
        }
        return true;
    }

    std::uint64_t size() const override { return size_; }

private:
    Smb2Client& client_;
    smb2_context* ctx_;
    struct smb2fh* fh_;
    std::uint64_t size_;
};

Smb2Client::Smb2Client(int timeoutSeconds) : timeout_(timeoutSeconds) {}

Smb2Client::~Smb2Client() {
    disconnect();
}

std::string Smb2Client::failure(int rc) {
    if (isTransportError(rc)) broken_ = true;
    const char* msg = ctx_ ? smb2_get_error(ctx_) : nullptr;
    if (msg && *msg) return msg;
    return std::strerror(rc < 0 ? -rc : rc);
}

bool Smb2Client::ready(std::string& err) const {
    if (!isConnected() || share_.empty()) {
        err = "not connected";
        return false;
    }
    return true;
}

bool Smb2Client::connect(const std::string& server, std::string& err) {
    if (connected_) {
        err = "already connected";
        return false;
    }
    if (server.empty()) {
        err = "server address is empty";
        return false;
    }
    if (!net::tcpReachable(server, kSmbPort, timeout_, err)) return false;
    server_ = server;
    connected_ = true;
    broken_ = false;
    return true;
}

bool Smb2Client::openContext(const std::string& share, std::string& err) {
    closeContext();
    ctx_ = smb2_init_context();
    if (!ctx_) {
        err = "smb2_init_context failed";
        return false;
    }
    smb2_set_security_mode(ctx_, SMB2_NEGOTIATE_SIGNING_ENABLED);
    if (timeout_ > 0) smb2_set_timeout(ctx_, timeout_);

    // libsmb2 has no separate anonymous logon; the guest account with an
    // empty password is what servers accept for guest access.
    const std::string user = cred_.anonymous ? std::string("guest") : cred_.username;
    smb2_set_user(ctx_, user.c_str());
    smb2_set_password(ctx_, cred_.anonymous ? "" : cred_.password.c_str());
    if (!cred_.anonymous && !cred_.domain.empty()) smb2_set_domain(ctx_, cred_.domain.c_str());

    int rc = smb2_connect_share(ctx_, server_.c_str(), share.c_str(), user.c_str());
    if (rc < 0) {
        err = smb2_get_error(ctx_);
        if (isTransportError(rc) || !reachedSessionSetup(err)) broken_ = true;
        smb2_destroy_context(ctx_);
        ctx_ = nullptr;
        return false;
    }
    broken_ = false; // fresh transport
    return true;
}

void Smb2Client::closeContext() {
    if (!ctx_) return;
    smb2_disconnect_share(ctx_);
    smb2_destroy_context(ctx_);
    ctx_ = nullptr;
}

bool Smb2Client::authenticate(const Credentials& cred, std::string& err) {
    if (!connected_) {
        err = "not connected";
        return false;
    }
    cred_ = cred;
    // Logon is verified with a tree connect to IPC$, which every server exposes.
    if (!openContext("IPC$", err)) return false;
    share_.clear();
    return true;
}

bool Smb2Client::attachShare(const std::string& share, std::string& err) {
    if (!connected_ || !ctx_) {
        err = "not authenticated";
        return false;
    }
    // A context is bound to a single tree connect; rebuild it for the new share.
    if (!openContext(share, err)) {
        share_.clear();
        // Keep a usable logon around for further attach attempts.
        std::string ignored;
        if (!openContext("IPC$", ignored)) LOGD("IPC$ reconnect failed: %s", ignored.c_str());
        return false;
    }
    share_ = share;
    return true;
}

void Smb2Client::disconnect() {
    closeContext();
    share_.clear();
    connected_ = false;
    broken_ = false;
}

bool Smb2Client::list(const std::string& remote_path,
                      std::vector<FileInfo>& out,
                      std::string& err) {
    if (!ready(err)) return false;
    const std::string p = path::normalize(remote_path);
    struct smb2dir* dir = smb2_opendir(ctx_, p.c_str());
    if (!dir) {
        err = failure(-EIO);
        return false;
    }
    out.clear();
    struct smb2dirent* ent;
    while ((ent = smb2_readdir(ctx_, dir)) != nullptr) {
        if (!ent->name) continue;
        std::string name = ent->name;
        if (name == "." || name == "..") continue;
        FileInfo fi{};
        fi.name = std::move(name);
        fi.is_dir = ent->st.smb2_type == SMB2_TYPE_DIRECTORY;
        fi.size = fi.is_dir ? 0 : ent->st.smb2_size;
        fi.mtime = ent->st.smb2_mtime;
        out.push_back(std::move(fi));
    }
    smb2_closedir(ctx_, dir);
    return true;
}

bool Smb2Client::stat(const std::string& remote_path,
                      FileInfo& info,
                      std::string& err) {
    if (!ready(err)) return false;
    err.clear();
    const std::string p = path::normalize(remote_path);
    info = FileInfo{};
    struct smb2_stat_64 st{};
    int rc = smb2_stat(ctx_, p.c_str(), &st);
    if (rc < 0) {
        if (rc == -ENOENT || rc == -ENOTDIR) return false;
        err = failure(rc);
        return false;
    }
    info.name = path::baseName(p);
    info.is_dir = st.smb2_type == SMB2_TYPE_DIRECTORY;
    info.size = info.is_dir ? 0 : st.smb2_size;
    info.mtime = st.smb2_mtime;
    return true;
}

bool Smb2Client::exists(const std::string& remote_path,
                        bool& isDir,
                        std::string& err) {
    FileInfo info{};
    isDir = false;
    if (!stat(remote_path, info, err)) return false;
    isDir = info.is_dir;
    return true;
}

bool Smb2Client::open(const std::string& remote_path,
                      OpenMode mode,
                      std::unique_ptr<RemoteFile>& out,
                      std::string& err) {
    if (!ready(err)) return false;
    const std::string p = path::normalize(remote_path);
    int flags = O_RDONLY;
    if (mode == OpenMode::Overwrite) flags = O_WRONLY | O_CREAT | O_TRUNC;
    else if (mode == OpenMode::CreateNew) flags = O_WRONLY | O_CREAT | O_EXCL;

    struct smb2fh* fh = smb2_open(ctx_, p.c_str(), flags);
    if (!fh) {
        err = failure(-EIO);
        return false;
    }
    std::uint64_t size = 0;
    if (mode == OpenMode::Read) {
        struct smb2_stat_64 st{};
        int rc = smb2_fstat(ctx_, fh, &st);
        if (rc < 0) {
            err = failure(rc);
            smb2_close(ctx_, fh);
            return false;
        }
        size = st.smb2_size;
    }
    out = std::make_unique<Smb2RemoteFile>(*this, fh, size);
    return true;
}

bool Smb2Client::removeFile(const std::string& remote_path, std::string& err) {
    if (!ready(err)) return false;
    int rc = smb2_unlink(ctx_, path::normalize(remote_path).c_str());
    if (rc < 0) {
        err = failure(rc);
        return false;
    }
    return true;
}

bool Smb2Client::removeDirectoryRecursive(const std::string& remote_dir, std::string& err) {
    std::vector<FileInfo> entries;
    const std::string dir = path::normalize(remote_dir);
    if (!list(dir, entries, err)) return false;
    for (const auto& fi : entries) {
        const std::string child = path::join(dir, fi.name);
        bool ok = fi.is_dir ? removeDirectoryRecursive(child, err) : removeFile(child, err);
        if (!ok) return false;
    }
    int rc = smb2_rmdir(ctx_, dir.c_str());
    if (rc < 0) {
        err = failure(rc);
        return false;
    }
    return true;
}

bool Smb2Client::makeDirectory(const std::string& remote_dir, std::string& err) {
    if (!ready(err)) return false;
    int rc = smb2_mkdir(ctx_, path::normalize(remote_dir).c_str());
    if (rc < 0) {
        err = failure(rc);
        return false;
    }
    return true;
}

bool Smb2Client::renameDirectory(const std::string& from, const std::string& to, std::string& err) {
    if (!ready(err)) return false;
    int rc = smb2_rename(ctx_, path::normalize(from).c_str(), path::normalize(to).c_str());
    if (rc < 0) {
        err = failure(rc);
        return false;
    }
    return true;
}

std::unique_ptr<SmbClient> Smb2ClientFactory::create() {
    return std::make_unique<Smb2Client>(timeout_);
}

} // namespace smblite
