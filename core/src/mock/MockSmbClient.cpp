// Mock implementation: an in-memory share tree per share name, with fault
// injection and session bookkeeping for tests.
#include "smblite/MockSmbClient.hpp"
#include "smblite/PathResolver.hpp"
#include <algorithm>
#include <cctype>
#include <thread>

namespace smblite {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });
    return s;
}

std::uint64_t reportedSize(const MockShareServer::Node& n) {
    return n.reportedSize ? *n.reportedSize : (std::uint64_t)n.data.size();
}

bool isUnder(const std::string& candidate, const std::string& dir) {
    if (dir.empty()) return !candidate.empty();
    return candidate.size() > dir.size() &&
           candidate.compare(0, dir.size(), dir) == 0 &&
           candidate[dir.size()] == '/';
}

} // namespace

// ---------------------------------------------------------------- server setup

std::string MockShareServer::key(const std::string& share, const std::string& p) {
    return lower(path::shareName(share)) + ":" + path::normalize(p);
}

MockShareServer::Tree* MockShareServer::treeFor(const std::string& share) {
    auto it = shares_.find(lower(path::shareName(share)));
    return it == shares_.end() ? nullptr : &it->second;
}

const MockShareServer::Tree* MockShareServer::treeFor(const std::string& share) const {
    auto it = shares_.find(lower(path::shareName(share)));
    return it == shares_.end() ? nullptr : &it->second;
}

void MockShareServer::ensureParents(Tree& tree, const std::string& p) {
    std::string parent = path::parentOf(p);
    while (!parent.empty()) {
        Node& n = tree[parent];
        n.is_dir = true;
        parent = path::parentOf(parent);
    }
}

void MockShareServer::sleepLatency() const {
    std::chrono::milliseconds l;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        l = latency_;
    }
    if (l.count() > 0) std::this_thread::sleep_for(l);
}

void MockShareServer::setReachable(bool reachable) {
    std::lock_guard<std::mutex> lk(mtx_);
    reachable_ = reachable;
}

void MockShareServer::setGuestAllowed(bool allowed) {
    std::lock_guard<std::mutex> lk(mtx_);
    guestAllowed_ = allowed;
}

void MockShareServer::addUser(const std::string& user, const std::string& password) {
    std::lock_guard<std::mutex> lk(mtx_);
    users_[user] = password;
}

void MockShareServer::addShare(const std::string& share) {
    std::lock_guard<std::mutex> lk(mtx_);
    shares_[lower(path::shareName(share))];
}

void MockShareServer::addDirectory(const std::string& share, const std::string& p) {
    std::lock_guard<std::mutex> lk(mtx_);
    Tree& tree = shares_[lower(path::shareName(share))];
    const std::string np = path::normalize(p);
    if (np.empty()) return;
    ensureParents(tree, np);
    tree[np].is_dir = true;
}

void MockShareServer::addFile(const std::string& share, const std::string& p,
                              const std::string& content, std::uint64_t mtime) {
    std::lock_guard<std::mutex> lk(mtx_);
    Tree& tree = shares_[lower(path::shareName(share))];
    const std::string np = path::normalize(p);
    ensureParents(tree, np);
    Node& n = tree[np];
    n.is_dir = false;
    n.data = content;
    n.mtime = mtime;
    n.reportedSize.reset();
}

void MockShareServer::setReportedSize(const std::string& share, const std::string& p, std::uint64_t size) {
    std::lock_guard<std::mutex> lk(mtx_);
    Tree* tree = treeFor(share);
    if (!tree) return;
    auto it = tree->find(path::normalize(p));
    if (it != tree->end()) it->second.reportedSize = size;
}

void MockShareServer::failReads(const std::string& share, const std::string& p,
                                std::uint64_t bytesBeforeFailure, int failures) {
    std::lock_guard<std::mutex> lk(mtx_);
    readFaults_[key(share, p)] = Fault{bytesBeforeFailure, failures};
}

void MockShareServer::failWrites(const std::string& share, const std::string& p,
                                 std::uint64_t bytesBeforeFailure, int failures) {
    std::lock_guard<std::mutex> lk(mtx_);
    writeFaults_[key(share, p)] = Fault{bytesBeforeFailure, failures};
}

void MockShareServer::failList(const std::string& share, const std::string& p) {
    std::lock_guard<std::mutex> lk(mtx_);
    listFaults_[key(share, p)] = true;
}

void MockShareServer::failOpens(const std::string& share, const std::string& p, int failures) {
    std::lock_guard<std::mutex> lk(mtx_);
    openFaults_[key(share, p)] = failures;
}

void MockShareServer::setNegotiateFails(bool fails) {
    std::lock_guard<std::mutex> lk(mtx_);
    negotiateFails_ = fails;
}

void MockShareServer::setDropConnectionOnFault(bool drop) {
    std::lock_guard<std::mutex> lk(mtx_);
    dropOnFault_ = drop;
}

void MockShareServer::setLatency(std::chrono::milliseconds latency) {
    std::lock_guard<std::mutex> lk(mtx_);
    latency_ = latency;
}

void MockShareServer::setListHook(std::function<void(const std::string&)> hook) {
    std::lock_guard<std::mutex> lk(mtx_);
    listHook_ = std::move(hook);
}

// ----------------------------------------------------------- server inspection

bool MockShareServer::hasFile(const std::string& share, const std::string& p) const {
    std::lock_guard<std::mutex> lk(mtx_);
    const Tree* tree = treeFor(share);
    if (!tree) return false;
    auto it = tree->find(path::normalize(p));
    return it != tree->end() && !it->second.is_dir;
}

bool MockShareServer::hasDirectory(const std::string& share, const std::string& p) const {
    std::lock_guard<std::mutex> lk(mtx_);
    const Tree* tree = treeFor(share);
    if (!tree) return false;
    const std::string np = path::normalize(p);
    if (np.empty()) return true;
    auto it = tree->find(np);
    return it != tree->end() && it->second.is_dir;
}

std::string MockShareServer::fileContent(const std::string& share, const std::string& p) const {
    std::lock_guard<std::mutex> lk(mtx_);
    const Tree* tree = treeFor(share);
    if (!tree) return {};
    auto it = tree->find(path::normalize(p));
    return it == tree->end() ? std::string() : it->second.data;
}

int MockShareServer::activeSessions() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return active_;
}

int MockShareServer::maxActiveSessions() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return maxActive_;
}

int MockShareServer::connectCount() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return connects_;
}

std::optional<Credentials> MockShareServer::lastCredentials() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return lastCred_;
}

std::size_t MockShareServer::listCalls() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return listCalls_;
}

std::vector<std::uint64_t> MockShareServer::readStartOffsets(const std::string& share,
                                                             const std::string& p) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = readStarts_.find(key(share, p));
    return it == readStarts_.end() ? std::vector<std::uint64_t>{} : it->second;
}

std::vector<std::uint64_t> MockShareServer::writeHandleBytes(const std::string& share,
                                                             const std::string& p) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = writeBytes_.find(key(share, p));
    return it == writeBytes_.end() ? std::vector<std::uint64_t>{} : it->second;
}

// ------------------------------------------------------------------ file handle

class MockRemoteFile : public RemoteFile {
public:
    MockRemoteFile(MockSmbClient& client, std::string share, std::string p,
                   OpenMode mode, std::uint64_t size, std::optional<MockShareServer::Fault> fault)
        : client_(client), server_(*client.server_), share_(std::move(share)),
          path_(std::move(p)), mode_(mode), size_(size), fault_(fault) {}

    ~MockRemoteFile() override {
        if (mode_ == OpenMode::Read) return;
        std::lock_guard<std::mutex> lk(server_.mtx_);
        server_.writeBytes_[MockShareServer::key(share_, path_)].push_back(written_);
    }

    long long read(char* buf, std::size_t len, std::string& err) override {
        std::lock_guard<std::mutex> lk(server_.mtx_);
        if (mode_ != OpenMode::Read) { err = "handle not opened for reading"; return -1; }
        if (!client_.isConnected()) { err = "not connected"; return -1; }
        if (!startRecorded_) {
            server_.readStarts_[MockShareServer::key(share_, path_)].push_back(offset_);
            startRecorded_ = true;
        }
        const MockShareServer::Node* node = lookup();
        if (!node) { err = "file vanished: " + path_; return -1; }
        if (fault_ && served_ >= fault_->after) {
            client_.dropTransport();
            err = "connection reset while reading " + path_;
            return -1;
        }
        if (offset_ >= node->data.size()) return 0;
        std::uint64_t n = std::min<std::uint64_t>(len, node->data.size() - offset_);
        if (fault_) n = std::min<std::uint64_t>(n, fault_->after - served_);
        std::copy_n(node->data.data() + offset_, (std::size_t)n, buf);
        offset_ += n;
        served_ += n;
        return (long long)n;
    }

    long long write(const char* buf, std::size_t len, std::string& err) override {
        std::lock_guard<std::mutex> lk(server_.mtx_);
        if (mode_ == OpenMode::Read) { err = "handle not opened for writing"; return -1; }
        if (!client_.isConnected()) { err = "not connected"; return -1; }
        MockShareServer::Node* node = lookup();
        if (!node) { err = "file vanished: " + path_; return -1; }
        if (fault_ && written_ >= fault_->after) {
            client_.dropTransport();
            err = "connection reset while writing " + path_;
            return -1;
        }
        std::uint64_t n = len;
        if (fault_) n = std::min<std::uint64_t>(n, fault_->after - written_);
        if (node->data.size() < offset_ + n) node->data.resize((std::size_t)(offset_ + n));
        std::copy_n(buf, (std::size_t)n, &node->data[(std::size_t)offset_]);
        node->reportedSize.reset();
        offset_ += n;
        written_ += n;
        return (long long)n;
    }

    bool skip(std::uint64_t offset, std::string& err) override {
        std::lock_guard<std::mutex> lk(server_.mtx_);
        if (!client_.isConnected()) { err = "not connected"; return false; }
        offset_ = offset;
        return true;
    }

    std::uint64_t size() const override { return size_; }

private:
    MockShareServer::Node* lookup() {
        MockShareServer::Tree* tree = server_.treeFor(share_);
        if (!tree) return nullptr;
        auto it = tree->find(path_);
        return (it == tree->end() || it->second.is_dir) ? nullptr : &it->second;
    }

    MockSmbClient& client_;
    MockShareServer& server_;
    std::string share_;
    std::string path_;
    OpenMode mode_;
    std::uint64_t size_ = 0;
    std::optional<MockShareServer::Fault> fault_;
    std::uint64_t offset_ = 0;
    std::uint64_t served_ = 0;
    std::uint64_t written_ = 0;
    bool startRecorded_ = false;
};

// ----------------------------------------------------------------------- client

MockSmbClient::MockSmbClient(std::shared_ptr<MockShareServer> server)
    : server_(std::move(server)) {}

MockSmbClient::~MockSmbClient() {
    disconnect();
}

void MockSmbClient::dropTransport() {
    if (server_->dropOnFault_) dropped_ = true;
}

bool MockSmbClient::connect(const std::string& server, std::string& err) {
    if (connected_) {
        err = "already connected";
        return false;
    }
    server_->sleepLatency();
    std::lock_guard<std::mutex> lk(server_->mtx_);
    if (server.empty() || !server_->reachable_) {
        err = "could not connect to " + server;
        return false;
    }
    connected_ = true;
    dropped_ = false;
    server_->connects_++;
    server_->active_++;
    server_->maxActive_ = std::max(server_->maxActive_, server_->active_);
    return true;
}

bool MockSmbClient::authenticate(const Credentials& cred, std::string& err) {
    std::lock_guard<std::mutex> lk(server_->mtx_);
    if (!connected_) {
        err = "not connected";
        return false;
    }
    if (server_->negotiateFails_) {
        dropped_ = true;
        err = "negotiate failed: no common dialect";
        return false;
    }
    server_->lastCred_ = cred;
    if (cred.anonymous) {
        if (!server_->guestAllowed_) {
            err = "guest logon refused";
            return false;
        }
    } else {
        auto it = server_->users_.find(cred.username);
        if (it == server_->users_.end() || it->second != cred.password) {
            err = "logon failure for " + cred.username;
            return false;
        }
    }
    authenticated_ = true;
    return true;
}

bool MockSmbClient::attachShare(const std::string& share, std::string& err) {
    std::lock_guard<std::mutex> lk(server_->mtx_);
    if (!connected_ || !authenticated_) {
        err = "not authenticated";
        return false;
    }
    if (!server_->treeFor(share)) {
        err = "bad network name: " + share;
        return false;
    }
    share_ = share;
    return true;
}

void MockSmbClient::disconnect() {
    if (!connected_) return;
    std::lock_guard<std::mutex> lk(server_->mtx_);
    connected_ = false;
    authenticated_ = false;
    share_.clear();
    server_->active_--;
}

bool MockSmbClient::ready(std::string& err) const {
    if (!isConnected() || share_.empty()) {
        err = "not connected";
        return false;
    }
    return true;
}

bool MockSmbClient::list(const std::string& remote_path,
                         std::vector<FileInfo>& out,
                         std::string& err) {
    const std::string p = path::normalize(remote_path);
    std::function<void(const std::string&)> hook;
    {
        std::lock_guard<std::mutex> lk(server_->mtx_);
        hook = server_->listHook_;
    }
    if (hook) hook(p);
    server_->sleepLatency();

    std::lock_guard<std::mutex> lk(server_->mtx_);
    server_->listCalls_++;
    if (!ready(err)) return false;
    if (server_->listFaults_.count(MockShareServer::key(share_, p))) {
        dropTransport();
        err = "listing failed for " + p;
        return false;
    }
    const MockShareServer::Tree* tree = server_->treeFor(share_);
    if (!p.empty()) {
        auto it = tree->find(p);
        if (it == tree->end() || !it->second.is_dir) {
            err = "no such directory: " + p;
            return false;
        }
    }
    out.clear();
    for (const auto& kv : *tree) {
        if (!isUnder(kv.first, p) || path::parentOf(kv.first) != p) continue;
        FileInfo fi{};
        fi.name = path::baseName(kv.first);
        fi.is_dir = kv.second.is_dir;
        fi.size = kv.second.is_dir ? 0 : reportedSize(kv.second);
        fi.mtime = kv.second.mtime;
        out.push_back(std::move(fi));
    }
    std::sort(out.begin(), out.end(), [](const FileInfo& a, const FileInfo& b) {
        if (a.is_dir != b.is_dir) return a.is_dir > b.is_dir; // directories first
        return a.name < b.name;
    });
    return true;
}

bool MockSmbClient::stat(const std::string& remote_path,
                         FileInfo& info,
                         std::string& err) {
    std::lock_guard<std::mutex> lk(server_->mtx_);
    if (!ready(err)) return false;
    err.clear();
    const std::string p = path::normalize(remote_path);
    info = FileInfo{};
    if (p.empty()) {
        info.is_dir = true;
        return true;
    }
    const MockShareServer::Tree* tree = server_->treeFor(share_);
    auto it = tree->find(p);
    if (it == tree->end()) return false;
    info.name = path::baseName(p);
    info.is_dir = it->second.is_dir;
    info.size = it->second.is_dir ? 0 : reportedSize(it->second);
    info.mtime = it->second.mtime;
    return true;
}

bool MockSmbClient::exists(const std::string& remote_path,
                           bool& isDir,
                           std::string& err) {
    FileInfo info{};
    isDir = false;
    if (!stat(remote_path, info, err)) return false;
    isDir = info.is_dir;
    return true;
}

bool MockSmbClient::open(const std::string& remote_path,
                         OpenMode mode,
                         std::unique_ptr<RemoteFile>& out,
                         std::string& err) {
    std::lock_guard<std::mutex> lk(server_->mtx_);
    if (!ready(err)) return false;
    const std::string p = path::normalize(remote_path);
    auto oit = server_->openFaults_.find(MockShareServer::key(share_, p));
    if (oit != server_->openFaults_.end() && oit->second > 0) {
        oit->second--;
        err = "sharing violation opening " + p;
        return false;
    }
    MockShareServer::Tree* tree = server_->treeFor(share_);
    auto it = tree->find(p);
    std::optional<MockShareServer::Fault> fault;
    auto& faults = (mode == OpenMode::Read) ? server_->readFaults_ : server_->writeFaults_;
    auto fit = faults.find(MockShareServer::key(share_, p));

    if (mode == OpenMode::Read) {
        if (it == tree->end() || it->second.is_dir) {
            err = "no such file: " + p;
            return false;
        }
    } else {
        if (p.empty() || (it != tree->end() && it->second.is_dir)) {
            err = "cannot write to directory: " + p;
            return false;
        }
        if (mode == OpenMode::CreateNew && it != tree->end()) {
            err = "object name collision: " + p;
            return false;
        }
        const std::string parent = path::parentOf(p);
        if (!parent.empty()) {
            auto pit = tree->find(parent);
            if (pit == tree->end() || !pit->second.is_dir) {
                err = "parent directory missing: " + parent;
                return false;
            }
        }
        MockShareServer::Node& n = (*tree)[p];
        n.is_dir = false;
        n.data.clear();
        n.reportedSize.reset();
        it = tree->find(p);
    }
    if (fit != faults.end() && fit->second.remaining > 0) {
        fit->second.remaining--;
        fault = fit->second;
    }
    out = std::make_unique<MockRemoteFile>(*this, share_, p, mode, reportedSize(it->second), fault);
    return true;
}

bool MockSmbClient::removeFile(const std::string& remote_path, std::string& err) {
    std::lock_guard<std::mutex> lk(server_->mtx_);
    if (!ready(err)) return false;
    MockShareServer::Tree* tree = server_->treeFor(share_);
    auto it = tree->find(path::normalize(remote_path));
    if (it == tree->end() || it->second.is_dir) {
        err = "no such file: " + remote_path;
        return false;
    }
    tree->erase(it);
    return true;
}

bool MockSmbClient::removeDirectoryRecursive(const std::string& remote_dir, std::string& err) {
    std::lock_guard<std::mutex> lk(server_->mtx_);
    if (!ready(err)) return false;
    const std::string p = path::normalize(remote_dir);
    MockShareServer::Tree* tree = server_->treeFor(share_);
    auto it = tree->find(p);
    if (p.empty() || it == tree->end() || !it->second.is_dir) {
        err = "no such directory: " + remote_dir;
        return false;
    }
    for (auto cur = tree->begin(); cur != tree->end();) {
        if (cur->first == p || isUnder(cur->first, p)) cur = tree->erase(cur);
        else ++cur;
    }
    return true;
}

bool MockSmbClient::makeDirectory(const std::string& remote_dir, std::string& err) {
    std::lock_guard<std::mutex> lk(server_->mtx_);
    if (!ready(err)) return false;
    const std::string p = path::normalize(remote_dir);
    MockShareServer::Tree* tree = server_->treeFor(share_);
    if (p.empty() || tree->count(p)) {
        err = "object name collision: " + p;
        return false;
    }
    const std::string parent = path::parentOf(p);
    if (!parent.empty()) {
        auto pit = tree->find(parent);
        if (pit == tree->end() || !pit->second.is_dir) {
            err = "parent directory missing: " + parent;
            return false;
        }
    }
    (*tree)[p].is_dir = true;
    return true;
}

bool MockSmbClient::renameDirectory(const std::string& from, const std::string& to, std::string& err) {
    std::lock_guard<std::mutex> lk(server_->mtx_);
    if (!ready(err)) return false;
    const std::string src = path::normalize(from);
    const std::string dst = path::normalize(to);
    MockShareServer::Tree* tree = server_->treeFor(share_);
    auto it = tree->find(src);
    if (src.empty() || it == tree->end() || !it->second.is_dir) {
        err = "no such directory: " + from;
        return false;
    }
    if (dst.empty() || tree->count(dst)) {
        err = "object name collision: " + to;
        return false;
    }
    MockShareServer::Tree moved;
    for (auto cur = tree->begin(); cur != tree->end();) {
        if (cur->first == src || isUnder(cur->first, src)) {
            moved[dst + cur->first.substr(src.size())] = cur->second;
            cur = tree->erase(cur);
        } else {
            ++cur;
        }
    }
    tree->insert(moved.begin(), moved.end());
    return true;
}

std::unique_ptr<SmbClient> MockSmbClientFactory::create() {
    return std::make_unique<MockSmbClient>(server_);
}

} // namespace smblite
