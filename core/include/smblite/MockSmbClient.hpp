// Simulated share server and client for testing without network.
// All clients created by one MockSmbClientFactory talk to the same
// MockShareServer, so state survives across per-operation sessions.
#pragma once
#include "SmbClient.hpp"
#include <chrono>
#include <map>
#include <mutex>
#include <optional>

namespace smblite {

class MockShareServer {
public:
    struct Node {
        bool          is_dir = false;
        std::string   data;
        std::uint64_t mtime = 0;
        std::optional<std::uint64_t> reportedSize; // overrides data.size() in metadata
    };

    // --- setup
    void setReachable(bool reachable);
    void setGuestAllowed(bool allowed);
    void addUser(const std::string& user, const std::string& password);
    void addShare(const std::string& share);
    void addDirectory(const std::string& share, const std::string& path);
    void addFile(const std::string& share, const std::string& path,
                 const std::string& content, std::uint64_t mtime = 0);
    void setReportedSize(const std::string& share, const std::string& path, std::uint64_t size);
    // The next `failures` read handles of path fail after serving `bytesBeforeFailure` bytes.
    void failReads(const std::string& share, const std::string& path,
                   std::uint64_t bytesBeforeFailure, int failures);
    // The next `failures` write handles of path fail after accepting `bytesBeforeFailure` bytes.
    void failWrites(const std::string& share, const std::string& path,
                    std::uint64_t bytesBeforeFailure, int failures);
    void failList(const std::string& share, const std::string& path);
    // The next `failures` open() calls on path fail before a handle exists.
    void failOpens(const std::string& share, const std::string& path, int failures);
    // Logon fails before authentication because no dialect can be agreed on;
    // the transport is dropped as a real server would.
    void setNegotiateFails(bool fails);
    // A fault also drops the client's transport (isConnected() turns false).
    void setDropConnectionOnFault(bool drop);
    void setLatency(std::chrono::milliseconds latency);
    // Invoked (outside the server lock) at the start of every list() call.
    void setListHook(std::function<void(const std::string&)> hook);

    // --- inspection
    bool hasFile(const std::string& share, const std::string& path) const;
    bool hasDirectory(const std::string& share, const std::string& path) const;
    std::string fileContent(const std::string& share, const std::string& path) const;
    int activeSessions() const;
    int maxActiveSessions() const;
    int connectCount() const;
    std::optional<Credentials> lastCredentials() const;
    std::size_t listCalls() const;
    // Offset at which each read handle of path started reading, in open order.
    std::vector<std::uint64_t> readStartOffsets(const std::string& share, const std::string& path) const;
    // Bytes accepted by each write handle of path, in open order.
    std::vector<std::uint64_t> writeHandleBytes(const std::string& share, const std::string& path) const;

private:
    friend class MockSmbClient;
    friend class MockRemoteFile;

    struct Fault {
        std::uint64_t after = 0;
        int remaining = 0;
    };
    using Tree = std::map<std::string, Node>;

    static std::string key(const std::string& share, const std::string& path);
    Tree* treeFor(const std::string& share);
    const Tree* treeFor(const std::string& share) const;
    void ensureParents(Tree& tree, const std::string& path);
    void sleepLatency() const;

    mutable std::mutex mtx_;
    bool reachable_ = true;
    bool guestAllowed_ = true;
    bool dropOnFault_ = false;
    bool negotiateFails_ = false;
    std::chrono::milliseconds latency_{0};
    std::map<std::string, std::string> users_;
    std::map<std::string, Tree> shares_;   // lower-cased share name -> tree
    std::map<std::string, Fault> readFaults_;
    std::map<std::string, Fault> writeFaults_;
    std::map<std::string, bool> listFaults_;
    std::map<std::string, int> openFaults_;
    std::function<void(const std::string&)> listHook_;

    int active_ = 0;
    int maxActive_ = 0;
    int connects_ = 0;
    std::size_t listCalls_ = 0;
    std::optional<Credentials> lastCred_;
    std::map<std::string, std::vector<std::uint64_t>> readStarts_;
    std::map<std::string, std::vector<std::uint64_t>> writeBytes_;
};

class MockSmbClient : public SmbClient {
public:
    explicit MockSmbClient(std::shared_ptr<MockShareServer> server);
    ~MockSmbClient() override;

    bool connect(const std::string& server, std::string& err) override;
    bool authenticate(const Credentials& cred, std::string& err) override;
    bool attachShare(const std::string& share, std::string& err) override;
    void disconnect() override;
    bool isConnected() const override { return connected_ && !dropped_; }

    bool list(const std::string& remote_path,
              std::vector<FileInfo>& out,
              std::string& err) override;
    bool stat(const std::string& remote_path,
              FileInfo& info,
              std::string& err) override;
    bool exists(const std::string& remote_path,
                bool& isDir,
                std::string& err) override;
    bool open(const std::string& remote_path,
              OpenMode mode,
              std::unique_ptr<RemoteFile>& out,
              std::string& err) override;
    bool removeFile(const std::string& remote_path,
                    std::string& err) override;
    bool removeDirectoryRecursive(const std::string& remote_dir,
                                  std::string& err) override;
    bool makeDirectory(const std::string& remote_dir,
                       std::string& err) override;
    bool renameDirectory(const std::string& from,
                         const std::string& to,
                         std::string& err) override;

private:
    friend class MockRemoteFile;
    bool ready(std::string& err) const;
    // Caller holds the server lock.
    void dropTransport();

    std::shared_ptr<MockShareServer> server_;
    bool connected_ = false;
    bool authenticated_ = false;
    bool dropped_ = false;
    std::string share_;
};

class MockSmbClientFactory : public SmbClientFactory {
public:
    explicit MockSmbClientFactory(std::shared_ptr<MockShareServer> server)
        : server_(std::move(server)) {}

    std::unique_ptr<SmbClient> create() override;
    MockShareServer& server() { return *server_; }

private:
    std::shared_ptr<MockShareServer> server_;
};

} // namespace smblite
