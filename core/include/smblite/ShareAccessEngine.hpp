// Public entry point of the core. Every operation takes the caller's profile,
// passes the OperationLock, opens its own session, runs one engine and closes
// the session before the lock is released. Safe to call from several threads;
// calls are served one at a time in arrival order.
#pragma once
#include "CancellationToken.hpp"
#include "Error.hpp"
#include "FolderTransferEngine.hpp"
#include "OperationLock.hpp"
#include "RenameEngine.hpp"
#include "SearchEngine.hpp"
#include "SessionFactory.hpp"
#include "TransferEngine.hpp"
#include <memory>
#include <mutex>
#include <unordered_set>

namespace smblite {

class ShareAccessEngine {
public:
    // clients must outlive the engine. A shared lock may be injected so several
    // engines driving the same backend serialize against each other.
    ShareAccessEngine(SmbClientFactory& clients,
                      const EngineOptions& opt = EngineOptions{},
                      std::shared_ptr<OperationLock> lock = nullptr);

    // True iff connect, authenticate and share attach all succeed; err tells which failed.
    bool testConnection(const ConnectionProfile& profile, Error& err);

    bool listFiles(const ConnectionProfile& profile, const std::string& path,
                   std::vector<RemoteEntry>& out, Error& err);

    // Share names that could be attached with this profile (common names probed).
    bool listShares(const ConnectionProfile& profile, std::vector<std::string>& out, Error& err);

    // A cancelled search is not a failure: it returns true with the partial
    // results. Only session establishment can fail a search.
    bool searchFiles(const ConnectionProfile& profile, const std::string& path,
                     const SearchRequest& request, std::vector<RemoteEntry>& out, Error& err);
    bool searchFiles(const ConnectionProfile& profile, const std::string& path,
                     const SearchRequest& request, const CancellationToken& cancel,
                     std::vector<RemoteEntry>& out, Error& err);
    // Cancels every search started through the overload without a token.
    void cancelSearch();

    bool downloadFile(const ConnectionProfile& profile, const std::string& remote_path,
                      const std::string& local_path, Error& err,
                      const ProgressCB& progress = {});
    bool downloadFolder(const ConnectionProfile& profile, const std::string& remote_path,
                        const std::string& local_dir, Error& err,
                        const FolderProgress& progress = {});
    bool uploadFile(const ConnectionProfile& profile, const std::string& local_path,
                    const std::string& remote_path, Error& err,
                    const ProgressCB& progress = {});
    // Interrupts backoff waits of running transfers and stops folder downloads
    // between files. Bytes already streaming are not interrupted.
    void cancelTransfers();
    // Downloads and uploads currently registered for cancelTransfers().
    std::size_t activeTransfers() const;

    bool deleteFile(const ConnectionProfile& profile, const std::string& path, Error& err);
    bool renameFile(const ConnectionProfile& profile, const std::string& old_path,
                    const std::string& new_name, Error& err);
    bool createDirectory(const ConnectionProfile& profile, const std::string& parent_path,
                         const std::string& name, Error& err);
    bool fileExists(const ConnectionProfile& profile, const std::string& path,
                    bool& exists, Error& err);

    OperationLock& lock() { return *lock_; }
    const EngineOptions& options() const { return opt_; }

private:
    using TokenPtr = std::shared_ptr<CancellationToken>;

    template <class F>
    bool withSession(const char* operation, const ConnectionProfile& profile, Error& err, F&& fn);

    // Registers a fresh token in one of the token sets for its lifetime.
    class TrackedToken {
    public:
        TrackedToken(ShareAccessEngine& engine, std::unordered_set<TokenPtr>& set);
        ~TrackedToken();
        TrackedToken(const TrackedToken&) = delete;
        TrackedToken& operator=(const TrackedToken&) = delete;

        CancellationToken* get() const { return token_.get(); }
        CancellationToken& operator*() const { return *token_; }

    private:
        ShareAccessEngine& engine_;
        std::unordered_set<TokenPtr>& set_;
        TokenPtr token_;
    };

    EngineOptions opt_;
    std::shared_ptr<OperationLock> lock_;
    SessionFactory sessions_;
    TransferEngine transfers_;
    FolderTransferEngine folders_;
    RenameEngine renames_;

    // Guards the token sets only; never held across network I/O.
    mutable std::mutex tokensMtx_;
    std::unordered_set<TokenPtr> searches_;
    std::unordered_set<TokenPtr> transfersInFlight_;
};

} // namespace smblite
