// Downloads a whole remote directory tree, delegating each file to TransferEngine.
#pragma once
#include "TransferEngine.hpp"

namespace smblite {

class FolderTransferEngine {
public:
    explicit FolderTransferEngine(TransferEngine& files) : files_(files) {}

    // Mirrors remote_dir into local_dir. The first file whose retries run out
    // aborts the whole operation with a Transfer error naming that file; files
    // already written stay on disk.
    bool downloadFolder(Session& session,
                        const std::string& remote_dir,
                        const std::string& local_dir,
                        const FolderProgress& progress,
                        const CancellationToken* cancel,
                        Error& err);

    // Files (not directories) below remote_dir. Unlistable directories count as empty.
    std::uint64_t countFiles(SmbClient& client, const std::string& remote_dir);

private:
    struct Counter {
        std::uint64_t done = 0;
        std::uint64_t total = 0;
    };

    bool downloadContents(Session& session, const std::string& remote_dir,
                          const std::string& local_dir, const FolderProgress& progress,
                          const CancellationToken* cancel, Counter& counter, Error& err);

    TransferEngine& files_;
};

} // namespace smblite
