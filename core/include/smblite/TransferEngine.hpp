// Single-file download/upload with chunked stream copy, linear retry backoff,
// and resume-by-offset for downloads.
#pragma once
#include "CancellationToken.hpp"
#include "Error.hpp"
#include "SessionFactory.hpp"

namespace smblite {

class TransferEngine {
public:
    explicit TransferEngine(const EngineOptions& opt) : opt_(opt) {}

    // Downloads remote_path into local_path. The first attempt truncates the
    // local file; retries keep what earlier attempts wrote and continue from its
    // length. Fails with NotFound when the remote file is
    // absent, Transfer (wrapping the last attempt's error) when attempts run out,
    // Cancelled when cancel fires during a backoff wait.
    bool download(Session& session,
                  const std::string& remote_path,
                  const std::string& local_path,
                  const ProgressCB& progress,
                  const CancellationToken* cancel,
                  Error& err);

    // Uploads local_path to remote_path (overwrite). Every attempt starts from
    // byte zero. On success the local source is deleted when configured to.
    bool upload(Session& session,
                const std::string& local_path,
                const std::string& remote_path,
                const ProgressCB& progress,
                const CancellationToken* cancel,
                Error& err);

    const EngineOptions& options() const { return opt_; }

private:
    // partialWritten: in, resume from the local file; out, set once the local
    // file has been opened for writing.
    bool downloadAttempt(SmbClient& client, const std::string& remote_path,
                         const std::string& local_path, bool& partialWritten,
                         const ProgressCB& progress, Error& err);
    bool uploadAttempt(SmbClient& client, const std::string& local_path,
                       const std::string& remote_path,
                       const ProgressCB& progress, Error& err);

    // Sleeps backoffBaseMs * attempt. Returns false if cancelled meanwhile.
    bool backoff(int attempt, const CancellationToken* cancel) const;
    // Re-establishes the session if its transport is gone.
    bool ensureConnected(Session& session, Error& err) const;

    EngineOptions opt_;
};

} // namespace smblite
