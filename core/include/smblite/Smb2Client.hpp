// SmbClient implementation using libsmb2 (SMB2/3, synchronous API).
// Owns one smb2_context bound to one share at a time.
#pragma once
#include "SmbClient.hpp"
#include <string>
#include <vector>

// Forward declarations of libsmb2 types
struct smb2_context;

namespace smblite {

class Smb2Client : public SmbClient {
public:
    explicit Smb2Client(int timeoutSeconds = 0);
    ~Smb2Client() override;

    bool connect(const std::string& server, std::string& err) override;
    bool authenticate(const Credentials& cred, std::string& err) override;
    bool attachShare(const std::string& share, std::string& err) override;
    void disconnect() override;
    bool isConnected() const override { return connected_ && ctx_ && !broken_; }

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
    friend class Smb2RemoteFile;

    bool connected_ = false;
    bool broken_ = false;           // transport-level failure seen
    int  timeout_ = 0;
    smb2_context* ctx_ = nullptr;
    std::string server_;
    std::string share_;
    Credentials cred_;

    // Fresh context, credentials applied, tree connected to share.
    bool openContext(const std::string& share, std::string& err);
    void closeContext();
    bool ready(std::string& err) const;
    // Returns the libsmb2 error text and marks the transport broken when rc says so.
    std::string failure(int rc);
};

class Smb2ClientFactory : public SmbClientFactory {
public:
    explicit Smb2ClientFactory(int timeoutSeconds = 0) : timeout_(timeoutSeconds) {}
    std::unique_ptr<SmbClient> create() override;

private:
    int timeout_;
};

} // namespace smblite
