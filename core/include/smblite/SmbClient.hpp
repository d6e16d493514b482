// Abstract interface for share protocol operations. Concrete backends (e.g., libsmb2)
// implement this API so the engines stay decoupled from the wire protocol.
// A client is stateful and single-threaded: connect -> authenticate -> attachShare,
// then file operations against the attached share until disconnect().
#pragma once
#include "SmbTypes.hpp"
#include <memory>

namespace smblite {

enum class OpenMode {
    Read,       // existing file, read-only
    Overwrite,  // create or truncate, write-only
    CreateNew   // exclusive create, fails if the path exists
};

// Open remote file handle. Closed on destruction.
class RemoteFile {
public:
    virtual ~RemoteFile() = default;

    // Returns bytes read, 0 at EOF, -1 on error (err filled).
    virtual long long read(char* buf, std::size_t len, std::string& err) = 0;

    // Returns bytes written (may be short), -1 on error (err filled).
    virtual long long write(const char* buf, std::size_t len, std::string& err) = 0;

    // Position the read/write offset from the start of the file.
    virtual bool skip(std::uint64_t offset, std::string& err) = 0;

    // Size reported by the server when the handle was opened.
    virtual std::uint64_t size() const = 0;
};

class SmbClient {
public:
    virtual ~SmbClient() = default;

    // Session establishment, in this order
    virtual bool connect(const std::string& server, std::string& err) = 0;
    // A failure that leaves isConnected() false is a transport or negotiate
    // failure, not a rejected logon.
    virtual bool authenticate(const Credentials& cred, std::string& err) = 0;
    virtual bool attachShare(const std::string& share, std::string& err) = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    // Directory listing of a share-relative path ("" is the share root).
    // Never returns the "." and ".." pseudo entries.
    virtual bool list(const std::string& remote_path,
                      std::vector<FileInfo>& out,
                      std::string& err) = 0;

    // Detailed metadata. Returns true if it exists; err stays empty if it does not.
    virtual bool stat(const std::string& remote_path,
                      FileInfo& info,
                      std::string& err) = 0;

    // Check existence (leave err empty if "does not exist")
    virtual bool exists(const std::string& remote_path,
                        bool& isDir,
                        std::string& err) = 0;

    virtual bool open(const std::string& remote_path,
                      OpenMode mode,
                      std::unique_ptr<RemoteFile>& out,
                      std::string& err) = 0;

    // Remote file/folder operations
    virtual bool removeFile(const std::string& remote_path,
                            std::string& err) = 0;

    virtual bool removeDirectoryRecursive(const std::string& remote_dir,
                                          std::string& err) = 0;

    virtual bool makeDirectory(const std::string& remote_dir,
                               std::string& err) = 0;

    virtual bool renameDirectory(const std::string& from,
                                 const std::string& to,
                                 std::string& err) = 0;

    bool fileExists(const std::string& remote_path, std::string& err) {
        bool isDir = false;
        return exists(remote_path, isDir, err) && !isDir;
    }

    bool folderExists(const std::string& remote_path, std::string& err) {
        bool isDir = false;
        return exists(remote_path, isDir, err) && isDir;
    }
};

// Creates fresh, unconnected clients of one backend type.
class SmbClientFactory {
public:
    virtual ~SmbClientFactory() = default;
    virtual std::unique_ptr<SmbClient> create() = 0;
};

} // namespace smblite
