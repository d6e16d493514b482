// Basic types shared between callers and the core for share sessions and metadata.
// Plain value structures: the core never mutates what callers pass in.
#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <functional>

namespace smblite {

// Where and as whom to connect. Owned by the caller.
struct ConnectionProfile {
    std::string server;    // host name or IP
    std::string share;     // share name; leading separators and sub-paths are tolerated
    std::string username;
    std::string password;
    std::string domain;
};

// Identity handed to the protocol client. Anonymous means guest access.
struct Credentials {
    bool        anonymous = false;
    std::string username;
    std::string password;
    std::string domain;
};

// Raw directory entry as reported by a protocol client.
struct FileInfo {
    std::string   name;      // base name
    bool          is_dir = false;
    std::uint64_t size  = 0; // bytes
    std::uint64_t mtime = 0; // epoch (seconds)
};

// Listing/search result. Path is relative to the share root, '/'-separated.
struct RemoteEntry {
    enum class Kind { File, Directory };

    std::string   name;
    std::string   path;
    Kind          kind = Kind::File;
    std::uint64_t size  = 0;
    std::uint64_t mtime = 0;

    bool isDirectory() const { return kind == Kind::Directory; }
};

enum class SearchType {
    All,
    FilesOnly,
    DirectoriesOnly
};

struct SearchRequest {
    std::string query;              // may contain '*' and '?'
    SearchType  type = SearchType::All;
    bool        includeSubfolders = true;
};

// Progress sink: (bytes or items done, total, current item name).
using ProgressCB = std::function<void(std::uint64_t /*done*/,
                                      std::uint64_t /*total*/,
                                      const std::string& /*item*/)>;

// Folder downloads report per-file progress and byte progress of the current file.
struct FolderProgress {
    ProgressCB files;
    ProgressCB bytes;
};

// Tuning knobs of the engine.
struct EngineOptions {
    int           maxAttempts = 3;        // per transfer, first attempt included
    int           backoffBaseMs = 1000;   // sleep backoffBaseMs * attempt between attempts
    std::size_t   chunkSize = 64 * 1024;  // stream copy buffer
    bool          deleteUploadedSource = true;
    int           timeoutSeconds = 20;    // protocol request timeout, 0 = backend default
};

} // namespace smblite
