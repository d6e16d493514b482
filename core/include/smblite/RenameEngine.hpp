// Rename for directories (native primitive) and files (copy, verify, delete source).
#pragma once
#include "Error.hpp"
#include "SmbClient.hpp"

namespace smblite {

class RenameEngine {
public:
    explicit RenameEngine(std::size_t chunkSize) : chunkSize_(chunkSize ? chunkSize : 64 * 1024) {}

    // Renames old_path to the sibling new_name. NotFound when the source does
    // not exist, AlreadyExists when the target does.
    bool rename(SmbClient& client, const std::string& old_path,
                const std::string& new_name, Error& err);

    bool renameDirectory(SmbClient& client, const std::string& from,
                         const std::string& to, Error& err);

    // Copies from to to (exclusive create), checks the copied byte count against
    // the source size and only then deletes from. On failure the source is left
    // alone and a partially written target is removed.
    bool renameFile(SmbClient& client, const std::string& from,
                    const std::string& to, Error& err);

private:
    bool targetFree(SmbClient& client, const std::string& to, Error& err);
    bool copyFile(SmbClient& client, const std::string& from,
                  const std::string& to, Error& err);
    void discardTarget(SmbClient& client, const std::string& to);

    std::size_t chunkSize_;
};

} // namespace smblite
