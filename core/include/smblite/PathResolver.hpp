// Pure helpers that turn user-supplied share names and paths into the
// share-relative, '/'-separated form used by the engines. No I/O.
#pragma once
#include <string>
#include <cstddef>

namespace smblite {
namespace path {

// "\\share\sub" or "/share/sub" -> "share"
std::string shareName(const std::string& raw);

// '\' -> '/', repeated separators collapsed, "." segments dropped,
// leading/trailing separators removed. The share root is "".
std::string normalize(const std::string& raw);

// Normalizes raw; when raw is absolute and starts with the share name
// (case-insensitive), that leading segment is dropped.
std::string toShareRelative(const std::string& raw, const std::string& share);

std::string join(const std::string& parent, const std::string& name);
std::string parentOf(const std::string& path);
std::string baseName(const std::string& path);
std::size_t segmentCount(const std::string& path);

// A single path component: non-empty, not "." or "..", no separators.
bool isValidName(const std::string& name);

} // namespace path
} // namespace smblite
