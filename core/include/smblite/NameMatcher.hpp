// Search name matching: plain queries are case-insensitive substring checks,
// queries with '*' or '?' are wildcard patterns matched anywhere in the name.
#pragma once
#include <string>

namespace smblite {

bool hasWildcards(const std::string& query);

// wildcardMatch("Report2024.pdf", "*.pdf") == true
// wildcardMatch("readme.txt", "read")      == true
// wildcardMatch("readme.txt", "REA?ME")    == true
bool wildcardMatch(const std::string& name, const std::string& query);

} // namespace smblite
