// Path helpers. Share-relative paths use '/' and have no leading separator.
#include "smblite/PathResolver.hpp"
#include <algorithm>
#include <cctype>
#include <vector>

namespace smblite {
namespace path {

namespace {

bool isSep(char c) { return c == '/' || c == '\\'; }

bool equalsIgnoreCase(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

std::vector<std::string> segments(const std::string& raw) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : raw) {
        if (isSep(c)) {
            if (!cur.empty() && cur != ".") out.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty() && cur != ".") out.push_back(cur);
    return out;
}

} // namespace

std::string shareName(const std::string& raw) {
    std::size_t start = 0;
    while (start < raw.size() && isSep(raw[start])) ++start;
    std::size_t end = start;
    while (end < raw.size() && !isSep(raw[end])) ++end;
    return raw.substr(start, end - start);
}

std::string normalize(const std::string& raw) {
    std::string out;
    for (const auto& s : segments(raw)) {
        if (!out.empty()) out.push_back('/');
        out += s;
    }
    return out;
}

std::string toShareRelative(const std::string& raw, const std::string& share) {
    const std::string normalized = normalize(raw);
    const std::string name = shareName(share);
    if (raw.empty() || !isSep(raw[0]) || name.empty()) return normalized;

    const std::size_t slash = normalized.find('/');
    const std::string first = normalized.substr(0, slash);
    if (!equalsIgnoreCase(first, name)) return normalized;
    return slash == std::string::npos ? std::string() : normalized.substr(slash + 1);
}

std::string join(const std::string& parent, const std::string& name) {
    const std::string p = normalize(parent);
    const std::string n = normalize(name);
    if (p.empty()) return n;
    if (n.empty()) return p;
    return p + "/" + n;
}

std::string parentOf(const std::string& p) {
    const std::string n = normalize(p);
    const std::size_t slash = n.rfind('/');
    return slash == std::string::npos ? std::string() : n.substr(0, slash);
}

std::string baseName(const std::string& p) {
    const std::string n = normalize(p);
    const std::size_t slash = n.rfind('/');
    return slash == std::string::npos ? n : n.substr(slash + 1);
}

std::size_t segmentCount(const std::string& p) {
    return segments(p).size();
}

bool isValidName(const std::string& name) {
    if (name.empty() || name == "." || name == "..") return false;
    return std::none_of(name.begin(), name.end(), isSep);
}

} // namespace path
} // namespace smblite
