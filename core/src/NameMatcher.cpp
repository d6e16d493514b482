#include "smblite/NameMatcher.hpp"
#include <algorithm>
#include <cctype>

namespace smblite {

namespace {

std::string lower(const std::string& s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });
    return out;
}

// Whole-string glob match; '*' spans any run, '?' exactly one character.
bool globMatch(const std::string& text, const std::string& pattern) {
    std::size_t t = 0, p = 0;
    std::size_t starP = std::string::npos, starT = 0;
    while (t < text.size()) {
        if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == text[t])) {
            ++t;
            ++p;
        } else if (p < pattern.size() && pattern[p] == '*') {
            starP = p++;
            starT = t;
        } else if (starP != std::string::npos) {
            p = starP + 1;
            t = ++starT;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') ++p;
    return p == pattern.size();
}

} // namespace

bool hasWildcards(const std::string& query) {
    return query.find_first_of("*?") != std::string::npos;
}

bool wildcardMatch(const std::string& name, const std::string& query) {
    const std::string n = lower(name);
    const std::string q = lower(query);
    if (!hasWildcards(q)) return n.find(q) != std::string::npos;

    // Matches anywhere in the name, like a plain query does.
    std::string pattern = q;
    if (pattern.front() != '*') pattern.insert(pattern.begin(), '*');
    if (pattern.back() != '*') pattern.push_back('*');
    return globMatch(n, pattern);
}

} // namespace smblite
