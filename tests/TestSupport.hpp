// Shared test helpers: a mock share server with a client factory, engine
// options without backoff delays, and a scratch directory on the local disk.
#pragma once
#include "smblite/MockSmbClient.hpp"
#include "smblite/SessionFactory.hpp"
#include <atomic>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <sstream>

namespace smblite_test {

namespace fs = std::filesystem;

class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        std::random_device rd;
        std::ostringstream name;
        name << "smblite-test-" << rd() << "-" << counter++;
        path_ = fs::temp_directory_path() / name.str();
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string file(const std::string& name) const { return (path_ / name).string(); }
    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

inline std::string readLocal(const std::string& p) {
    std::ifstream in(p, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline void writeLocal(const std::string& p, const std::string& content) {
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    out << content;
}

// Deterministic, non-repeating-looking payload.
inline std::string payload(std::size_t n) {
    std::string s(n, '\0');
    for (std::size_t i = 0; i < n; ++i) s[i] = (char)('a' + (i * 7 + i / 26) % 26);
    return s;
}

inline smblite::EngineOptions fastOptions() {
    smblite::EngineOptions opt;
    opt.backoffBaseMs = 0;
    opt.chunkSize = 8;
    return opt;
}

inline smblite::ConnectionProfile guestProfile(const std::string& share = "docs") {
    smblite::ConnectionProfile p;
    p.server = "nas.local";
    p.share = share;
    return p;
}

struct MockFixture {
    std::shared_ptr<smblite::MockShareServer> server = std::make_shared<smblite::MockShareServer>();
    smblite::MockSmbClientFactory clients{server};
    smblite::SessionFactory sessions{clients};

    MockFixture() { server->addShare("docs"); }

    std::unique_ptr<smblite::Session> open(const smblite::ConnectionProfile& profile = guestProfile()) {
        std::unique_ptr<smblite::Session> s;
        smblite::Error err;
        if (!sessions.open(profile, s, err)) return nullptr;
        return s;
    }
};

} // namespace smblite_test
