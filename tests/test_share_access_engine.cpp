#include <catch2/catch.hpp>
#include "TestSupport.hpp"
#include "smblite/ShareAccessEngine.hpp"
#include <algorithm>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace smblite;
using namespace smblite_test;

namespace {

struct EngineFixture : MockFixture {
    ShareAccessEngine engine{clients, fastOptions()};

    EngineFixture() {
        server->addFile("docs", "readme.txt", "hello");
        server->addFile("docs", "reports/q1.pdf", "q1");
        server->addFile("docs", "reports/q2.pdf", "q2");
        server->addFile("docs", "reports/old/q4.pdf", "q4");
    }
};

} // namespace

TEST_CASE("testConnection succeeds only when every step does", "[engine]")
{
    EngineFixture fx;
    Error err;
    REQUIRE(fx.engine.testConnection(guestProfile(), err));
    REQUIRE(err.ok());

    SECTION("Unreachable")
    {
        fx.server->setReachable(false);
        REQUIRE_FALSE(fx.engine.testConnection(guestProfile(), err));
        REQUIRE(err.kind == ErrorKind::Connection);
    }

    SECTION("Wrong password")
    {
        fx.server->addUser("bob", "pw");
        ConnectionProfile p = guestProfile();
        p.username = "bob";
        p.password = "nope";
        REQUIRE_FALSE(fx.engine.testConnection(p, err));
        REQUIRE(err.kind == ErrorKind::Authentication);
    }

    SECTION("Unknown share")
    {
        REQUIRE_FALSE(fx.engine.testConnection(guestProfile("music"), err));
        REQUIRE(err.kind == ErrorKind::ShareUnavailable);
    }
    REQUIRE(fx.server->activeSessions() == 0);
}

TEST_CASE("listFiles accepts share-prefixed absolute paths", "[engine]")
{
    EngineFixture fx;
    std::vector<RemoteEntry> entries;
    Error err;

    REQUIRE(fx.engine.listFiles(guestProfile(), "", entries, err));
    REQUIRE(entries.size() == 2);
    REQUIRE(entries[0].name == "reports");
    REQUIRE(entries[0].isDirectory());
    REQUIRE(entries[1].path == "readme.txt");
    REQUIRE(entries[1].size == 5);

    REQUIRE(fx.engine.listFiles(guestProfile(), "/docs/reports", entries, err));
    REQUIRE(entries.size() == 3);
    REQUIRE(entries[0].path == "reports/old");

    REQUIRE_FALSE(fx.engine.listFiles(guestProfile(), "reports/missing", entries, err));
    REQUIRE(err.kind == ErrorKind::NotFound);
    REQUIRE(entries.empty());
}

TEST_CASE("listShares probes common share names", "[engine]")
{
    EngineFixture fx;
    fx.server->addShare("Data");
    fx.server->addShare("public");
    fx.server->addShare("secret-stuff");

    std::vector<std::string> shares;
    Error err;
    REQUIRE(fx.engine.listShares(guestProfile(""), shares, err));
    REQUIRE(shares == std::vector<std::string>{"Public", "Data"});
    REQUIRE(fx.server->activeSessions() == 0);

    fx.server->setReachable(false);
    REQUIRE_FALSE(fx.engine.listShares(guestProfile(""), shares, err));
    REQUIRE(err.kind == ErrorKind::Connection);
}

TEST_CASE("Engine search and cancellation", "[engine][search]")
{
    EngineFixture fx;
    SearchRequest req;
    req.query = "q?.pdf";
    std::vector<RemoteEntry> hits;
    Error err;

    SECTION("Full search")
    {
        REQUIRE(fx.engine.searchFiles(guestProfile(), "/docs", req, hits, err));
        REQUIRE(hits.size() == 3);
    }

    SECTION("cancelSearch with nothing running does not affect later searches")
    {
        fx.engine.cancelSearch();
        REQUIRE(fx.engine.searchFiles(guestProfile(), "", req, hits, err));
        REQUIRE(hits.size() == 3);
    }

    SECTION("cancelSearch during a search returns partial results")
    {
        int listings = 0;
        fx.server->setListHook([&](const std::string&) {
            if (++listings == 2) fx.engine.cancelSearch();
        });
        REQUIRE(fx.engine.searchFiles(guestProfile(), "", req, hits, err));
        REQUIRE(err.ok());
        REQUIRE(hits.empty());
        REQUIRE(listings <= 2);
    }

    SECTION("Caller-owned token")
    {
        CancellationToken cancel;
        cancel.cancel();
        REQUIRE(fx.engine.searchFiles(guestProfile(), "", req, cancel, hits, err));
        REQUIRE(hits.empty());
    }
}

TEST_CASE("Engine transfers", "[engine][transfer]")
{
    EngineFixture fx;
    TempDir tmp;
    Error err;

    SECTION("Download with progress")
    {
        std::uint64_t lastDone = 0;
        std::string lastItem;
        REQUIRE(fx.engine.downloadFile(guestProfile(), "/docs/reports/q1.pdf", tmp.file("q1.pdf"), err,
                                       [&](std::uint64_t done, std::uint64_t, const std::string& item) {
                                           lastDone = done;
                                           lastItem = item;
                                       }));
        REQUIRE(readLocal(tmp.file("q1.pdf")) == "q1");
        REQUIRE(lastDone == 2);
        REQUIRE(lastItem == "q1.pdf");
    }

    SECTION("Upload deletes the staged source")
    {
        writeLocal(tmp.file("new.txt"), "fresh");
        REQUIRE(fx.engine.uploadFile(guestProfile(), tmp.file("new.txt"), "reports/new.txt", err));
        REQUIRE(fx.server->fileContent("docs", "reports/new.txt") == "fresh");
        REQUIRE_FALSE(fs::exists(tmp.file("new.txt")));
    }

    SECTION("Upload to the share root is rejected")
    {
        writeLocal(tmp.file("new.txt"), "fresh");
        REQUIRE_FALSE(fx.engine.uploadFile(guestProfile(), tmp.file("new.txt"), "/docs", err));
        REQUIRE(err.kind == ErrorKind::InvalidArgument);
        REQUIRE(fs::exists(tmp.file("new.txt")));
    }

    SECTION("Folder download")
    {
        std::uint64_t files = 0;
        FolderProgress progress;
        progress.files = [&](std::uint64_t done, std::uint64_t, const std::string&) { files = done; };
        REQUIRE(fx.engine.downloadFolder(guestProfile(), "reports", tmp.file("r"), err, progress));
        REQUIRE(files == 3);
        REQUIRE(readLocal((tmp.path() / "r" / "old" / "q4.pdf").string()) == "q4");
    }
    REQUIRE(fx.server->activeSessions() == 0);
}

TEST_CASE("A throwing progress callback fails the operation and releases everything", "[engine][transfer]")
{
    EngineFixture fx;
    TempDir tmp;
    Error err;
    bool ok = true;

    REQUIRE_NOTHROW(ok = fx.engine.downloadFile(
                        guestProfile(), "readme.txt", tmp.file("readme.txt"), err,
                        [](std::uint64_t, std::uint64_t, const std::string&) {
                            throw std::runtime_error("disk quota reached");
                        }));
    REQUIRE_FALSE(ok);
    REQUIRE(err.kind == ErrorKind::Protocol);
    REQUIRE(err.describe().find("disk quota reached") != std::string::npos);
    REQUIRE(fx.engine.activeTransfers() == 0);
    REQUIRE_FALSE(fx.engine.lock().busy());
    REQUIRE(fx.server->activeSessions() == 0);

    // The engine stays usable.
    REQUIRE(fx.engine.downloadFile(guestProfile(), "readme.txt", tmp.file("readme.txt"), err));
    REQUIRE(readLocal(tmp.file("readme.txt")) == "hello");
}

TEST_CASE("cancelTransfers cuts a backoff wait short", "[engine][cancel]")
{
    MockFixture fx;
    fx.server->addFile("docs", "slow.bin", payload(64));
    fx.server->failReads("docs", "slow.bin", 8, 10);
    EngineOptions opt = fastOptions();
    opt.backoffBaseMs = 10000;
    ShareAccessEngine engine(fx.clients, opt);
    TempDir tmp;

    std::thread canceller([&] {
        // Wait until the download holds the lock, then give it time to fail once.
        while (!engine.lock().busy()) std::this_thread::sleep_for(std::chrono::milliseconds(1));
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        engine.cancelTransfers();
    });
    const auto start = std::chrono::steady_clock::now();
    Error err;
    const bool ok = engine.downloadFile(guestProfile(), "slow.bin", tmp.file("slow.bin"), err);
    const auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    REQUIRE_FALSE(ok);
    REQUIRE(err.kind == ErrorKind::Cancelled);
    REQUIRE(elapsed < std::chrono::seconds(5));
    REQUIRE_FALSE(engine.lock().busy());
}

TEST_CASE("Delete, create and exists", "[engine]")
{
    EngineFixture fx;
    Error err;
    bool exists = false;

    SECTION("fileExists")
    {
        REQUIRE(fx.engine.fileExists(guestProfile(), "/docs/readme.txt", exists, err));
        REQUIRE(exists);
        REQUIRE(fx.engine.fileExists(guestProfile(), "reports", exists, err));
        REQUIRE_FALSE(exists);
        REQUIRE(fx.engine.fileExists(guestProfile(), "missing.txt", exists, err));
        REQUIRE_FALSE(exists);
    }

    SECTION("deleteFile removes files and whole folders")
    {
        REQUIRE(fx.engine.deleteFile(guestProfile(), "readme.txt", err));
        REQUIRE_FALSE(fx.server->hasFile("docs", "readme.txt"));
        REQUIRE(fx.engine.deleteFile(guestProfile(), "reports", err));
        REQUIRE_FALSE(fx.server->hasDirectory("docs", "reports"));
        REQUIRE_FALSE(fx.server->hasFile("docs", "reports/old/q4.pdf"));

        REQUIRE_FALSE(fx.engine.deleteFile(guestProfile(), "reports", err));
        REQUIRE(err.kind == ErrorKind::NotFound);
        REQUIRE_FALSE(fx.engine.deleteFile(guestProfile(), "/docs", err));
        REQUIRE(err.kind == ErrorKind::InvalidArgument);
    }

    SECTION("createDirectory")
    {
        REQUIRE(fx.engine.createDirectory(guestProfile(), "reports", "2025", err));
        REQUIRE(fx.server->hasDirectory("docs", "reports/2025"));

        REQUIRE_FALSE(fx.engine.createDirectory(guestProfile(), "reports", "2025", err));
        REQUIRE(err.kind == ErrorKind::AlreadyExists);
        REQUIRE_FALSE(fx.engine.createDirectory(guestProfile(), "", "readme.txt", err));
        REQUIRE(err.kind == ErrorKind::AlreadyExists);
        REQUIRE_FALSE(fx.engine.createDirectory(guestProfile(), "nowhere", "x", err));
        REQUIRE(err.kind == ErrorKind::NotFound);
        REQUIRE_FALSE(fx.engine.createDirectory(guestProfile(), "", "..", err));
        REQUIRE(err.kind == ErrorKind::InvalidArgument);
    }

    SECTION("renameFile")
    {
        REQUIRE(fx.engine.renameFile(guestProfile(), "/docs/reports/q1.pdf", "q1-final.pdf", err));
        REQUIRE(fx.server->fileContent("docs", "reports/q1-final.pdf") == "q1");
        REQUIRE_FALSE(fx.server->hasFile("docs", "reports/q1.pdf"));
        REQUIRE_FALSE(fx.engine.renameFile(guestProfile(), "reports/q2.pdf", "q1-final.pdf", err));
        REQUIRE(err.kind == ErrorKind::AlreadyExists);
    }
    REQUIRE(fx.server->activeSessions() == 0);
}

TEST_CASE("Concurrent callers never hold two sessions at once", "[engine][concurrency]")
{
    EngineFixture fx;
    fx.server->setLatency(std::chrono::milliseconds(1));

    std::mutex mtx;
    int depth = 0;
    int maxDepth = 0;
    int acquisitions = 0;
    fx.engine.lock().setTraceHook([&](const char*, bool acquired) {
        std::lock_guard<std::mutex> lk(mtx);
        depth += acquired ? 1 : -1;
        maxDepth = std::max(maxDepth, depth);
        if (acquired) ++acquisitions;
    });

    std::vector<std::thread> threads;
    std::atomic<int> failures{0};
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&, t] {
            TempDir tmp;
            for (int i = 0; i < 5; ++i) {
                Error err;
                std::vector<RemoteEntry> entries;
                bool exists = false;
                bool ok = fx.engine.listFiles(guestProfile(), "reports", entries, err) &&
                          fx.engine.fileExists(guestProfile(), "readme.txt", exists, err) &&
                          fx.engine.downloadFile(guestProfile(), "reports/q2.pdf",
                                                 tmp.file("q2-" + std::to_string(t)), err);
                if (!ok) ++failures;
            }
        });
    }
    for (auto& th : threads) th.join();

    REQUIRE(failures.load() == 0);
    REQUIRE(acquisitions == 60);
    REQUIRE(maxDepth == 1);
    REQUIRE(depth == 0);
    REQUIRE(fx.server->maxActiveSessions() == 1);
    REQUIRE(fx.server->activeSessions() == 0);
}
