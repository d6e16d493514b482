#include <catch2/catch.hpp>
#include "TestSupport.hpp"
#include "smblite/TransferEngine.hpp"
#include <chrono>
#include <thread>

using namespace smblite;
using namespace smblite_test;

TEST_CASE("Download that fails twice resumes from the partial file", "[transfer][download]")
{
    MockFixture fx;
    TempDir tmp;
    const std::string content = payload(100);
    fx.server->addFile("docs", "reports/big.bin", content);
    fx.server->failReads("docs", "reports/big.bin", 30, 2);

    TransferEngine engine(fastOptions());
    auto session = fx.open();
    REQUIRE(session);

    std::uint64_t lastDone = 0, lastTotal = 0;
    Error err;
    const std::string local = tmp.file("big.bin");
    REQUIRE(engine.download(*session, "reports/big.bin", local,
                            [&](std::uint64_t done, std::uint64_t total, const std::string&) {
                                lastDone = done;
                                lastTotal = total;
                            },
                            nullptr, err));
    REQUIRE(err.ok());
    REQUIRE(readLocal(local) == content);
    REQUIRE(fx.server->readStartOffsets("docs", "reports/big.bin") ==
            std::vector<std::uint64_t>{0, 30, 60});
    REQUIRE(lastDone == 100);
    REQUIRE(lastTotal == 100);
}

TEST_CASE("Download reconnects when the transport dropped", "[transfer][download]")
{
    MockFixture fx;
    TempDir tmp;
    const std::string content = payload(64);
    fx.server->addFile("docs", "a.bin", content);
    fx.server->failReads("docs", "a.bin", 16, 1);
    fx.server->setDropConnectionOnFault(true);

    TransferEngine engine(fastOptions());
    auto session = fx.open();
    REQUIRE(session);
    Error err;
    REQUIRE(engine.download(*session, "a.bin", tmp.file("a.bin"), {}, nullptr, err));
    REQUIRE(readLocal(tmp.file("a.bin")) == content);
    REQUIRE(fx.server->connectCount() == 2);
    REQUIRE(fx.server->maxActiveSessions() == 1);
    REQUIRE(fx.server->readStartOffsets("docs", "a.bin") == std::vector<std::uint64_t>{0, 16});
}

TEST_CASE("Download gives up after three attempts", "[transfer][download]")
{
    MockFixture fx;
    TempDir tmp;
    fx.server->addFile("docs", "flaky.bin", payload(100));
    fx.server->failReads("docs", "flaky.bin", 10, 10);

    TransferEngine engine(fastOptions());
    auto session = fx.open();
    REQUIRE(session);
    Error err;
    const std::string local = tmp.file("flaky.bin");
    REQUIRE_FALSE(engine.download(*session, "flaky.bin", local, {}, nullptr, err));
    REQUIRE(err.kind == ErrorKind::Transfer);
    REQUIRE_FALSE(err.cause.empty());
    REQUIRE(fx.server->readStartOffsets("docs", "flaky.bin").size() == 3);
    // The partial file is kept as a resume point.
    REQUIRE(readLocal(local).size() == 30);
}

TEST_CASE("Download of a missing file fails without retrying", "[transfer][download]")
{
    MockFixture fx;
    TempDir tmp;
    fx.server->addDirectory("docs", "folder");
    TransferEngine engine(fastOptions());
    auto session = fx.open();
    REQUIRE(session);
    Error err;

    REQUIRE_FALSE(engine.download(*session, "nope.bin", tmp.file("x"), {}, nullptr, err));
    REQUIRE(err.kind == ErrorKind::NotFound);

    SECTION("A directory is not a downloadable file")
    {
        REQUIRE_FALSE(engine.download(*session, "folder", tmp.file("x"), {}, nullptr, err));
        REQUIRE(err.kind == ErrorKind::NotFound);
    }
    REQUIRE_FALSE(fs::exists(tmp.file("x")));
}

TEST_CASE("A fresh download overwrites a stale local file", "[transfer][download]")
{
    MockFixture fx;
    TempDir tmp;
    fx.server->addFile("docs", "small.txt", "new");
    writeLocal(tmp.file("small.txt"), "old content that is longer");

    TransferEngine engine(fastOptions());
    auto session = fx.open();
    REQUIRE(session);
    Error err;
    REQUIRE(engine.download(*session, "small.txt", tmp.file("small.txt"), {}, nullptr, err));
    REQUIRE(readLocal(tmp.file("small.txt")) == "new");
}

TEST_CASE("A retry after a failed open does not resume from a stale local file", "[transfer][download]")
{
    MockFixture fx;
    TempDir tmp;
    const std::string content = "NEW-CONTENT-0123456789";
    fx.server->addFile("docs", "report.txt", content);
    fx.server->failOpens("docs", "report.txt", 1);
    const std::string local = tmp.file("report.txt");
    writeLocal(local, "OLD-STALE");

    TransferEngine engine(fastOptions());
    auto session = fx.open();
    REQUIRE(session);
    Error err;
    REQUIRE(engine.download(*session, "report.txt", local, {}, nullptr, err));
    REQUIRE(readLocal(local) == content);
    REQUIRE(fx.server->readStartOffsets("docs", "report.txt") == std::vector<std::uint64_t>{0});
}

TEST_CASE("A partial file longer than the remote file is discarded", "[transfer][download]")
{
    MockFixture fx;
    TempDir tmp;
    fx.server->addFile("docs", "log.txt", payload(100));
    fx.server->failReads("docs", "log.txt", 30, 1);
    const std::string shorter = payload(20);

    TransferEngine engine(fastOptions());
    auto session = fx.open();
    REQUIRE(session);
    // The file shrinks on the server while the first attempt is running.
    bool replaced = false;
    auto progress = [&](std::uint64_t done, std::uint64_t, const std::string&) {
        if (!replaced && done == 30) {
            fx.server->addFile("docs", "log.txt", shorter);
            replaced = true;
        }
    };
    Error err;
    const std::string local = tmp.file("log.txt");
    REQUIRE(engine.download(*session, "log.txt", local, progress, nullptr, err));
    REQUIRE(replaced);
    REQUIRE(readLocal(local) == shorter);
    REQUIRE(fx.server->readStartOffsets("docs", "log.txt") == std::vector<std::uint64_t>{0, 0});
}

TEST_CASE("A stream that ends before the reported size is retried", "[transfer][download]")
{
    MockFixture fx;
    TempDir tmp;
    const std::string content = payload(40);
    fx.server->addFile("docs", "short.bin", content);
    fx.server->setReportedSize("docs", "short.bin", 50);

    TransferEngine engine(fastOptions());
    auto session = fx.open();
    REQUIRE(session);
    Error err;
    const std::string local = tmp.file("short.bin");
    REQUIRE_FALSE(engine.download(*session, "short.bin", local, {}, nullptr, err));
    REQUIRE(err.kind == ErrorKind::Transfer);
    REQUIRE(err.describe().find("ended early") != std::string::npos);
    // Every retry resumes after the bytes already on disk.
    REQUIRE(fx.server->readStartOffsets("docs", "short.bin") ==
            std::vector<std::uint64_t>{0, 40, 40});
    REQUIRE(readLocal(local) == content);
}

TEST_CASE("Upload re-sends the whole file on every attempt", "[transfer][upload]")
{
    MockFixture fx;
    TempDir tmp;
    const std::string content = payload(50);
    const std::string local = tmp.file("up.bin");
    writeLocal(local, content);
    fx.server->failWrites("docs", "up.bin", 20, 2);

    TransferEngine engine(fastOptions());
    auto session = fx.open();
    REQUIRE(session);
    Error err;
    REQUIRE(engine.upload(*session, local, "up.bin", {}, nullptr, err));
    REQUIRE(fx.server->fileContent("docs", "up.bin") == content);
    REQUIRE(fx.server->writeHandleBytes("docs", "up.bin") == std::vector<std::uint64_t>{20, 20, 50});
    REQUIRE_FALSE(fs::exists(local));
}

TEST_CASE("Upload that runs out of attempts keeps the local source", "[transfer][upload]")
{
    MockFixture fx;
    TempDir tmp;
    const std::string local = tmp.file("up.bin");
    writeLocal(local, payload(40));
    fx.server->failWrites("docs", "up.bin", 5, 10);

    TransferEngine engine(fastOptions());
    auto session = fx.open();
    REQUIRE(session);
    Error err;
    REQUIRE_FALSE(engine.upload(*session, local, "up.bin", {}, nullptr, err));
    REQUIRE(err.kind == ErrorKind::Transfer);
    REQUIRE(fs::exists(local));
    REQUIRE(fx.server->writeHandleBytes("docs", "up.bin").size() == 3);
}

TEST_CASE("Upload source deletion can be turned off", "[transfer][upload]")
{
    MockFixture fx;
    TempDir tmp;
    const std::string local = tmp.file("keep.txt");
    writeLocal(local, "keep me");
    EngineOptions opt = fastOptions();
    opt.deleteUploadedSource = false;

    TransferEngine engine(opt);
    auto session = fx.open();
    REQUIRE(session);
    Error err;
    REQUIRE(engine.upload(*session, local, "keep.txt", {}, nullptr, err));
    REQUIRE(fs::exists(local));
    REQUIRE(fx.server->fileContent("docs", "keep.txt") == "keep me");
}

TEST_CASE("Upload of a missing local file fails with NotFound", "[transfer][upload]")
{
    MockFixture fx;
    TempDir tmp;
    TransferEngine engine(fastOptions());
    auto session = fx.open();
    REQUIRE(session);
    Error err;
    REQUIRE_FALSE(engine.upload(*session, tmp.file("absent"), "x.bin", {}, nullptr, err));
    REQUIRE(err.kind == ErrorKind::NotFound);
    REQUIRE_FALSE(fx.server->hasFile("docs", "x.bin"));
}

TEST_CASE("Cancelling interrupts the backoff wait", "[transfer][cancel]")
{
    MockFixture fx;
    TempDir tmp;
    fx.server->addFile("docs", "slow.bin", payload(32));
    fx.server->failReads("docs", "slow.bin", 4, 10);

    EngineOptions opt = fastOptions();
    opt.backoffBaseMs = 10000;
    TransferEngine engine(opt);
    auto session = fx.open();
    REQUIRE(session);

    CancellationToken cancel;
    std::thread canceller([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        cancel.cancel();
    });
    const auto start = std::chrono::steady_clock::now();
    Error err;
    const bool ok = engine.download(*session, "slow.bin", tmp.file("slow.bin"), {}, &cancel, err);
    const auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    REQUIRE_FALSE(ok);
    REQUIRE(err.kind == ErrorKind::Cancelled);
    REQUIRE(elapsed < std::chrono::seconds(5));
    REQUIRE(fx.server->readStartOffsets("docs", "slow.bin").size() == 1);
}
