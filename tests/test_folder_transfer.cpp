#include <catch2/catch.hpp>
#include "TestSupport.hpp"
#include "smblite/FolderTransferEngine.hpp"

using namespace smblite;
using namespace smblite_test;

namespace {

void populate(MockShareServer& server) {
    server.addFile("docs", "proj/a.txt", "alpha");
    server.addFile("docs", "proj/b/c.txt", payload(40));
    server.addFile("docs", "proj/b/d/e.txt", "echo");
    server.addDirectory("docs", "proj/empty");
    server.addFile("docs", "outside.txt", "not part of proj");
}

} // namespace

TEST_CASE("Folder download mirrors the remote tree", "[folder]")
{
    MockFixture fx;
    populate(*fx.server);
    TempDir tmp;
    auto session = fx.open();
    REQUIRE(session);

    TransferEngine files(fastOptions());
    FolderTransferEngine engine(files);
    REQUIRE(engine.countFiles(session->client(), "proj") == 3);

    std::vector<std::string> reported;
    std::uint64_t lastTotal = 0;
    FolderProgress progress;
    progress.files = [&](std::uint64_t done, std::uint64_t total, const std::string& item) {
        reported.push_back(item);
        lastTotal = total;
        REQUIRE(done == reported.size());
    };

    const fs::path dest = tmp.path() / "out";
    Error err;
    REQUIRE(engine.downloadFolder(*session, "proj", dest.string(), progress, nullptr, err));
    REQUIRE(readLocal((dest / "a.txt").string()) == "alpha");
    REQUIRE(readLocal((dest / "b" / "c.txt").string()) == payload(40));
    REQUIRE(readLocal((dest / "b" / "d" / "e.txt").string()) == "echo");
    REQUIRE(fs::is_directory(dest / "empty"));
    REQUIRE_FALSE(fs::exists(dest / "outside.txt"));
    REQUIRE(reported.size() == 3);
    REQUIRE(lastTotal == 3);
}

TEST_CASE("A file that keeps failing aborts the folder download", "[folder]")
{
    MockFixture fx;
    populate(*fx.server);
    fx.server->failReads("docs", "proj/b/c.txt", 0, 10);
    TempDir tmp;
    auto session = fx.open();
    REQUIRE(session);

    TransferEngine files(fastOptions());
    FolderTransferEngine engine(files);
    const fs::path dest = tmp.path() / "out";
    Error err;
    REQUIRE_FALSE(engine.downloadFolder(*session, "proj", dest.string(), {}, nullptr, err));
    REQUIRE(err.kind == ErrorKind::Transfer);
    REQUIRE(err.describe().find("proj/b/c.txt") != std::string::npos);
    // Directories are listed first, so b/d/e.txt was done before c.txt failed.
    REQUIRE(readLocal((dest / "b" / "d" / "e.txt").string()) == "echo");
    REQUIRE(fx.server->readStartOffsets("docs", "proj/b/c.txt").size() == 3);
}

TEST_CASE("Folder download argument and cancellation errors", "[folder]")
{
    MockFixture fx;
    populate(*fx.server);
    TempDir tmp;
    auto session = fx.open();
    REQUIRE(session);

    TransferEngine files(fastOptions());
    FolderTransferEngine engine(files);
    Error err;

    SECTION("Missing remote folder")
    {
        REQUIRE_FALSE(engine.downloadFolder(*session, "nope", tmp.file("out"), {}, nullptr, err));
        REQUIRE(err.kind == ErrorKind::NotFound);
    }

    SECTION("A file is not a folder")
    {
        REQUIRE_FALSE(engine.downloadFolder(*session, "outside.txt", tmp.file("out"), {}, nullptr, err));
        REQUIRE(err.kind == ErrorKind::NotFound);
    }

    SECTION("Cancelled before the first file")
    {
        CancellationToken cancel;
        cancel.cancel();
        REQUIRE_FALSE(engine.downloadFolder(*session, "proj", tmp.file("out"), {}, &cancel, err));
        REQUIRE(err.kind == ErrorKind::Cancelled);
        REQUIRE_FALSE(fs::exists(fs::path(tmp.file("out")) / "a.txt"));
    }
}
