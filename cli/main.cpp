// Command-line entry point: parse the command, build a profile and run one engine operation.
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDateTime>
#include <QTextStream>
#include <cstdio>
#include <cstdlib>
#include "CliSettings.hpp"
#include "smblite/ShareAccessEngine.hpp"
#include "smblite/Smb2Client.hpp"

namespace {

enum ExitCode { ExitOk = 0, ExitFailed = 1, ExitUsage = 2 };

QTextStream& out() {
    static QTextStream s(stdout);
    return s;
}

QTextStream& errs() {
    static QTextStream s(stderr);
    return s;
}

int fail(const smblite::Error& err) {
    errs() << "error [" << smblite::errorKindName(err.kind) << "]: "
           << QString::fromStdString(err.describe()) << Qt::endl;
    return ExitFailed;
}

int usage(const QCommandLineParser& parser, const QString& msg) {
    errs() << msg << "\n\n" << parser.helpText();
    errs().flush();
    return ExitUsage;
}

QString humanSize(std::uint64_t bytes) {
    static const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double v = (double)bytes;
    int u = 0;
    while (v >= 1024.0 && u < 4) {
        v /= 1024.0;
        ++u;
    }
    return u == 0 ? QString("%1 B").arg(bytes) : QString("%1 %2").arg(v, 0, 'f', 1).arg(units[u]);
}

void printEntry(const smblite::RemoteEntry& e, bool withPath) {
    const QString when = e.mtime
        ? QDateTime::fromSecsSinceEpoch((qint64)e.mtime).toString("yyyy-MM-dd HH:mm")
        : QString(16, QChar(' '));
    out() << (e.isDirectory() ? "d " : "- ")
          << QString("%1").arg(e.isDirectory() ? QString() : humanSize(e.size), 10) << "  "
          << when << "  "
          << QString::fromStdString(withPath ? e.path : e.name) << "\n";
}

// Single-line progress on stderr.
smblite::ProgressCB byteProgress() {
    return [](std::uint64_t done, std::uint64_t total, const std::string& item) {
        std::fprintf(stderr, "\r%s  %s / %s", item.c_str(),
                     humanSize(done).toUtf8().constData(),
                     humanSize(total).toUtf8().constData());
        if (done >= total) std::fprintf(stderr, "\n");
        std::fflush(stderr);
    };
}

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("smblite");
    QCoreApplication::setOrganizationName("smblite");
    QCoreApplication::setApplicationVersion("0.1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription(
        "Access SMB network shares.\n\n"
        "Commands:\n"
        "  test                      check connect, logon and share attach\n"
        "  shares                    list commonly named shares that can be attached\n"
        "  ls [path]                 list a folder\n"
        "  find <query> [path]       search names ('*' and '?' allowed)\n"
        "  get <remote> <local>      download a file (resumes on retry)\n"
        "  getdir <remote> <local>   download a folder tree\n"
        "  put <local> <remote>      upload a file\n"
        "  rm <path>                 delete a file or folder\n"
        "  mv <path> <new-name>      rename within the same folder\n"
        "  mkdir <parent> <name>     create a folder\n"
        "  exists <path>             exit 0 if the file exists\n"
        "  profiles                  list saved profiles\n"
        "  save-profile <name>       save server/share/user/domain\n"
        "  remove-profile <name>     delete a saved profile");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption profileOpt({"p", "profile"}, "Use a saved profile.", "name");
    QCommandLineOption serverOpt({"s", "server"}, "Server host name or address.", "host");
    QCommandLineOption shareOpt({"S", "share"}, "Share name.", "share");
    QCommandLineOption userOpt({"u", "user"}, "User name (empty for guest).", "user");
    QCommandLineOption domainOpt({"d", "domain"}, "Logon domain.", "domain");
    QCommandLineOption passOpt("password",
                               "Password. Prefer the SMBLITE_PASSWORD environment variable.",
                               "password");
    QCommandLineOption typeOpt("type", "find: all, files or dirs.", "type", "all");
    QCommandLineOption shallowOpt("no-recurse", "find: do not descend into subfolders.");
    QCommandLineOption quietOpt({"q", "quiet"}, "No progress output.");
    parser.addOptions({profileOpt, serverOpt, shareOpt, userOpt, domainOpt, passOpt,
                       typeOpt, shallowOpt, quietOpt});
    parser.addPositionalArgument("command", "Command to run (see above).");
    parser.addPositionalArgument("args", "Command arguments.", "[args...]");
    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) return usage(parser, "missing command");
    const QString cmd = args.first();
    auto arg = [&](int i) { return args.value(i + 1).toStdString(); };
    auto need = [&](int n) { return args.size() - 1 >= n; };

    // Profile: saved entry first, then command-line overrides.
    SavedProfile saved;
    if (parser.isSet(profileOpt) && !CliSettings::findProfile(parser.value(profileOpt), saved)) {
        errs() << "unknown profile: " << parser.value(profileOpt) << Qt::endl;
        return ExitUsage;
    }
    smblite::ConnectionProfile profile = saved.profile;
    if (parser.isSet(serverOpt)) profile.server = parser.value(serverOpt).toStdString();
    if (parser.isSet(shareOpt)) profile.share = parser.value(shareOpt).toStdString();
    if (parser.isSet(userOpt)) profile.username = parser.value(userOpt).toStdString();
    if (parser.isSet(domainOpt)) profile.domain = parser.value(domainOpt).toStdString();
    if (parser.isSet(passOpt)) {
        profile.password = parser.value(passOpt).toStdString();
    } else if (const char* pw = std::getenv("SMBLITE_PASSWORD")) {
        profile.password = pw;
    }

    if (cmd == "profiles") {
        for (const auto& e : CliSettings::loadProfiles()) {
            out() << e.name << "\t" << QString::fromStdString(e.profile.server) << "/"
                  << QString::fromStdString(e.profile.share);
            if (!e.profile.username.empty()) out() << "\t" << QString::fromStdString(e.profile.username);
            out() << "\n";
        }
        return ExitOk;
    }
    if (cmd == "save-profile") {
        if (!need(1)) return usage(parser, "save-profile needs a name");
        SavedProfile e;
        e.name = args.at(1);
        e.profile = profile;
        e.profile.password.clear();
        CliSettings::saveProfile(e);
        return ExitOk;
    }
    if (cmd == "remove-profile") {
        if (!need(1)) return usage(parser, "remove-profile needs a name");
        return CliSettings::removeProfile(args.at(1)) ? ExitOk : ExitFailed;
    }

    if (profile.server.empty()) return usage(parser, "no server given (--server or --profile)");
    if (profile.share.empty() && cmd != "shares") return usage(parser, "no share given (--share or --profile)");

    const smblite::EngineOptions opt = CliSettings::loadEngineOptions();
    smblite::Smb2ClientFactory clients(opt.timeoutSeconds);
    smblite::ShareAccessEngine engine(clients, opt);
    const bool quiet = parser.isSet(quietOpt);
    smblite::Error err;

    if (cmd == "test") {
        if (!engine.testConnection(profile, err)) return fail(err);
        out() << "ok\n";
        return ExitOk;
    }
    if (cmd == "shares") {
        std::vector<std::string> shares;
        if (!engine.listShares(profile, shares, err)) return fail(err);
        for (const auto& s : shares) out() << QString::fromStdString(s) << "\n";
        return ExitOk;
    }
    if (cmd == "ls") {
        std::vector<smblite::RemoteEntry> entries;
        if (!engine.listFiles(profile, need(1) ? arg(0) : std::string(), entries, err)) return fail(err);
        for (const auto& e : entries) printEntry(e, false);
        return ExitOk;
    }
    if (cmd == "find") {
        if (!need(1)) return usage(parser, "find needs a query");
        smblite::SearchRequest req;
        req.query = arg(0);
        req.includeSubfolders = !parser.isSet(shallowOpt);
        const QString type = parser.value(typeOpt);
        if (type == "files") req.type = smblite::SearchType::FilesOnly;
        else if (type == "dirs") req.type = smblite::SearchType::DirectoriesOnly;
        else if (type != "all") return usage(parser, "unknown --type: " + type);
        std::vector<smblite::RemoteEntry> hits;
        if (!engine.searchFiles(profile, need(2) ? arg(1) : std::string(), req, hits, err)) return fail(err);
        for (const auto& e : hits) printEntry(e, true);
        return ExitOk;
    }
    if (cmd == "get") {
        if (!need(2)) return usage(parser, "get needs <remote> <local>");
        if (!engine.downloadFile(profile, arg(0), arg(1), err,
                                 quiet ? smblite::ProgressCB() : byteProgress()))
            return fail(err);
        return ExitOk;
    }
    if (cmd == "getdir") {
        if (!need(2)) return usage(parser, "getdir needs <remote> <local-dir>");
        smblite::FolderProgress progress;
        if (!quiet) {
            progress.files = [](std::uint64_t done, std::uint64_t total, const std::string& item) {
                std::fprintf(stderr, "[%llu/%llu] %s\n", (unsigned long long)done,
                             (unsigned long long)total, item.c_str());
            };
        }
        if (!engine.downloadFolder(profile, arg(0), arg(1), err, progress)) return fail(err);
        return ExitOk;
    }
    if (cmd == "put") {
        if (!need(2)) return usage(parser, "put needs <local> <remote>");
        if (!engine.uploadFile(profile, arg(0), arg(1), err,
                               quiet ? smblite::ProgressCB() : byteProgress()))
            return fail(err);
        return ExitOk;
    }
    if (cmd == "rm") {
        if (!need(1)) return usage(parser, "rm needs a path");
        return engine.deleteFile(profile, arg(0), err) ? ExitOk : fail(err);
    }
    if (cmd == "mv") {
        if (!need(2)) return usage(parser, "mv needs <path> <new-name>");
        return engine.renameFile(profile, arg(0), arg(1), err) ? ExitOk : fail(err);
    }
    if (cmd == "mkdir") {
        if (!need(2)) return usage(parser, "mkdir needs <parent> <name>");
        return engine.createDirectory(profile, arg(0), arg(1), err) ? ExitOk : fail(err);
    }
    if (cmd == "exists") {
        if (!need(1)) return usage(parser, "exists needs a path");
        bool exists = false;
        if (!engine.fileExists(profile, arg(0), exists, err)) return fail(err);
        out() << (exists ? "yes" : "no") << "\n";
        return exists ? ExitOk : ExitFailed;
    }
    return usage(parser, "unknown command: " + cmd);
}
