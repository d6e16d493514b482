// Search walk. Frames keep the listing of each open directory and the index of
// the next entry, so the visiting order matches a recursive pre-order walk.
#include "smblite/SearchEngine.hpp"
#include "smblite/Log.hpp"
#include "smblite/NameMatcher.hpp"
#include "smblite/PathResolver.hpp"

namespace smblite {

namespace {

struct Frame {
    std::string path;
    std::vector<FileInfo> entries;
    std::size_t next = 0;
};

} // namespace

RemoteEntry toRemoteEntry(const FileInfo& info, const std::string& parent) {
    RemoteEntry e;
    e.name = info.name;
    e.path = path::join(parent, info.name);
    e.kind = info.is_dir ? RemoteEntry::Kind::Directory : RemoteEntry::Kind::File;
    e.size = info.is_dir ? 0 : info.size;
    e.mtime = info.mtime;
    return e;
}

bool SearchEngine::matchesType(SearchType type, bool isDirectory) {
    switch (type) {
    case SearchType::FilesOnly:
        return !isDirectory;
    case SearchType::DirectoriesOnly:
        return isDirectory;
    case SearchType::All:
    default:
        return true;
    }
}

void SearchEngine::search(SmbClient& client,
                          const SearchRequest& request,
                          const std::string& start_path,
                          const CancellationToken& cancel,
                          std::vector<RemoteEntry>& out) {
    listings_ = 0;
    std::vector<Frame> stack;

    // Lists dir and pushes it; false when the walk must stop.
    auto enter = [&](const std::string& dir) -> bool {
        if (cancel.isCancelled()) return false;
        Frame f;
        f.path = dir;
        std::string err;
        ++listings_;
        if (!client.list(dir, f.entries, err)) {
            if (cancel.isCancelled()) {
                LOGD("listing of '%s' interrupted by cancellation", dir.c_str());
                return false;
            }
            LOGW("search: skipping '%s': %s", dir.c_str(), err.c_str());
            return true;
        }
        stack.push_back(std::move(f));
        return true;
    };

    if (!enter(path::normalize(start_path))) {
        LOGI("search cancelled with %zu result(s)", out.size());
        return;
    }

    while (!stack.empty()) {
        Frame& top = stack.back();
        if (top.next >= top.entries.size()) {
            stack.pop_back();
            continue;
        }
        if (cancel.isCancelled()) {
            LOGI("search cancelled with %zu result(s)", out.size());
            return;
        }
        const FileInfo info = top.entries[top.next++];
        if (info.name.empty() || info.name == "." || info.name == "..") continue;

        RemoteEntry entry = toRemoteEntry(info, top.path);
        if (matchesType(request.type, info.is_dir) && wildcardMatch(info.name, request.query)) {
            out.push_back(entry);
        }
        // top is invalidated by the push below
        if (info.is_dir && request.includeSubfolders && !enter(entry.path)) {
            LOGI("search cancelled with %zu result(s)", out.size());
            return;
        }
    }
    LOGD("search below '%s' done: %zu result(s), %zu listing(s)", start_path.c_str(),
         out.size(), listings_);
}

} // namespace smblite
