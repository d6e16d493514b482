// Depth-first remote tree walk that filters by entry type and name, with
// cooperative cancellation. Uses an explicit stack, so tree depth does not
// consume call stack.
#pragma once
#include "CancellationToken.hpp"
#include "SmbClient.hpp"

namespace smblite {

class SearchEngine {
public:
    // Appends matches below start_path to out. Stops early (keeping what was
    // found so far) when cancel fires. Listing failures of individual
    // directories are logged and skipped; this never fails.
    void search(SmbClient& client,
                const SearchRequest& request,
                const std::string& start_path,
                const CancellationToken& cancel,
                std::vector<RemoteEntry>& out);

    // Number of directory listings issued by the last search().
    std::size_t listingsIssued() const { return listings_; }

    static bool matchesType(SearchType type, bool isDirectory);

private:
    std::size_t listings_ = 0;
};

RemoteEntry toRemoteEntry(const FileInfo& info, const std::string& parent);

} // namespace smblite
