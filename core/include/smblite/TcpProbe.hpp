// TCP reachability check.
#pragma once
#include <string>

namespace smblite {
namespace net {

// Opens and closes one TCP connection to host:port, trying every resolved
// address. Each attempt waits at most timeoutSeconds (10 when <= 0).
bool tcpReachable(const std::string& host, const std::string& port, int timeoutSeconds,
                  std::string& err);

} // namespace net
} // namespace smblite
