// Bounded TCP connect used as a reachability check before any SMB traffic.
#include "smblite/TcpProbe.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>

// POSIX sockets
#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>
#include <poll.h>
#include <unistd.h>

namespace smblite {
namespace net {

static const int kDefaultTimeoutSeconds = 10;

bool tcpReachable(const std::string& host, const std::string& port, int timeoutSeconds,
                  std::string& err) {
    struct addrinfo hints{};
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    int gai = getaddrinfo(host.c_str(), port.c_str(), &hints, &res);
    if (gai != 0) {
        err = std::string("getaddrinfo: ") + gai_strerror(gai);
        return false;
    }

    // Non-blocking connect so an unreachable host costs at most the timeout,
    // not the kernel's SYN retry schedule.
    const int waitMs = (timeoutSeconds > 0 ? timeoutSeconds : kDefaultTimeoutSeconds) * 1000;
    bool ok = false;
    int lastErrno = 0;
    for (auto rp = res; rp != nullptr && !ok; rp = rp->ai_next) {
        int s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == -1) {
            lastErrno = errno;
            continue;
        }
        const int flags = ::fcntl(s, F_GETFL, 0);
        if (flags == -1 || ::fcntl(s, F_SETFL, flags | O_NONBLOCK) == -1) {
            lastErrno = errno;
            ::close(s);
            continue;
        }
        if (::connect(s, rp->ai_addr, rp->ai_addrlen) == 0) {
            ok = true;
        } else if (errno != EINPROGRESS) {
            lastErrno = errno;
        } else {
            struct pollfd pfd{};
            pfd.fd = s;
            pfd.events = POLLOUT;
            int pr;
            do {
                pr = ::poll(&pfd, 1, waitMs);
            } while (pr == -1 && errno == EINTR);
            if (pr == 0) {
                lastErrno = ETIMEDOUT;
            } else if (pr < 0) {
                lastErrno = errno;
            } else {
                int soErr = 0;
                socklen_t len = sizeof(soErr);
                if (::getsockopt(s, SOL_SOCKET, SO_ERROR, &soErr, &len) == -1) soErr = errno;
                if (soErr == 0) ok = true;
                else lastErrno = soErr;
            }
        }
        ::close(s);
    }
    freeaddrinfo(res);
    if (!ok) {
        err = "TCP connect to " + host + ":" + port + " failed: " +
              std::strerror(lastErrno ? lastErrno : ECONNREFUSED);
    }
    return ok;
}

} // namespace net
} // namespace smblite
