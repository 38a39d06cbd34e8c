#include "socket_utils.h"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <sstream>

namespace masqueplus {

namespace {

int send_flags_no_sigpipe() {
#if defined(MSG_NOSIGNAL)
    return MSG_NOSIGNAL;
#else
    return 0;
#endif
}

} // namespace

std::string errno_string(int err) {
    std::ostringstream oss;
    oss << err;
    const char* s = std::strerror(err);
    if (s) {
        oss << " (" << s << ")";
    }
    return oss.str();
}

int Deadline::remaining_ms() const {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        m_end - std::chrono::steady_clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

WaitResult wait_fd(int fd, short events, int timeout_ms, std::string* out_err) {
    Deadline deadline(timeout_ms);
    for (;;) {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = events;
        const int rc = ::poll(&pfd, 1, deadline.remaining_ms());
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (out_err) *out_err = "poll() failed: " + errno_string(errno);
            return WaitResult::FAILED;
        }
        if (rc == 0) {
            return WaitResult::TIMEOUT;
        }
        if ((pfd.revents & POLLNVAL) != 0) {
            if (out_err) *out_err = "poll() reported invalid descriptor";
            return WaitResult::FAILED;
        }
        // POLLERR/POLLHUP are left for the following read/write to report.
        return WaitResult::READY;
    }
}

bool set_nonblocking(int fd, bool enabled, std::string* out_err) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        if (out_err) *out_err = "fcntl(F_GETFL) failed: " + errno_string(errno);
        return false;
    }
    const int wanted = enabled ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    if (wanted != flags && fcntl(fd, F_SETFL, wanted) < 0) {
        if (out_err) *out_err = "fcntl(F_SETFL) failed: " + errno_string(errno);
        return false;
    }
    return true;
}

bool connect_with_timeout(int fd, const sockaddr* sa, socklen_t salen, int timeout_ms,
                          std::string* out_err, bool* out_timed_out) {
    if (out_timed_out) *out_timed_out = false;

    const int old_flags = fcntl(fd, F_GETFL, 0);
    if (old_flags < 0) {
        if (out_err) *out_err = "fcntl(F_GETFL) failed: " + errno_string(errno);
        return false;
    }
    if (fcntl(fd, F_SETFL, old_flags | O_NONBLOCK) < 0) {
        if (out_err) *out_err = "fcntl(F_SETFL,O_NONBLOCK) failed: " + errno_string(errno);
        return false;
    }

    int res = ::connect(fd, sa, salen);
    if (res == 0) {
        (void)fcntl(fd, F_SETFL, old_flags);
        return true;
    }
    if (errno != EINPROGRESS) {
        if (out_err) *out_err = "connect() failed: " + errno_string(errno);
        (void)fcntl(fd, F_SETFL, old_flags);
        return false;
    }

    std::string wait_err;
    const WaitResult waited = wait_fd(fd, POLLOUT, timeout_ms, &wait_err);
    if (waited == WaitResult::FAILED) {
        if (out_err) *out_err = wait_err;
        (void)fcntl(fd, F_SETFL, old_flags);
        return false;
    }
    if (waited == WaitResult::TIMEOUT) {
        if (out_err) *out_err = "connect() timed out";
        if (out_timed_out) *out_timed_out = true;
        (void)fcntl(fd, F_SETFL, old_flags);
        return false;
    }

    int so_error = 0;
    socklen_t slen = sizeof(so_error);
    if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &slen) != 0) {
        if (out_err) *out_err = "getsockopt(SO_ERROR) failed: " + errno_string(errno);
        (void)fcntl(fd, F_SETFL, old_flags);
        return false;
    }
    if (so_error != 0) {
        if (out_err) *out_err = "connect() failed: " + errno_string(so_error);
        (void)fcntl(fd, F_SETFL, old_flags);
        return false;
    }

    (void)fcntl(fd, F_SETFL, old_flags);
    return true;
}

bool send_all(int fd, const void* buf, size_t len, const Deadline& deadline, std::string* out_err) {
    const uint8_t* p = static_cast<const uint8_t*>(buf);
    size_t total = 0;
    while (total < len) {
        const WaitResult waited = wait_fd(fd, POLLOUT, deadline.remaining_ms(), out_err);
        if (waited == WaitResult::TIMEOUT) {
            if (out_err) *out_err = "send timed out";
            return false;
        }
        if (waited == WaitResult::FAILED) {
            return false;
        }
        const ssize_t n = ::send(fd, p + total, len - total, send_flags_no_sigpipe());
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                continue;
            }
            if (out_err) *out_err = "send() failed: " + errno_string(errno);
            return false;
        }
        if (n == 0) {
            if (out_err) *out_err = "send() wrote nothing";
            return false;
        }
        total += static_cast<size_t>(n);
    }
    return true;
}

bool recv_exact(int fd, void* out, size_t len, const Deadline& deadline, std::string* out_err) {
    uint8_t* p = static_cast<uint8_t*>(out);
    size_t total = 0;
    while (total < len) {
        const WaitResult waited = wait_fd(fd, POLLIN, deadline.remaining_ms(), out_err);
        if (waited == WaitResult::TIMEOUT) {
            if (out_err) *out_err = "receive timed out";
            return false;
        }
        if (waited == WaitResult::FAILED) {
            return false;
        }
        const ssize_t n = ::recv(fd, p + total, len - total, 0);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                continue;
            }
            if (out_err) *out_err = "recv() failed: " + errno_string(errno);
            return false;
        }
        if (n == 0) {
            if (out_err) *out_err = "connection closed by peer";
            return false;
        }
        total += static_cast<size_t>(n);
    }
    return true;
}

bool resolve_host(const std::string& host, const std::string& port, int socktype,
                  std::vector<ResolvedAddress>* out, std::string* out_err) {
    addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = socktype;
    if (is_ip_literal(host)) {
        hints.ai_flags |= AI_NUMERICHOST;
    }

    addrinfo* results = nullptr;
    const int gai_rc = ::getaddrinfo(host.c_str(), port.c_str(), &hints, &results);
    if (gai_rc != 0 || results == nullptr) {
        if (out_err) {
            *out_err = "getaddrinfo failed for " + host + ": " +
                       (gai_rc != 0 ? std::string(gai_strerror(gai_rc)) : std::string("no results"));
        }
        return false;
    }

    out->clear();
    for (addrinfo* ai = results; ai != nullptr; ai = ai->ai_next) {
        if (ai->ai_addrlen > sizeof(sockaddr_storage)) {
            continue;
        }
        ResolvedAddress addr;
        std::memcpy(&addr.addr, ai->ai_addr, ai->ai_addrlen);
        addr.addr_len = static_cast<socklen_t>(ai->ai_addrlen);
        addr.family = ai->ai_family;
        out->push_back(addr);
    }
    ::freeaddrinfo(results);

    if (out->empty()) {
        if (out_err) *out_err = "no usable address for " + host;
        return false;
    }
    return true;
}

int open_tcp_connection(const std::string& host, const std::string& port, int timeout_ms,
                        std::string* out_err, bool* out_timed_out) {
    if (out_timed_out) *out_timed_out = false;

    std::vector<ResolvedAddress> addrs;
    if (!resolve_host(host, port, SOCK_STREAM, &addrs, out_err)) {
        return -1;
    }

    Deadline deadline(timeout_ms);
    std::string last_err;
    bool last_timed_out = false;
    for (const auto& addr : addrs) {
        if (deadline.expired()) {
            last_err = "connect() timed out";
            last_timed_out = true;
            break;
        }
        const int fd = ::socket(addr.family, SOCK_STREAM, 0);
        if (fd < 0) {
            last_err = "socket() failed: " + errno_string(errno);
            continue;
        }
        std::string err;
        bool timed_out = false;
        if (!connect_with_timeout(fd, reinterpret_cast<const sockaddr*>(&addr.addr), addr.addr_len,
                                  deadline.remaining_ms(), &err, &timed_out)) {
            last_err = err;
            last_timed_out = timed_out;
            ::close(fd);
            continue;
        }
        return fd;
    }

    if (out_err) *out_err = last_err.empty() ? std::string("connect failed") : last_err;
    if (out_timed_out) *out_timed_out = last_timed_out;
    return -1;
}

bool split_host_port(const std::string& endpoint, std::string* host, std::string* port, std::string* out_err) {
    if (endpoint.empty()) {
        if (out_err) *out_err = "empty endpoint";
        return false;
    }

    std::string h;
    std::string p;
    if (endpoint.front() == '[') {
        const size_t close = endpoint.find(']');
        if (close == std::string::npos) {
            if (out_err) *out_err = "missing ']' in address " + endpoint;
            return false;
        }
        h = endpoint.substr(1, close - 1);
        if (close + 1 >= endpoint.size() || endpoint[close + 1] != ':') {
            if (out_err) *out_err = "missing port in address " + endpoint;
            return false;
        }
        p = endpoint.substr(close + 2);
    } else {
        const size_t colon = endpoint.rfind(':');
        if (colon == std::string::npos) {
            if (out_err) *out_err = "missing port in address " + endpoint;
            return false;
        }
        if (endpoint.find(':') != colon) {
            if (out_err) *out_err = "too many colons in address " + endpoint;
            return false;
        }
        h = endpoint.substr(0, colon);
        p = endpoint.substr(colon + 1);
    }

    if (p.empty()) {
        if (out_err) *out_err = "missing port in address " + endpoint;
        return false;
    }
    if (host) *host = h;
    if (port) *port = p;
    return true;
}

std::string join_host_port(const std::string& host, const std::string& port) {
    if (host.find(':') != std::string::npos) {
        return "[" + host + "]:" + port;
    }
    return host + ":" + port;
}

bool is_ipv6_literal(const std::string& host) {
    in6_addr v6{};
    return ::inet_pton(AF_INET6, host.c_str(), &v6) == 1;
}

bool is_ip_literal(const std::string& host) {
    in_addr v4{};
    return ::inet_pton(AF_INET, host.c_str(), &v4) == 1 || is_ipv6_literal(host);
}

} // namespace masqueplus
