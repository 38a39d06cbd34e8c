#ifndef MASQUEPLUS_SOCKET_UTILS_H
#define MASQUEPLUS_SOCKET_UTILS_H

#include <sys/socket.h>

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace masqueplus {

std::string errno_string(int err);

// Monotonic deadline shared by the steps of one network operation.
class Deadline {
public:
    explicit Deadline(int timeout_ms)
        : m_end(std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms < 0 ? 0 : timeout_ms)) {}

    int remaining_ms() const;
    bool expired() const { return remaining_ms() <= 0; }

private:
    std::chrono::steady_clock::time_point m_end;
};

enum class WaitResult {
    READY,
    TIMEOUT,
    FAILED
};

// poll() for events on fd, retrying on EINTR until the timeout is used up.
WaitResult wait_fd(int fd, short events, int timeout_ms, std::string* out_err);

bool set_nonblocking(int fd, bool enabled, std::string* out_err);

// Non-blocking connect bounded by timeout_ms. Restores the original flags.
bool connect_with_timeout(int fd, const sockaddr* sa, socklen_t salen, int timeout_ms,
                          std::string* out_err, bool* out_timed_out = nullptr);

bool send_all(int fd, const void* buf, size_t len, const Deadline& deadline, std::string* out_err);
bool recv_exact(int fd, void* out, size_t len, const Deadline& deadline, std::string* out_err);

struct ResolvedAddress {
    sockaddr_storage addr{};
    socklen_t addr_len = 0;
    int family = 0;
};

// getaddrinfo wrapper; numeric hosts never touch DNS.
bool resolve_host(const std::string& host, const std::string& port, int socktype,
                  std::vector<ResolvedAddress>* out, std::string* out_err);

// Opens a TCP connection to the first reachable resolved address.
int open_tcp_connection(const std::string& host, const std::string& port, int timeout_ms,
                        std::string* out_err, bool* out_timed_out = nullptr);

// "host:port" and "[v6]:port" parsing. The port must be present.
bool split_host_port(const std::string& endpoint, std::string* host, std::string* port, std::string* out_err);
std::string join_host_port(const std::string& host, const std::string& port);
bool is_ip_literal(const std::string& host);
bool is_ipv6_literal(const std::string& host);

} // namespace masqueplus

#endif // MASQUEPLUS_SOCKET_UTILS_H
