#include "icmp_pinger.h"
#include "socket_utils.h"

#include <arpa/inet.h>
#include <netinet/icmp6.h>
#include <netinet/in.h>
#include <netinet/ip_icmp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <vector>

namespace masqueplus {

uint16_t icmp_checksum(const uint8_t* data, size_t len) {
    uint32_t sum = 0;
    while (len >= 2) {
        uint16_t w;
        std::memcpy(&w, data, 2);
        sum += w;
        data += 2;
        len -= 2;
    }
    if (len) sum += static_cast<uint16_t>(*data);

    while (sum >> 16) sum = (sum & 0xFFFF) + (sum >> 16);
    return static_cast<uint16_t>(~sum);
}

PingResult icmp_ping(const std::string& host, int timeout_ms) {
    PingResult result;
    const auto started = std::chrono::steady_clock::now();

    std::vector<ResolvedAddress> addrs;
    if (!resolve_host(host, "0", SOCK_DGRAM, &addrs, &result.error)) {
        return result;
    }
    const ResolvedAddress& target = addrs.front();
    const bool v6 = target.family == AF_INET6;

    const int fd = ::socket(target.family, SOCK_DGRAM, v6 ? IPPROTO_ICMPV6 : IPPROTO_ICMP);
    if (fd < 0) {
        result.error = "icmp socket() failed: " + errno_string(errno);
        return result;
    }

    // The kernel rewrites the identifier for ping sockets; match on sequence.
    const uint16_t sequence = static_cast<uint16_t>(started.time_since_epoch().count() & 0xFFFF);
    std::vector<uint8_t> packet(8 + 16, 0);
    packet[0] = v6 ? ICMP6_ECHO_REQUEST : ICMP_ECHO;
    packet[1] = 0;
    packet[6] = static_cast<uint8_t>(sequence >> 8);
    packet[7] = static_cast<uint8_t>(sequence & 0xFF);
    std::memcpy(packet.data() + 8, "masque-plus-ping", 16);
    if (!v6) {
        const uint16_t csum = icmp_checksum(packet.data(), packet.size());
        std::memcpy(packet.data() + 2, &csum, sizeof(csum));
    }

    if (::sendto(fd, packet.data(), packet.size(), 0,
                 reinterpret_cast<const sockaddr*>(&target.addr), target.addr_len) < 0) {
        result.error = "icmp sendto() failed: " + errno_string(errno);
        ::close(fd);
        return result;
    }

    Deadline deadline(timeout_ms);
    uint8_t reply[1500];
    for (;;) {
        std::string wait_err;
        const WaitResult waited = wait_fd(fd, POLLIN, deadline.remaining_ms(), &wait_err);
        if (waited == WaitResult::TIMEOUT) {
            result.timed_out = true;
            result.error = "icmp echo timed out";
            break;
        }
        if (waited == WaitResult::FAILED) {
            result.error = wait_err;
            break;
        }

        const ssize_t n = ::recv(fd, reply, sizeof(reply), 0);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            result.error = "icmp recv() failed: " + errno_string(errno);
            break;
        }
        if (n < 8) continue;

        const uint8_t expected_type = v6 ? ICMP6_ECHO_REPLY : ICMP_ECHOREPLY;
        const uint16_t reply_seq = static_cast<uint16_t>((reply[6] << 8) | reply[7]);
        if (reply[0] == expected_type && reply_seq == sequence) {
            result.success = true;
            break;
        }
    }

    ::close(fd);
    result.rtt = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    return result;
}

} // namespace masqueplus
