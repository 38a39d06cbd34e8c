#ifndef MASQUEPLUS_ICMP_PINGER_H
#define MASQUEPLUS_ICMP_PINGER_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace masqueplus {

struct PingResult {
    bool success = false;
    bool timed_out = false;
    std::string error;
    std::chrono::milliseconds rtt{0};
};

uint16_t icmp_checksum(const uint8_t* data, size_t len);

// One echo request over an unprivileged ICMP datagram socket
// (net.ipv4.ping_group_range must include the caller's group).
PingResult icmp_ping(const std::string& host, int timeout_ms);

} // namespace masqueplus

#endif // MASQUEPLUS_ICMP_PINGER_H
