#ifndef MASQUEPLUS_RANGE_EXPANDER_H
#define MASQUEPLUS_RANGE_EXPANDER_H

#include "random_source.h"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace masqueplus {

enum class IpVersionFilter {
    ANY,
    V4,
    V6
};

bool parse_ip_version_filter(const std::string& value, IpVersionFilter* out);
const char* ip_version_filter_to_string(IpVersionFilter filter);

struct Cidr {
    int family = 0;                    // AF_INET or AF_INET6
    std::array<uint8_t, 16> network{}; // masked network address, first 4 bytes for IPv4
    int prefix_len = 0;
};

bool parse_cidr(const std::string& text, Cidr* out, std::string* out_err);

// IPv4 hosts strictly between network and broadcast, in ascending order.
std::vector<std::string> expand_ipv4_hosts(const Cidr& cidr);

// Sequential IPv6 addresses from the network address, at most `cap` of them.
std::vector<std::string> expand_ipv6_hosts(const Cidr& cidr, size_t cap);

// Turns CIDR ranges into "host:port" / "[v6]:port" candidates. Ranges keep
// their input order. Malformed or wrong-family entries are logged and skipped.
// With more than one port each host gets a uniformly random one.
class RangeExpander {
public:
    RangeExpander(std::vector<uint16_t> ports, RandomSource& rng);

    std::vector<std::string> build(IpVersionFilter filter,
                                   const std::vector<std::string>& v4_ranges,
                                   const std::vector<std::string>& v6_ranges) const;

    const std::vector<uint16_t>& ports() const { return m_ports; }

private:
    uint16_t pick_port() const;
    void append_range(const std::string& range, int family, std::vector<std::string>& out) const;

    std::vector<uint16_t> m_ports;
    RandomSource& m_rng;
};

// In-place Fisher-Yates shuffle.
void shuffle_candidates(std::vector<std::string>& candidates, RandomSource& rng);

} // namespace masqueplus

#endif // MASQUEPLUS_RANGE_EXPANDER_H
