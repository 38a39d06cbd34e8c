#include "range_expander.h"
#include "logger.h"
#include "socket_utils.h"
#include "constants.h"

#include <arpa/inet.h>
#include <sys/socket.h>

#include <cctype>
#include <cstring>
#include <utility>

namespace masqueplus {

namespace {

std::string format_address(int family, const uint8_t* bytes) {
    char buf[INET6_ADDRSTRLEN] = {0};
    if (::inet_ntop(family, bytes, buf, sizeof(buf)) == nullptr) {
        return std::string();
    }
    return std::string(buf);
}

void increment_address(std::array<uint8_t, 16>& addr) {
    for (int i = 15; i >= 0; --i) {
        if (++addr[static_cast<size_t>(i)] != 0) {
            break;
        }
    }
}

} // namespace

bool parse_ip_version_filter(const std::string& value, IpVersionFilter* out) {
    std::string v = value;
    for (auto& c : v) c = static_cast<char>(::tolower(c));
    IpVersionFilter filter;
    if (v.empty() || v == "any" || v == "all") filter = IpVersionFilter::ANY;
    else if (v == "4" || v == "v4" || v == "ipv4") filter = IpVersionFilter::V4;
    else if (v == "6" || v == "v6" || v == "ipv6") filter = IpVersionFilter::V6;
    else return false;
    if (out) *out = filter;
    return true;
}

const char* ip_version_filter_to_string(IpVersionFilter filter) {
    switch (filter) {
    case IpVersionFilter::ANY: return "any";
    case IpVersionFilter::V4: return "v4";
    case IpVersionFilter::V6: return "v6";
    }
    return "any";
}

bool parse_cidr(const std::string& text, Cidr* out, std::string* out_err) {
    const size_t slash = text.find('/');
    if (slash == std::string::npos || slash == 0 || slash + 1 >= text.size()) {
        if (out_err) *out_err = "invalid CIDR address: " + text;
        return false;
    }

    const std::string addr = text.substr(0, slash);
    const std::string bits = text.substr(slash + 1);
    if (bits.size() > 3) {
        if (out_err) *out_err = "invalid CIDR address: " + text;
        return false;
    }
    for (char c : bits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            if (out_err) *out_err = "invalid CIDR address: " + text;
            return false;
        }
    }
    const int prefix = std::stoi(bits);

    Cidr cidr;
    int max_bits = 0;
    if (::inet_pton(AF_INET, addr.c_str(), cidr.network.data()) == 1) {
        cidr.family = AF_INET;
        max_bits = 32;
    } else if (::inet_pton(AF_INET6, addr.c_str(), cidr.network.data()) == 1) {
        cidr.family = AF_INET6;
        max_bits = 128;
    } else {
        if (out_err) *out_err = "invalid CIDR address: " + text;
        return false;
    }

    if (prefix < 0 || prefix > max_bits) {
        if (out_err) *out_err = "invalid CIDR prefix length: " + text;
        return false;
    }

    // Clear host bits so the stored address is the network address.
    const size_t total_bytes = static_cast<size_t>(max_bits / 8);
    for (size_t i = 0; i < total_bytes; ++i) {
        const int bit_start = static_cast<int>(i) * 8;
        if (bit_start >= prefix) {
            cidr.network[i] = 0;
        } else if (bit_start + 8 > prefix) {
            const int keep = prefix - bit_start;
            cidr.network[i] &= static_cast<uint8_t>(0xFF << (8 - keep));
        }
    }
    cidr.prefix_len = prefix;

    if (out) *out = cidr;
    return true;
}

std::vector<std::string> expand_ipv4_hosts(const Cidr& cidr) {
    std::vector<std::string> hosts;
    if (cidr.family != AF_INET) {
        return hosts;
    }

    uint32_t network = 0;
    std::memcpy(&network, cidr.network.data(), sizeof(network));
    network = ntohl(network);

    const uint32_t mask = cidr.prefix_len == 0 ? 0u : (0xFFFFFFFFu << (32 - cidr.prefix_len));
    const uint32_t broadcast = network | ~mask;
    if (broadcast - network < 2) {
        // /31 and /32 have no address strictly between network and broadcast.
        return hosts;
    }

    const uint32_t count = broadcast - network - 1;
    if (count <= (1u << 20)) {
        hosts.reserve(count);
    }
    for (uint32_t ip = network + 1; ip < broadcast; ++ip) {
        const uint32_t be = htonl(ip);
        uint8_t bytes[4];
        std::memcpy(bytes, &be, sizeof(bytes));
        hosts.push_back(format_address(AF_INET, bytes));
    }
    return hosts;
}

std::vector<std::string> expand_ipv6_hosts(const Cidr& cidr, size_t cap) {
    std::vector<std::string> hosts;
    if (cidr.family != AF_INET6 || cap == 0) {
        return hosts;
    }

    // Number of addresses in the network, saturating once it exceeds the cap.
    const int host_bits = 128 - cidr.prefix_len;
    size_t limit = cap;
    if (host_bits < 63) {
        const uint64_t size = uint64_t{1} << host_bits;
        if (size < limit) {
            limit = static_cast<size_t>(size);
        }
    }

    hosts.reserve(limit);
    std::array<uint8_t, 16> addr = cidr.network;
    for (size_t i = 0; i < limit; ++i) {
        hosts.push_back(format_address(AF_INET6, addr.data()));
        increment_address(addr);
    }
    return hosts;
}

RangeExpander::RangeExpander(std::vector<uint16_t> ports, RandomSource& rng)
    : m_ports(std::move(ports)), m_rng(rng) {
    if (m_ports.empty()) {
        m_ports.push_back(static_cast<uint16_t>(DEFAULT_ENDPOINT_PORT));
    }
}

uint16_t RangeExpander::pick_port() const {
    if (m_ports.size() == 1) {
        return m_ports.front();
    }
    return m_ports[m_rng.uniform(m_ports.size())];
}

void RangeExpander::append_range(const std::string& range, int family, std::vector<std::string>& out) const {
    Cidr cidr;
    std::string err;
    if (!parse_cidr(range, &cidr, &err)) {
        LOG_WARN("bad cidr", {{"cidr", range}, {"err", err}});
        return;
    }
    if (cidr.family != family) {
        LOG_WARN("cidr family mismatch; skipping", {{"cidr", range},
                                                     {"expected", family == AF_INET ? "ipv4" : "ipv6"}});
        return;
    }

    const std::vector<std::string> hosts = family == AF_INET
        ? expand_ipv4_hosts(cidr)
        : expand_ipv6_hosts(cidr, IPV6_HOSTS_PER_CIDR_CAP);

    LOG_DEBUG("expanded cidr", {{"cidr", range}, {"hosts", std::to_string(hosts.size())}});
    for (const auto& host : hosts) {
        out.push_back(join_host_port(host, std::to_string(pick_port())));
    }
}

std::vector<std::string> RangeExpander::build(IpVersionFilter filter,
                                              const std::vector<std::string>& v4_ranges,
                                              const std::vector<std::string>& v6_ranges) const {
    std::vector<std::string> candidates;
    if (filter != IpVersionFilter::V6) {
        for (const auto& range : v4_ranges) {
            append_range(range, AF_INET, candidates);
        }
    }
    if (filter != IpVersionFilter::V4) {
        for (const auto& range : v6_ranges) {
            append_range(range, AF_INET6, candidates);
        }
    }
    return candidates;
}

void shuffle_candidates(std::vector<std::string>& candidates, RandomSource& rng) {
    for (size_t i = candidates.size(); i > 1; --i) {
        const size_t j = rng.uniform(i);
        std::swap(candidates[i - 1], candidates[j]);
    }
}

} // namespace masqueplus
