#include "socks5_client.h"

namespace masqueplus {

std::string socks5_greeting() {
    std::string b;
    b.push_back(static_cast<char>(0x05)); // ver
    b.push_back(static_cast<char>(0x01)); // one method
    b.push_back(static_cast<char>(0x00)); // no auth
    return b;
}

std::string socks5_connect_request(const std::string& host, uint16_t port) {
    std::string b;
    b.push_back(static_cast<char>(0x05)); // ver
    b.push_back(static_cast<char>(0x01)); // cmd connect
    b.push_back(static_cast<char>(0x00)); // rsv
    b.push_back(static_cast<char>(0x03)); // atyp domain
    const size_t len = host.size() > 255 ? 255 : host.size();
    b.push_back(static_cast<char>(len));
    b.append(host.data(), len);
    b.push_back(static_cast<char>((port >> 8) & 0xFF));
    b.push_back(static_cast<char>(port & 0xFF));
    return b;
}

const char* socks5_reply_to_string(uint8_t rep) {
    switch (rep) {
    case 0x00: return "succeeded";
    case 0x01: return "general SOCKS server failure";
    case 0x02: return "connection not allowed by ruleset";
    case 0x03: return "network unreachable";
    case 0x04: return "host unreachable";
    case 0x05: return "connection refused";
    case 0x06: return "TTL expired";
    case 0x07: return "command not supported";
    case 0x08: return "address type not supported";
    default: return "unknown reply";
    }
}

bool socks5_connect(int fd, const std::string& host, uint16_t port,
                    const Deadline& deadline, std::string* out_err) {
    std::string err;
    const std::string greeting = socks5_greeting();
    if (!send_all(fd, greeting.data(), greeting.size(), deadline, &err)) {
        if (out_err) *out_err = "socks5 greeting: " + err;
        return false;
    }

    uint8_t method_reply[2];
    if (!recv_exact(fd, method_reply, sizeof(method_reply), deadline, &err)) {
        if (out_err) *out_err = "socks5 method reply: " + err;
        return false;
    }
    if (method_reply[0] != 0x05 || method_reply[1] != 0x00) {
        if (out_err) *out_err = "socks5 proxy refused no-auth method";
        return false;
    }

    const std::string request = socks5_connect_request(host, port);
    if (!send_all(fd, request.data(), request.size(), deadline, &err)) {
        if (out_err) *out_err = "socks5 connect request: " + err;
        return false;
    }

    uint8_t head[4];
    if (!recv_exact(fd, head, sizeof(head), deadline, &err)) {
        if (out_err) *out_err = "socks5 connect reply: " + err;
        return false;
    }
    if (head[0] != 0x05) {
        if (out_err) *out_err = "socks5 connect reply: bad version";
        return false;
    }
    if (head[1] != 0x00) {
        if (out_err) *out_err = std::string("socks5 connect failed: ") + socks5_reply_to_string(head[1]);
        return false;
    }

    // Drain the bound address so the stream starts clean.
    size_t addr_len = 0;
    switch (head[3]) {
    case 0x01: addr_len = 4; break;
    case 0x04: addr_len = 16; break;
    case 0x03: {
        uint8_t name_len = 0;
        if (!recv_exact(fd, &name_len, 1, deadline, &err)) {
            if (out_err) *out_err = "socks5 connect reply: " + err;
            return false;
        }
        addr_len = name_len;
        break;
    }
    default:
        if (out_err) *out_err = "socks5 connect reply: unknown address type";
        return false;
    }

    uint8_t rest[255 + 2];
    if (!recv_exact(fd, rest, addr_len + 2, deadline, &err)) {
        if (out_err) *out_err = "socks5 connect reply: " + err;
        return false;
    }
    return true;
}

} // namespace masqueplus
