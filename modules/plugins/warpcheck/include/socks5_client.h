#ifndef MASQUEPLUS_SOCKS5_CLIENT_H
#define MASQUEPLUS_SOCKS5_CLIENT_H

#include "socket_utils.h"

#include <cstdint>
#include <string>

namespace masqueplus {

// Request bytes for a no-auth CONNECT to host:port (domain address type).
std::string socks5_greeting();
std::string socks5_connect_request(const std::string& host, uint16_t port);

const char* socks5_reply_to_string(uint8_t rep);

// Runs the SOCKS5 greeting and CONNECT on an already connected socket. On
// success the socket carries the tunnelled stream.
bool socks5_connect(int fd, const std::string& host, uint16_t port,
                    const Deadline& deadline, std::string* out_err);

} // namespace masqueplus

#endif // MASQUEPLUS_SOCKS5_CLIENT_H
