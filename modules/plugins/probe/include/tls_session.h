#ifndef MASQUEPLUS_TLS_SESSION_H
#define MASQUEPLUS_TLS_SESSION_H

#include "socket_utils.h"

#include <cstddef>
#include <string>
#include <vector>

typedef struct ssl_st SSL;
typedef struct ssl_ctx_st SSL_CTX;

namespace masqueplus {

enum class TlsFailure {
    NONE,
    HANDSHAKE,  // alert, bad certificate, protocol error
    TIMEOUT,
    IO          // socket level failure or unexpected close
};

// ALPN wire format: length-prefixed protocol names.
std::vector<unsigned char> encode_alpn(const std::vector<std::string>& protocols);

// Drains the OpenSSL error queue into one line.
std::string openssl_error_string();

// Client-side TLS over an already connected TCP socket. Certificate
// verification is disabled; this is only used for reachability probes and
// for the trace request through the local proxy. Does not own the fd.
class TlsSession {
public:
    TlsSession();
    ~TlsSession();

    TlsSession(const TlsSession&) = delete;
    TlsSession& operator=(const TlsSession&) = delete;

    // server_name is sent as SNI only when it is a hostname.
    bool connect(int fd,
                 const std::string& server_name,
                 const std::vector<std::string>& alpn,
                 const Deadline& deadline,
                 std::string* out_err,
                 TlsFailure* out_failure);

    bool write_all(const std::string& data, const Deadline& deadline, std::string* out_err);

    // > 0 bytes read, 0 on orderly close, -1 on error or timeout.
    long read_some(char* buf, size_t len, const Deadline& deadline, std::string* out_err);

    void shutdown();

    std::string negotiated_alpn() const;

private:
    bool wait_for(int ssl_error, const Deadline& deadline, std::string* out_err, bool* out_timed_out);

    SSL_CTX* m_ctx = nullptr;
    SSL* m_ssl = nullptr;
    int m_fd = -1;
};

} // namespace masqueplus

#endif // MASQUEPLUS_TLS_SESSION_H
