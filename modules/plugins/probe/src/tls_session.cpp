#include "tls_session.h"

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <poll.h>

#include <cerrno>
#include <stdexcept>

namespace masqueplus {

std::vector<unsigned char> encode_alpn(const std::vector<std::string>& protocols) {
    std::vector<unsigned char> wire;
    for (const auto& proto : protocols) {
        if (proto.empty() || proto.size() > 255) {
            continue;
        }
        wire.push_back(static_cast<unsigned char>(proto.size()));
        wire.insert(wire.end(), proto.begin(), proto.end());
    }
    return wire;
}

std::string openssl_error_string() {
    std::string out;
    unsigned long code = 0;
    while ((code = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(code, buf, sizeof(buf));
        if (!out.empty()) out += "; ";
        out += buf;
    }
    return out;
}

TlsSession::TlsSession() {
    m_ctx = SSL_CTX_new(TLS_client_method());
    if (!m_ctx) {
        throw std::runtime_error("SSL_CTX_new() failed: " + openssl_error_string());
    }
    SSL_CTX_set_min_proto_version(m_ctx, TLS1_2_VERSION);
    SSL_CTX_set_verify(m_ctx, SSL_VERIFY_NONE, nullptr);
#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
    SSL_CTX_set_options(m_ctx, SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif
}

TlsSession::~TlsSession() {
    if (m_ssl) {
        SSL_free(m_ssl);
        m_ssl = nullptr;
    }
    if (m_ctx) {
        SSL_CTX_free(m_ctx);
        m_ctx = nullptr;
    }
}

bool TlsSession::wait_for(int ssl_error, const Deadline& deadline, std::string* out_err, bool* out_timed_out) {
    const short events = ssl_error == SSL_ERROR_WANT_WRITE ? POLLOUT : POLLIN;
    const WaitResult waited = wait_fd(m_fd, events, deadline.remaining_ms(), out_err);
    if (waited == WaitResult::TIMEOUT) {
        if (out_timed_out) *out_timed_out = true;
        return false;
    }
    return waited == WaitResult::READY;
}

bool TlsSession::connect(int fd,
                         const std::string& server_name,
                         const std::vector<std::string>& alpn,
                         const Deadline& deadline,
                         std::string* out_err,
                         TlsFailure* out_failure) {
    if (out_failure) *out_failure = TlsFailure::NONE;
    m_fd = fd;

    if (!set_nonblocking(fd, true, out_err)) {
        if (out_failure) *out_failure = TlsFailure::IO;
        return false;
    }

    m_ssl = SSL_new(m_ctx);
    if (!m_ssl) {
        if (out_err) *out_err = "SSL_new() failed: " + openssl_error_string();
        if (out_failure) *out_failure = TlsFailure::IO;
        return false;
    }
    if (SSL_set_fd(m_ssl, fd) != 1) {
        if (out_err) *out_err = "SSL_set_fd() failed: " + openssl_error_string();
        if (out_failure) *out_failure = TlsFailure::IO;
        return false;
    }
    if (!server_name.empty() && !is_ip_literal(server_name)) {
        SSL_set_tlsext_host_name(m_ssl, server_name.c_str());
    }
    if (!alpn.empty()) {
        const std::vector<unsigned char> wire = encode_alpn(alpn);
        // returns 0 on success
        if (SSL_set_alpn_protos(m_ssl, wire.data(), static_cast<unsigned int>(wire.size())) != 0) {
            if (out_err) *out_err = "SSL_set_alpn_protos() failed";
            if (out_failure) *out_failure = TlsFailure::IO;
            return false;
        }
    }

    ERR_clear_error();
    for (;;) {
        errno = 0;
        const int ret = SSL_connect(m_ssl);
        if (ret == 1) {
            return true;
        }

        const int err = SSL_get_error(m_ssl, ret);
        if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
            bool timed_out = false;
            std::string wait_err;
            if (!wait_for(err, deadline, &wait_err, &timed_out)) {
                if (timed_out) {
                    if (out_err) *out_err = "tls handshake timed out";
                    if (out_failure) *out_failure = TlsFailure::TIMEOUT;
                } else {
                    if (out_err) *out_err = wait_err;
                    if (out_failure) *out_failure = TlsFailure::IO;
                }
                return false;
            }
            continue;
        }

        const std::string detail = openssl_error_string();
        if (err == SSL_ERROR_SSL) {
            if (out_err) *out_err = "tls handshake failure: " + (detail.empty() ? std::string("protocol error") : detail);
            if (out_failure) *out_failure = TlsFailure::HANDSHAKE;
        } else if (err == SSL_ERROR_SYSCALL && errno != 0) {
            if (out_err) *out_err = "tls handshake failure: " + errno_string(errno);
            if (out_failure) *out_failure = TlsFailure::IO;
        } else {
            if (out_err) *out_err = "tls handshake failure: connection closed during handshake";
            if (out_failure) *out_failure = TlsFailure::IO;
        }
        return false;
    }
}

bool TlsSession::write_all(const std::string& data, const Deadline& deadline, std::string* out_err) {
    if (!m_ssl) {
        if (out_err) *out_err = "tls session not connected";
        return false;
    }
    size_t written = 0;
    while (written < data.size()) {
        const int ret = SSL_write(m_ssl, data.data() + written, static_cast<int>(data.size() - written));
        if (ret > 0) {
            written += static_cast<size_t>(ret);
            continue;
        }
        const int err = SSL_get_error(m_ssl, ret);
        if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
            bool timed_out = false;
            std::string wait_err;
            if (!wait_for(err, deadline, &wait_err, &timed_out)) {
                if (out_err) *out_err = timed_out ? std::string("tls write timed out") : wait_err;
                return false;
            }
            continue;
        }
        if (out_err) *out_err = "SSL_write() failed: " + openssl_error_string();
        return false;
    }
    return true;
}

long TlsSession::read_some(char* buf, size_t len, const Deadline& deadline, std::string* out_err) {
    if (!m_ssl) {
        if (out_err) *out_err = "tls session not connected";
        return -1;
    }
    for (;;) {
        errno = 0;
        const int ret = SSL_read(m_ssl, buf, static_cast<int>(len));
        if (ret > 0) {
            return ret;
        }
        const int err = SSL_get_error(m_ssl, ret);
        if (err == SSL_ERROR_ZERO_RETURN) {
            return 0;
        }
        if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
            bool timed_out = false;
            std::string wait_err;
            if (!wait_for(err, deadline, &wait_err, &timed_out)) {
                if (out_err) *out_err = timed_out ? std::string("tls read timed out") : wait_err;
                return -1;
            }
            continue;
        }
        if (err == SSL_ERROR_SYSCALL && errno == 0) {
            // Peer closed without close_notify.
            return 0;
        }
        if (out_err) *out_err = "SSL_read() failed: " + openssl_error_string();
        return -1;
    }
}

void TlsSession::shutdown() {
    if (m_ssl) {
        // One non-blocking attempt; the socket is closed right after.
        (void)SSL_shutdown(m_ssl);
        ERR_clear_error();
    }
}

std::string TlsSession::negotiated_alpn() const {
    if (!m_ssl) {
        return std::string();
    }
    const unsigned char* data = nullptr;
    unsigned int len = 0;
    SSL_get0_alpn_selected(m_ssl, &data, &len);
    if (!data || len == 0) {
        return std::string();
    }
    return std::string(reinterpret_cast<const char*>(data), len);
}

} // namespace masqueplus
