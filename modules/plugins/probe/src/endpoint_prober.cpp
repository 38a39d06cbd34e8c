#include "endpoint_prober.h"
#include "icmp_pinger.h"
#include "logger.h"
#include "socket_utils.h"
#include "tls_session.h"

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <sys/socket.h>
#include <netinet/in.h>
#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <stdexcept>
#include <utility>

namespace masqueplus {

namespace {

std::string to_lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    return s;
}

ProbeResult make_result(const std::string& host, const std::string& port, ProbeTransport transport) {
    ProbeResult result;
    result.endpoint = port.empty() ? host : join_host_port(host, port);
    result.transport = transport;
    return result;
}

void fail(ProbeResult& result, ProbeFailure failure, const std::string& error) {
    result.success = false;
    result.failure = failure;
    result.error = error;
}

ProbeFailure from_tls_failure(TlsFailure failure) {
    switch (failure) {
    case TlsFailure::HANDSHAKE: return ProbeFailure::HANDSHAKE;
    case TlsFailure::TIMEOUT: return ProbeFailure::TIMEOUT;
    case TlsFailure::IO:
    case TlsFailure::NONE:
        break;
    }
    return ProbeFailure::CONNECTION;
}

} // namespace

const char* probe_transport_to_string(ProbeTransport transport) {
    switch (transport) {
    case ProbeTransport::QUIC: return "quic";
    case ProbeTransport::TCP_TLS: return "tcp-tls";
    case ProbeTransport::ICMP: return "icmp";
    }
    return "quic";
}

const char* probe_failure_to_string(ProbeFailure failure) {
    switch (failure) {
    case ProbeFailure::NONE: return "none";
    case ProbeFailure::HANDSHAKE: return "handshake";
    case ProbeFailure::TIMEOUT: return "timeout";
    case ProbeFailure::CONNECTION: return "connection";
    }
    return "connection";
}

bool parse_probe_transport(const std::string& value, ProbeTransport* out) {
    const std::string v = to_lower(value);
    ProbeTransport transport;
    if (v == "quic") transport = ProbeTransport::QUIC;
    else if (v == "tls" || v == "tcp-tls" || v == "tcp") transport = ProbeTransport::TCP_TLS;
    else if (v == "icmp" || v == "ping") transport = ProbeTransport::ICMP;
    else return false;
    if (out) *out = transport;
    return true;
}

bool is_handshake_error(const std::string& error) {
    static const char* const kMarkers[] = {
        "handshake", "crypto_error", "remote error", "quic:", "alert", "bad certificate",
    };
    const std::string lower = to_lower(error);
    for (const char* marker : kMarkers) {
        if (lower.find(marker) != std::string::npos) {
            return true;
        }
    }
    return false;
}

bool is_timeout_error(const std::string& error) {
    const std::string lower = to_lower(error);
    return lower.find("timed out") != std::string::npos ||
           lower.find("timeout") != std::string::npos ||
           lower.find("deadline exceeded") != std::string::npos;
}

EndpointProber::EndpointProber(ProbeOptions options) : m_options(std::move(options)) {}

bool EndpointProber::quic_supported() {
#ifdef MASQUEPLUS_HAVE_OPENSSL_QUIC
    return true;
#else
    return false;
#endif
}

ProbeResult EndpointProber::probe(const std::string& endpoint) const {
    const auto started = std::chrono::steady_clock::now();

    std::string host;
    std::string port;
    std::string err;
    ProbeResult result;
    if (!split_host_port(endpoint, &host, &port, &err)) {
        result.endpoint = endpoint;
        result.transport = m_options.transport;
        fail(result, ProbeFailure::CONNECTION, err);
        return result;
    }

    switch (m_options.transport) {
    case ProbeTransport::QUIC:
        if (!quic_supported() && m_options.tls_fallback) {
            result = probe_tls(host, port);
            result.quic_unavailable = true;
        } else {
            result = probe_quic(host, port);
        }
        break;
    case ProbeTransport::TCP_TLS:
        result = probe_tls(host, port);
        break;
    case ProbeTransport::ICMP:
        result = probe_icmp(host);
        break;
    }
    result.endpoint = endpoint;
    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    return result;
}

std::vector<ProbeResult> EndpointProber::scan(const std::vector<std::string>& endpoints) const {
    std::vector<ProbeResult> results;
    results.reserve(endpoints.size());

    for (const auto& endpoint : endpoints) {
        ProbeResult result = probe(endpoint);
        LogFields fields = {
            {"endpoint", endpoint},
            {"transport", probe_transport_to_string(result.transport)},
            {"elapsed", std::to_string(result.elapsed.count()) + "ms"},
            {"err", result.error.value_or("")},
        };
        if (result.quic_unavailable) {
            fields.emplace_back("fallback", "quic-unavailable");
        }
        if (result.success) {
            LOG_INFO("endpoint ok", fields);
        } else if (result.failure == ProbeFailure::HANDSHAKE) {
            LOG_WARN("handshake failed; skipping endpoint", fields);
        } else if (result.failure == ProbeFailure::TIMEOUT) {
            LOG_WARN("scan timeout; skipping endpoint", fields);
        } else {
            LOG_WARN("connection failed; skipping endpoint", fields);
        }
        results.push_back(std::move(result));
    }
    return results;
}

ProbeResult EndpointProber::probe_tls(const std::string& host, const std::string& port) const {
    ProbeResult result = make_result(host, port, ProbeTransport::TCP_TLS);
    Deadline deadline(m_options.timeout_ms);

    std::string err;
    bool timed_out = false;
    const int fd = open_tcp_connection(host, port, deadline.remaining_ms(), &err, &timed_out);
    if (fd < 0) {
        fail(result, timed_out ? ProbeFailure::TIMEOUT : ProbeFailure::CONNECTION, err);
        return result;
    }

    TlsFailure tls_failure = TlsFailure::NONE;
    bool ok = false;
    try {
        TlsSession session;
        ok = session.connect(fd, host, m_options.tls_alpn, deadline, &err, &tls_failure);
        if (ok) {
            session.shutdown();
        }
    } catch (const std::exception& e) {
        err = e.what();
        tls_failure = TlsFailure::IO;
    }
    ::close(fd);

    if (!ok) {
        fail(result, from_tls_failure(tls_failure), err);
        return result;
    }
    result.success = true;
    return result;
}

ProbeResult EndpointProber::probe_icmp(const std::string& host) const {
    ProbeResult result = make_result(host, "", ProbeTransport::ICMP);
    const PingResult ping = icmp_ping(host, m_options.timeout_ms);
    if (!ping.success) {
        fail(result, ping.timed_out ? ProbeFailure::TIMEOUT : ProbeFailure::CONNECTION, ping.error);
        return result;
    }
    result.success = true;
    return result;
}

#ifdef MASQUEPLUS_HAVE_OPENSSL_QUIC

namespace {

// Builds the BIO_ADDR OpenSSL wants for the QUIC initial peer address.
BIO_ADDR* make_bio_addr(const ResolvedAddress& addr) {
    BIO_ADDR* out = BIO_ADDR_new();
    if (!out) {
        return nullptr;
    }
    int ok = 0;
    if (addr.family == AF_INET) {
        const auto* sin = reinterpret_cast<const sockaddr_in*>(&addr.addr);
        ok = BIO_ADDR_rawmake(out, AF_INET, &sin->sin_addr, sizeof(sin->sin_addr), sin->sin_port);
    } else if (addr.family == AF_INET6) {
        const auto* sin6 = reinterpret_cast<const sockaddr_in6*>(&addr.addr);
        ok = BIO_ADDR_rawmake(out, AF_INET6, &sin6->sin6_addr, sizeof(sin6->sin6_addr), sin6->sin6_port);
    }
    if (!ok) {
        BIO_ADDR_free(out);
        return nullptr;
    }
    return out;
}

} // namespace

ProbeResult EndpointProber::probe_quic(const std::string& host, const std::string& port) const {
    ProbeResult result = make_result(host, port, ProbeTransport::QUIC);
    Deadline deadline(m_options.timeout_ms);

    std::vector<ResolvedAddress> addrs;
    std::string err;
    if (!resolve_host(host, port, SOCK_DGRAM, &addrs, &err)) {
        fail(result, ProbeFailure::CONNECTION, err);
        return result;
    }
    const ResolvedAddress& target = addrs.front();

    const int fd = ::socket(target.family, SOCK_DGRAM, 0);
    if (fd < 0) {
        fail(result, ProbeFailure::CONNECTION, "socket() failed: " + errno_string(errno));
        return result;
    }
    if (::connect(fd, reinterpret_cast<const sockaddr*>(&target.addr), target.addr_len) != 0 ||
        !set_nonblocking(fd, true, &err)) {
        if (err.empty()) err = "connect() failed: " + errno_string(errno);
        ::close(fd);
        fail(result, ProbeFailure::CONNECTION, err);
        return result;
    }

    SSL_CTX* ctx = SSL_CTX_new(OSSL_QUIC_client_method());
    if (!ctx) {
        ::close(fd);
        fail(result, ProbeFailure::CONNECTION, "SSL_CTX_new(quic) failed: " + openssl_error_string());
        return result;
    }
    SSL_CTX_set_verify(ctx, SSL_VERIFY_NONE, nullptr);

    SSL* ssl = SSL_new(ctx);
    BIO* bio = BIO_new_dgram(fd, BIO_CLOSE);
    BIO_ADDR* peer = make_bio_addr(target);
    if (!ssl || !bio || !peer) {
        if (bio) BIO_free(bio); else ::close(fd);
        if (peer) BIO_ADDR_free(peer);
        if (ssl) SSL_free(ssl);
        SSL_CTX_free(ctx);
        fail(result, ProbeFailure::CONNECTION, "quic setup failed: " + openssl_error_string());
        return result;
    }
    // ssl owns bio (and through it fd) from here on.
    SSL_set_bio(ssl, bio, bio);

    const std::vector<unsigned char> alpn = encode_alpn(m_options.quic_alpn);
    bool setup_ok = SSL_set1_initial_peer_addr(ssl, peer) == 1 &&
                    SSL_set_alpn_protos(ssl, alpn.data(), static_cast<unsigned int>(alpn.size())) == 0 &&
                    SSL_set_blocking_mode(ssl, 0) == 1;
    if (setup_ok && !is_ip_literal(host)) {
        setup_ok = SSL_set_tlsext_host_name(ssl, host.c_str()) == 1;
    }
    BIO_ADDR_free(peer);

    if (!setup_ok) {
        fail(result, ProbeFailure::CONNECTION, "quic setup failed: " + openssl_error_string());
    } else {
        ERR_clear_error();
        for (;;) {
            const int ret = SSL_connect(ssl);
            if (ret == 1) {
                result.success = true;
                break;
            }
            const int ssl_err = SSL_get_error(ssl, ret);
            if (ssl_err != SSL_ERROR_WANT_READ && ssl_err != SSL_ERROR_WANT_WRITE) {
                std::string detail = openssl_error_string();
                if (detail.empty()) detail = "connection closed";
                const std::string message = "quic: handshake failed: " + detail;
                fail(result, is_timeout_error(detail) ? ProbeFailure::TIMEOUT : ProbeFailure::HANDSHAKE, message);
                break;
            }
            if (deadline.expired()) {
                fail(result, ProbeFailure::TIMEOUT, "quic handshake timed out");
                break;
            }

            // Sleep until the socket is ready or the QUIC engine needs a tick.
            timeval tv{};
            int infinite = 0;
            int wait_ms = deadline.remaining_ms();
            if (SSL_get_event_timeout(ssl, &tv, &infinite) == 1 && !infinite) {
                const int engine_ms = static_cast<int>(tv.tv_sec * 1000 + tv.tv_usec / 1000);
                wait_ms = std::min(wait_ms, std::max(engine_ms, 1));
            }
            short events = 0;
            if (SSL_net_read_desired(ssl)) events |= POLLIN;
            if (SSL_net_write_desired(ssl)) events |= POLLOUT;
            if (events == 0) events = POLLIN;

            std::string wait_err;
            if (wait_fd(fd, events, wait_ms, &wait_err) == WaitResult::FAILED) {
                fail(result, ProbeFailure::CONNECTION, wait_err);
                break;
            }
            (void)SSL_handle_events(ssl);
        }
    }

    if (result.success) {
        SSL_SHUTDOWN_EX_ARGS args{};
        args.quic_error_code = 0;
        args.quic_reason = "";
        (void)SSL_shutdown_ex(ssl, SSL_SHUTDOWN_FLAG_RAPID, &args, sizeof(args));
    }
    ERR_clear_error();
    SSL_free(ssl);
    SSL_CTX_free(ctx);
    return result;
}

#else

ProbeResult EndpointProber::probe_quic(const std::string& host, const std::string& port) const {
    ProbeResult result = make_result(host, port, ProbeTransport::QUIC);
    fail(result, ProbeFailure::CONNECTION,
         "quic probe unavailable: built without OpenSSL QUIC client support (OpenSSL 3.2 or newer)");
    return result;
}

#endif // MASQUEPLUS_HAVE_OPENSSL_QUIC

} // namespace masqueplus
