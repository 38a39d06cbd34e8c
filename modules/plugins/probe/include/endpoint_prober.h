#ifndef MASQUEPLUS_ENDPOINT_PROBER_H
#define MASQUEPLUS_ENDPOINT_PROBER_H

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace masqueplus {

enum class ProbeTransport {
    QUIC,
    TCP_TLS,
    ICMP
};

// Failure classes are used for logging only; any failure rejects the endpoint.
enum class ProbeFailure {
    NONE,
    HANDSHAKE,
    TIMEOUT,
    CONNECTION
};

struct ProbeResult {
    std::string endpoint;
    bool success = false;
    std::optional<std::string> error;
    std::chrono::milliseconds elapsed{0};
    ProbeTransport transport = ProbeTransport::QUIC;
    ProbeFailure failure = ProbeFailure::NONE;
    // Set when QUIC was asked for but this build has no QUIC client and the
    // probe ran over TLS instead.
    bool quic_unavailable = false;
};

struct ProbeOptions {
    int timeout_ms = 3000;
    ProbeTransport transport = ProbeTransport::QUIC;
    std::vector<std::string> quic_alpn = {"h3", "h3-29", "h3-32", "h3-34"};
    std::vector<std::string> tls_alpn = {"h2", "http/1.1"};
    // Without a QUIC client, run QUIC probes over TLS instead of failing them.
    bool tls_fallback = false;
};

const char* probe_transport_to_string(ProbeTransport transport);
const char* probe_failure_to_string(ProbeFailure failure);
bool parse_probe_transport(const std::string& value, ProbeTransport* out);

// Substring heuristics for errors reported by TLS stacks.
bool is_handshake_error(const std::string& error);
bool is_timeout_error(const std::string& error);

// Handshake-only reachability checks. The connection is torn down as soon as
// the handshake completes.
class EndpointProber {
public:
    explicit EndpointProber(ProbeOptions options);

    // True when the QUIC client was compiled in.
    static bool quic_supported();

    ProbeResult probe(const std::string& endpoint) const;

    // Sequential scan with one log line per endpoint.
    std::vector<ProbeResult> scan(const std::vector<std::string>& endpoints) const;

    const ProbeOptions& options() const { return m_options; }

private:
    ProbeResult probe_quic(const std::string& host, const std::string& port) const;
    ProbeResult probe_tls(const std::string& host, const std::string& port) const;
    ProbeResult probe_icmp(const std::string& host) const;

    ProbeOptions m_options;
};

} // namespace masqueplus

#endif // MASQUEPLUS_ENDPOINT_PROBER_H
