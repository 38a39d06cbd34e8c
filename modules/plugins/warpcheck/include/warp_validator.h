#ifndef MASQUEPLUS_WARP_VALIDATOR_H
#define MASQUEPLUS_WARP_VALIDATOR_H

#include <chrono>
#include <cstddef>
#include <string>

namespace masqueplus {

enum class WarpStatus {
    OK,         // 200 and the marker is present
    NO_WARP,    // 200 without the marker
    HTTP_FAIL,  // non-200 or unparseable response
    CONN_FAIL   // proxy, tunnel or TLS failure
};

// Whether a failed check rejects the candidate.
enum class WarpCheckPolicy {
    OBSERVE,
    ENFORCE
};

struct WarpCheckOptions {
    std::string proxy_address;   // local SOCKS5 bind, "ip:port"
    std::string url = "https://www.cloudflare.com/cdn-cgi/trace";
    int timeout_ms = 5000;
    std::string marker = "warp=on";
};

struct WarpCheckResult {
    WarpStatus status = WarpStatus::CONN_FAIL;
    int http_status = 0;
    size_t body_bytes = 0;
    std::string error;
    std::chrono::milliseconds elapsed{0};
};

struct ParsedUrl {
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;
};

bool parse_url(const std::string& url, ParsedUrl* out, std::string* out_err);

// Status code from "HTTP/1.x NNN reason".
bool parse_http_status_line(const std::string& head, int* out_status);

// Case-insensitive substring match.
bool body_has_marker(const std::string& body, const std::string& marker);

// min(configured, 5s); non-positive means the cap.
int effective_warp_timeout_ms(int configured_ms);

const char* warp_status_to_string(WarpStatus status);
bool warp_check_permits(WarpCheckPolicy policy, const WarpCheckResult& result);

// Fetches the trace URL through the local SOCKS5 proxy and looks for the
// marker in the body (at most 1 MiB is read).
class WarpValidator {
public:
    explicit WarpValidator(WarpCheckOptions options);

    WarpCheckResult check() const;

private:
    WarpCheckResult fetch() const;

    WarpCheckOptions m_options;
};

} // namespace masqueplus

#endif // MASQUEPLUS_WARP_VALIDATOR_H
