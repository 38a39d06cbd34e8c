#include "warp_validator.h"
#include "constants.h"
#include "logger.h"
#include "socket_utils.h"
#include "socks5_client.h"
#include "tls_session.h"

#include <sys/socket.h>
#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <memory>
#include <stdexcept>
#include <utility>

namespace masqueplus {

namespace {

std::string to_lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    return s;
}

// Plain-socket counterpart of TlsSession::read_some.
long plain_read_some(int fd, char* buf, size_t len, const Deadline& deadline, std::string* out_err) {
    for (;;) {
        const WaitResult waited = wait_fd(fd, POLLIN, deadline.remaining_ms(), out_err);
        if (waited == WaitResult::TIMEOUT) {
            if (out_err) *out_err = "read timed out";
            return -1;
        }
        if (waited == WaitResult::FAILED) {
            return -1;
        }
        const ssize_t n = ::recv(fd, buf, len, 0);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            if (out_err) *out_err = "recv() failed: " + errno_string(errno);
            return -1;
        }
        return static_cast<long>(n);
    }
}

} // namespace

bool parse_url(const std::string& url, ParsedUrl* out, std::string* out_err) {
    ParsedUrl parsed;
    const size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        if (out_err) *out_err = "missing scheme in URL: " + url;
        return false;
    }
    parsed.scheme = to_lower(url.substr(0, scheme_end));
    if (parsed.scheme != "http" && parsed.scheme != "https") {
        if (out_err) *out_err = "unsupported URL scheme: " + parsed.scheme;
        return false;
    }

    const size_t authority_start = scheme_end + 3;
    const size_t path_start = url.find('/', authority_start);
    const std::string authority = url.substr(authority_start,
        path_start == std::string::npos ? std::string::npos : path_start - authority_start);
    parsed.path = path_start == std::string::npos ? "/" : url.substr(path_start);

    if (authority.empty()) {
        if (out_err) *out_err = "missing host in URL: " + url;
        return false;
    }

    const bool bracketed = authority.front() == '[';
    const size_t colon = authority.rfind(':');
    const bool has_port = colon != std::string::npos &&
        (!bracketed || colon > authority.find(']'));
    if (has_port) {
        std::string err;
        if (!split_host_port(authority, &parsed.host, &parsed.port, &err)) {
            if (out_err) *out_err = "invalid URL authority: " + err;
            return false;
        }
    } else {
        parsed.host = bracketed ? authority.substr(1, authority.size() - 2) : authority;
        parsed.port = parsed.scheme == "https" ? "443" : "80";
    }

    if (parsed.host.empty()) {
        if (out_err) *out_err = "missing host in URL: " + url;
        return false;
    }
    const bool numeric_port = !parsed.port.empty() && parsed.port.size() <= 5 &&
        std::all_of(parsed.port.begin(), parsed.port.end(),
                    [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
    if (!numeric_port || std::stoi(parsed.port) < 1 || std::stoi(parsed.port) > 65535) {
        if (out_err) *out_err = "invalid port in URL: " + url;
        return false;
    }
    if (out) *out = std::move(parsed);
    return true;
}

bool parse_http_status_line(const std::string& head, int* out_status) {
    if (head.compare(0, 5, "HTTP/") != 0) {
        return false;
    }
    const size_t space = head.find(' ');
    if (space == std::string::npos || space + 4 > head.size()) {
        return false;
    }
    int status = 0;
    for (size_t i = space + 1; i < space + 4; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(head[i]))) {
            return false;
        }
        status = status * 10 + (head[i] - '0');
    }
    if (out_status) *out_status = status;
    return true;
}

bool body_has_marker(const std::string& body, const std::string& marker) {
    if (marker.empty()) {
        return true;
    }
    return to_lower(body).find(to_lower(marker)) != std::string::npos;
}

int effective_warp_timeout_ms(int configured_ms) {
    if (configured_ms <= 0) {
        return WARP_CHECK_TIMEOUT_CAP_MS;
    }
    return std::min(configured_ms, WARP_CHECK_TIMEOUT_CAP_MS);
}

const char* warp_status_to_string(WarpStatus status) {
    switch (status) {
    case WarpStatus::OK: return "OK";
    case WarpStatus::NO_WARP: return "NO_WARP";
    case WarpStatus::HTTP_FAIL: return "HTTP_FAIL";
    case WarpStatus::CONN_FAIL: return "CONN_FAIL";
    }
    return "CONN_FAIL";
}

bool warp_check_permits(WarpCheckPolicy policy, const WarpCheckResult& result) {
    return policy == WarpCheckPolicy::OBSERVE || result.status == WarpStatus::OK;
}

WarpValidator::WarpValidator(WarpCheckOptions options) : m_options(std::move(options)) {}

WarpCheckResult WarpValidator::check() const {
    const auto started = std::chrono::steady_clock::now();
    WarpCheckResult result = fetch();
    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    const LogFields fields = {
        {"status", warp_status_to_string(result.status)},
        {"http_status", result.http_status > 0 ? std::to_string(result.http_status) : std::string()},
        {"elapsed", std::to_string(result.elapsed.count()) + "ms"},
        {"err", result.error},
    };
    if (result.status == WarpStatus::OK) {
        LOG_INFO("warp check passed", fields);
    } else {
        LOG_WARN("warp check failed", fields);
    }
    return result;
}

WarpCheckResult WarpValidator::fetch() const {
    WarpCheckResult result;

    ParsedUrl url;
    std::string err;
    if (!parse_url(m_options.url, &url, &err)) {
        result.status = WarpStatus::CONN_FAIL;
        result.error = err;
        return result;
    }
    std::string proxy_host;
    std::string proxy_port;
    if (!split_host_port(m_options.proxy_address, &proxy_host, &proxy_port, &err)) {
        result.status = WarpStatus::CONN_FAIL;
        result.error = "invalid proxy address: " + err;
        return result;
    }

    Deadline deadline(effective_warp_timeout_ms(m_options.timeout_ms));
    const int fd = open_tcp_connection(proxy_host, proxy_port, deadline.remaining_ms(), &err);
    if (fd < 0) {
        result.status = WarpStatus::CONN_FAIL;
        result.error = "proxy connect: " + err;
        return result;
    }

    std::unique_ptr<TlsSession> tls;
    std::string response;
    bool ok = socks5_connect(fd, url.host, static_cast<uint16_t>(std::stoi(url.port)), deadline, &err);
    if (ok && url.scheme == "https") {
        try {
            tls = std::make_unique<TlsSession>();
        } catch (const std::exception& e) {
            ::close(fd);
            result.status = WarpStatus::CONN_FAIL;
            result.error = e.what();
            return result;
        }
        TlsFailure failure = TlsFailure::NONE;
        ok = tls->connect(fd, url.host, {"http/1.1"}, deadline, &err, &failure);
    }

    if (ok) {
        const std::string request =
            "GET " + url.path + " HTTP/1.0\r\n"
            "Host: " + url.host + "\r\n"
            "User-Agent: masque-plus\r\n"
            "Accept: */*\r\n"
            "Connection: close\r\n\r\n";
        ok = tls ? tls->write_all(request, deadline, &err)
                 : send_all(fd, request.data(), request.size(), deadline, &err);
    }

    if (ok) {
        const size_t limit = WARP_CHECK_BODY_LIMIT + 16 * 1024;
        char buf[8192];
        for (;;) {
            std::string read_err;
            const long n = tls ? tls->read_some(buf, sizeof(buf), deadline, &read_err)
                               : plain_read_some(fd, buf, sizeof(buf), deadline, &read_err);
            if (n == 0) {
                break;
            }
            if (n < 0) {
                // A partial response is still evaluated below.
                if (response.empty()) {
                    ok = false;
                    err = read_err;
                }
                break;
            }
            response.append(buf, static_cast<size_t>(n));
            if (response.size() >= limit) {
                break;
            }
        }
    }

    if (tls) {
        tls->shutdown();
        tls.reset();
    }
    ::close(fd);

    if (!ok) {
        result.status = WarpStatus::CONN_FAIL;
        result.error = err;
        return result;
    }

    const size_t header_end = response.find("\r\n\r\n");
    int status = 0;
    if (header_end == std::string::npos || !parse_http_status_line(response, &status)) {
        result.status = WarpStatus::HTTP_FAIL;
        result.error = "malformed HTTP response";
        return result;
    }
    result.http_status = status;
    if (status != 200) {
        result.status = WarpStatus::HTTP_FAIL;
        result.error = "unexpected HTTP status " + std::to_string(status);
        return result;
    }

    std::string body = response.substr(header_end + 4);
    if (body.size() > WARP_CHECK_BODY_LIMIT) {
        body.resize(WARP_CHECK_BODY_LIMIT);
    }
    result.body_bytes = body.size();
    result.status = body_has_marker(body, m_options.marker) ? WarpStatus::OK : WarpStatus::NO_WARP;
    return result;
}

} // namespace masqueplus
