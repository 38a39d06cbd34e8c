#include "warp_validator.h"
#include "socks5_client.h"
#include "logger.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <signal.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

// Test result tracking
static int tests_passed = 0;
static int tests_failed = 0;

#define TEST_ASSERT(condition, msg) \
    do { \
        if (!(condition)) { \
            std::cerr << "FAIL: " << msg << " [" << __FILE__ << ":" << __LINE__ << "]" << std::endl; \
            tests_failed++; \
            return false; \
        } \
    } while(0)

#define TEST_PASS(msg) \
    do { \
        std::cout << "PASS: " << msg << std::endl; \
        tests_passed++; \
    } while(0)

using namespace masqueplus;

namespace {

int listen_loopback(uint16_t* out_port) {
    const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return -1;
    const int one = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 || ::listen(fd, 4) != 0) {
        ::close(fd);
        return -1;
    }
    socklen_t len = sizeof(addr);
    ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
    *out_port = ntohs(addr.sin_port);
    return fd;
}

bool read_n(int fd, std::string* out, size_t n) {
    while (out->size() < n) {
        char buf[256];
        const size_t want = std::min(sizeof(buf), n - out->size());
        const ssize_t got = ::recv(fd, buf, want, 0);
        if (got <= 0) return false;
        out->append(buf, static_cast<size_t>(got));
    }
    return true;
}

// One-shot SOCKS5 proxy that answers the tunnelled HTTP request itself.
struct FakeProxy {
    int listen_fd = -1;
    uint16_t port = 0;
    uint8_t connect_reply = 0x00;
    std::string http_response;
    std::string seen_target;
    std::string seen_request;
    std::thread worker;

    FakeProxy(uint8_t rep, std::string response)
        : connect_reply(rep), http_response(std::move(response)) {
        listen_fd = listen_loopback(&port);
        if (listen_fd >= 0) {
            worker = std::thread([this]() { serve(); });
        }
    }

    ~FakeProxy() {
        if (worker.joinable()) worker.join();
        if (listen_fd >= 0) ::close(listen_fd);
    }

    std::string address() const { return "127.0.0.1:" + std::to_string(port); }

    void serve() {
        const int fd = ::accept(listen_fd, nullptr, nullptr);
        if (fd < 0) return;

        std::string greeting;
        if (read_n(fd, &greeting, 3)) {
            const char method[2] = {0x05, 0x00};
            ::send(fd, method, sizeof(method), MSG_NOSIGNAL);

            std::string request;
            if (read_n(fd, &request, 5)) {
                const size_t name_len = static_cast<uint8_t>(request[4]);
                if (read_n(fd, &request, 5 + name_len + 2)) {
                    seen_target = request.substr(5, name_len);
                    const char reply[10] = {0x05, static_cast<char>(connect_reply), 0x00, 0x01, 0, 0, 0, 0, 0, 0};
                    ::send(fd, reply, sizeof(reply), MSG_NOSIGNAL);
                    if (connect_reply == 0x00) {
                        serve_http(fd);
                    }
                }
            }
        }
        ::close(fd);
    }

    void serve_http(int fd) {
        char buf[512];
        while (seen_request.find("\r\n\r\n") == std::string::npos) {
            const ssize_t got = ::recv(fd, buf, sizeof(buf), 0);
            if (got <= 0) return;
            seen_request.append(buf, static_cast<size_t>(got));
        }
        ::send(fd, http_response.data(), http_response.size(), MSG_NOSIGNAL);
    }
};

std::string http_reply(const std::string& status_line, const std::string& body) {
    return status_line + "\r\nContent-Type: text/plain\r\nContent-Length: " + std::to_string(body.size()) +
           "\r\n\r\n" + body;
}

WarpCheckOptions options_for(const FakeProxy& proxy) {
    WarpCheckOptions options;
    options.proxy_address = proxy.address();
    options.url = "http://trace.test/cdn-cgi/trace";
    options.timeout_ms = 2000;
    return options;
}

const char kTraceOn[] = "fl=29f\nh=trace.test\nip=198.51.100.7\nWARP=On\ngateway=off\n";
const char kTraceOff[] = "fl=29f\nh=trace.test\nip=203.0.113.9\nwarp=off\ngateway=off\n";

} // namespace

static bool test_parse_url() {
    ParsedUrl url;
    std::string err;
    TEST_ASSERT(parse_url("https://www.cloudflare.com/cdn-cgi/trace", &url, &err), "default trace url");
    TEST_ASSERT(url.scheme == "https" && url.host == "www.cloudflare.com" && url.port == "443" &&
                url.path == "/cdn-cgi/trace", "https fields");

    TEST_ASSERT(parse_url("http://example.test", &url, &err), "no path");
    TEST_ASSERT(url.port == "80" && url.path == "/", "http defaults");

    TEST_ASSERT(parse_url("http://[2001:db8::1]:8080/x?y=1", &url, &err), "bracketed v6 with port");
    TEST_ASSERT(url.host == "2001:db8::1" && url.port == "8080" && url.path == "/x?y=1", "v6 fields");

    TEST_ASSERT(parse_url("https://[2001:db8::2]/", &url, &err) && url.host == "2001:db8::2" && url.port == "443",
                "bracketed v6 without port");

    TEST_ASSERT(!parse_url("ftp://example.test/", &url, &err), "ftp rejected");
    TEST_ASSERT(!parse_url("example.test/trace", &url, &err), "missing scheme rejected");
    TEST_ASSERT(!parse_url("http:///trace", &url, &err), "missing host rejected");
    TEST_ASSERT(!parse_url("http://example.test:http/", &url, &err), "named port rejected");
    TEST_ASSERT(!parse_url("http://example.test:0/", &url, &err), "port 0 rejected");
    TEST_PASS("URL parsing");
    return true;
}

static bool test_response_helpers() {
    int status = 0;
    TEST_ASSERT(parse_http_status_line("HTTP/1.1 200 OK\r\nServer: x", &status) && status == 200, "200");
    TEST_ASSERT(parse_http_status_line("HTTP/1.0 503 Service Unavailable", &status) && status == 503, "503");
    TEST_ASSERT(!parse_http_status_line("SSH-2.0-OpenSSH", &status), "not HTTP");
    TEST_ASSERT(!parse_http_status_line("HTTP/1.1 abc", &status), "non-numeric status");

    TEST_ASSERT(body_has_marker("ip=1.2.3.4\nwarp=on\n", "warp=on"), "exact marker");
    TEST_ASSERT(body_has_marker("WARP=ON", "warp=on"), "case-insensitive marker");
    TEST_ASSERT(!body_has_marker("warp=off", "warp=on"), "off is not on");
    TEST_ASSERT(body_has_marker("anything", ""), "empty marker always matches");
    TEST_PASS("status line and marker helpers");
    return true;
}

static bool test_timeout_cap() {
    TEST_ASSERT(effective_warp_timeout_ms(10000) == 5000, "capped at 5s");
    TEST_ASSERT(effective_warp_timeout_ms(2000) == 2000, "shorter timeout kept");
    TEST_ASSERT(effective_warp_timeout_ms(0) == 5000, "zero means the cap");
    TEST_ASSERT(effective_warp_timeout_ms(-1) == 5000, "negative means the cap");
    TEST_PASS("warp check timeout cap");
    return true;
}

static bool test_socks5_bytes() {
    const std::string greeting = socks5_greeting();
    TEST_ASSERT(greeting == std::string("\x05\x01\x00", 3), "no-auth greeting");

    const std::string request = socks5_connect_request("a.io", 443);
    const std::string expected("\x05\x01\x00\x03\x04" "a.io" "\x01\xbb", 11);
    TEST_ASSERT(request == expected, "domain CONNECT request");
    TEST_ASSERT(std::string(socks5_reply_to_string(0x05)) == "connection refused", "reply text");
    TEST_PASS("SOCKS5 request encoding");
    return true;
}

static bool test_policy() {
    WarpCheckResult ok;
    ok.status = WarpStatus::OK;
    WarpCheckResult off;
    off.status = WarpStatus::NO_WARP;
    TEST_ASSERT(warp_check_permits(WarpCheckPolicy::OBSERVE, off), "observe never rejects");
    TEST_ASSERT(warp_check_permits(WarpCheckPolicy::ENFORCE, ok), "enforce accepts OK");
    TEST_ASSERT(!warp_check_permits(WarpCheckPolicy::ENFORCE, off), "enforce rejects NO_WARP");
    TEST_ASSERT(std::string(warp_status_to_string(WarpStatus::HTTP_FAIL)) == "HTTP_FAIL", "status name");
    TEST_PASS("observe and enforce policies");
    return true;
}

static bool test_warp_on() {
    FakeProxy proxy(0x00, http_reply("HTTP/1.1 200 OK", kTraceOn));
    TEST_ASSERT(proxy.listen_fd >= 0, "proxy listening");
    const WarpCheckResult result = WarpValidator(options_for(proxy)).check();
    proxy.worker.join();

    TEST_ASSERT(result.status == WarpStatus::OK, "warp on detected: " + result.error);
    TEST_ASSERT(result.http_status == 200, "status recorded");
    TEST_ASSERT(result.body_bytes == sizeof(kTraceOn) - 1, "body size recorded");
    TEST_ASSERT(proxy.seen_target == "trace.test", "CONNECT names the URL host");
    TEST_ASSERT(proxy.seen_request.rfind("GET /cdn-cgi/trace HTTP/1.", 0) == 0, "request line");
    TEST_ASSERT(proxy.seen_request.find("Host: trace.test\r\n") != std::string::npos, "Host header");
    TEST_PASS("trace through SOCKS5 reports warp=on");
    return true;
}

static bool test_warp_off() {
    FakeProxy proxy(0x00, http_reply("HTTP/1.1 200 OK", kTraceOff));
    TEST_ASSERT(proxy.listen_fd >= 0, "proxy listening");
    const WarpCheckResult result = WarpValidator(options_for(proxy)).check();
    proxy.worker.join();
    TEST_ASSERT(result.status == WarpStatus::NO_WARP, "marker absent");
    TEST_ASSERT(result.http_status == 200, "status recorded");
    TEST_PASS("trace without the marker reports NO_WARP");
    return true;
}

static bool test_http_failure() {
    FakeProxy proxy(0x00, http_reply("HTTP/1.1 503 Service Unavailable", "warp=on"));
    TEST_ASSERT(proxy.listen_fd >= 0, "proxy listening");
    const WarpCheckResult result = WarpValidator(options_for(proxy)).check();
    proxy.worker.join();
    TEST_ASSERT(result.status == WarpStatus::HTTP_FAIL, "non-200 is HTTP_FAIL even with the marker");
    TEST_ASSERT(result.http_status == 503, "status recorded");

    FakeProxy garbage(0x00, "this is not http\r\n\r\n");
    TEST_ASSERT(garbage.listen_fd >= 0, "proxy listening");
    const WarpCheckResult bad = WarpValidator(options_for(garbage)).check();
    garbage.worker.join();
    TEST_ASSERT(bad.status == WarpStatus::HTTP_FAIL, "malformed response is HTTP_FAIL");
    TEST_PASS("HTTP failures");
    return true;
}

static bool test_connection_failures() {
    uint16_t port = 0;
    const int fd = listen_loopback(&port);
    TEST_ASSERT(fd >= 0, "ephemeral port");
    ::close(fd);

    WarpCheckOptions options;
    options.proxy_address = "127.0.0.1:" + std::to_string(port);
    options.url = "http://trace.test/";
    options.timeout_ms = 1000;
    const WarpCheckResult refused = WarpValidator(options).check();
    TEST_ASSERT(refused.status == WarpStatus::CONN_FAIL, "nothing listening is CONN_FAIL");
    TEST_ASSERT(!refused.error.empty(), "error text present");

    FakeProxy rejecting(0x05, "");
    TEST_ASSERT(rejecting.listen_fd >= 0, "proxy listening");
    const WarpCheckResult rejected = WarpValidator(options_for(rejecting)).check();
    rejecting.worker.join();
    TEST_ASSERT(rejected.status == WarpStatus::CONN_FAIL, "SOCKS refusal is CONN_FAIL");
    TEST_ASSERT(rejected.error.find("connection refused") != std::string::npos, "SOCKS reply reported");

    WarpCheckOptions bad_url;
    bad_url.proxy_address = "127.0.0.1:1";
    bad_url.url = "gopher://trace.test/";
    TEST_ASSERT(WarpValidator(bad_url).check().status == WarpStatus::CONN_FAIL, "unusable URL is CONN_FAIL");
    TEST_PASS("connection failures");
    return true;
}

int main() {
    signal(SIGPIPE, SIG_IGN);
    set_log_level(LogLevel::ERROR);

    test_parse_url();
    test_response_helpers();
    test_timeout_cap();
    test_socks5_bytes();
    test_policy();
    test_warp_on();
    test_warp_off();
    test_http_failure();
    test_connection_failures();

    std::cout << "\n========================================" << std::endl;
    std::cout << "Test Summary:" << std::endl;
    std::cout << "  Passed: " << tests_passed << std::endl;
    std::cout << "  Failed: " << tests_failed << std::endl;
    std::cout << "========================================" << std::endl;

    return tests_failed > 0 ? 1 : 0;
}
