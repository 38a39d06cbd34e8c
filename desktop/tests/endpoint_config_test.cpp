#include "endpoint_config_store.h"
#include "socket_utils.h"
#include "logger.h"

#include <sys/stat.h>
#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

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

std::string temp_path(const std::string& name) {
    return (std::filesystem::temp_directory_path() /
            ("masqueplus_" + name + "_" + std::to_string(::getpid()) + ".json")).string();
}

std::string read_file(const std::string& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

static bool test_parse_endpoint() {
    ParsedEndpoint ep;
    std::string err;
    TEST_ASSERT(parse_endpoint("162.159.198.1:443", &ep, &err), "v4 with port");
    TEST_ASSERT(ep.ip == "162.159.198.1" && ep.port == "443" && !ep.is_ipv6, "v4 fields");
    TEST_ASSERT(ep.port_given, "explicit port recorded");

    TEST_ASSERT(parse_endpoint("162.159.198.2", &ep, &err), "bare v4");
    TEST_ASSERT(ep.port == "443", "bare v4 defaults to 443");
    TEST_ASSERT(!ep.port_given, "bare v4 has no explicit port");

    TEST_ASSERT(parse_endpoint("[2606:4700:103::1]:8443", &ep, &err), "bracketed v6 with port");
    TEST_ASSERT(ep.ip == "2606:4700:103::1" && ep.port == "8443" && ep.is_ipv6, "v6 fields");

    TEST_ASSERT(parse_endpoint("2606:4700:103::2", &ep, &err), "bare v6");
    TEST_ASSERT(ep.is_ipv6 && ep.port == "443", "bare v6 default port");

    TEST_ASSERT(!parse_endpoint("engage.cloudflareclient.com:2408", &ep, &err), "hostname rejected");
    TEST_ASSERT(!parse_endpoint("162.159.198.1:0", &ep, &err), "port 0 rejected");
    TEST_ASSERT(!parse_endpoint("162.159.198.1:70000", &ep, &err), "port too large rejected");
    TEST_ASSERT(!parse_endpoint("162.159.198.1:https", &ep, &err), "named port rejected");
    TEST_ASSERT(!parse_endpoint("", &ep, &err), "empty rejected");
    TEST_PASS("endpoint parsing");
    return true;
}

static bool test_parse_bind_address() {
    std::string ip;
    std::string port;
    std::string err;
    TEST_ASSERT(parse_bind_address("127.0.0.1:1080", &ip, &port, &err), "default bind");
    TEST_ASSERT(ip == "127.0.0.1" && port == "1080", "bind fields");
    TEST_ASSERT(parse_bind_address("[::1]:1080", &ip, &port, &err) && ip == "::1", "v6 bind");
    TEST_ASSERT(!parse_bind_address("127.0.0.1", &ip, &port, nullptr), "missing port rejected without err sink");
    TEST_ASSERT(!parse_bind_address("localhost:1080", &ip, &port, &err), "hostname rejected");
    TEST_PASS("bind address parsing");
    return true;
}

static bool test_host_port_helpers() {
    std::string host;
    std::string port;
    std::string err;
    TEST_ASSERT(split_host_port("[2001:db8::1]:443", &host, &port, &err) && host == "2001:db8::1", "bracketed split");
    TEST_ASSERT(!split_host_port("2001:db8::1:443", &host, &port, &err), "unbracketed v6 with port rejected");
    TEST_ASSERT(join_host_port("2001:db8::1", "443") == "[2001:db8::1]:443", "v6 join brackets");
    TEST_ASSERT(join_host_port("192.0.2.1", "443") == "192.0.2.1:443", "v4 join");
    TEST_PASS("host:port helpers");
    return true;
}

static bool test_set_endpoint_preserves_keys() {
    const std::string path = temp_path("usque_config");
    {
        std::ofstream out(path);
        out << R"({"private_key": "abc", "id": "dev-1", "endpoint_v4": "1.1.1.1", "endpoint_v4_port": "2408", "nested": {"a": [1, 2]}})";
    }

    EndpointConfigStore store(path);
    std::string err;
    TEST_ASSERT(store.exists(), "config exists");
    TEST_ASSERT(store.load(&err), "config loads: " + err);
    TEST_ASSERT(store.set_endpoint("162.159.198.1:443", &err), "set v4");
    TEST_ASSERT(store.save(&err), "save: " + err);

    EndpointConfigStore reloaded(path);
    TEST_ASSERT(reloaded.load(&err), "reload");
    const auto& doc = reloaded.document();
    TEST_ASSERT(doc["endpoint_v4"] == "162.159.198.1", "endpoint_v4 updated");
    TEST_ASSERT(doc["endpoint_v4_port"] == "443", "endpoint_v4_port stored as string");
    TEST_ASSERT(doc["private_key"] == "abc" && doc["id"] == "dev-1", "unrelated keys preserved");
    TEST_ASSERT(doc["nested"]["a"].size() == 2, "nested values preserved");
    TEST_ASSERT(!doc.contains("endpoint_v6"), "v6 keys untouched");

    TEST_ASSERT(reloaded.set_endpoint("[2606:4700:103::1]:443", &err), "set v6");
    TEST_ASSERT(reloaded.save(&err), "save v6");
    const std::string text = read_file(path);
    TEST_ASSERT(text.find("\"endpoint_v6\": \"2606:4700:103::1\"") != std::string::npos, "v6 written, 2-space pretty");
    TEST_ASSERT(text.find("\n  \"endpoint_v4\"") != std::string::npos, "two-space indentation");
    TEST_ASSERT(text.find("\"endpoint_v4\": \"162.159.198.1\"") != std::string::npos, "v4 kept alongside v6");

    struct stat st{};
    TEST_ASSERT(::stat(path.c_str(), &st) == 0 && (st.st_mode & 0777) == 0644, "mode 0644");

    TEST_ASSERT(!reloaded.set_endpoint("example.com:443", &err), "hostname rejected by store");

    std::filesystem::remove(path);
    TEST_PASS("endpoint rewrite keeps every other key");
    return true;
}

static bool test_bare_ip_keeps_port_key() {
    const std::string path = temp_path("bare_ip");
    {
        std::ofstream out(path);
        out << R"({"private_key": "abc", "endpoint_v4": "1.1.1.1", "endpoint_v4_port": "2408"})";
    }

    EndpointConfigStore store(path);
    std::string err;
    TEST_ASSERT(store.load(&err), "config loads: " + err);
    TEST_ASSERT(store.set_endpoint("162.159.198.2", &err), "bare v4 accepted");
    TEST_ASSERT(store.document()["endpoint_v4"] == "162.159.198.2", "ip updated");
    TEST_ASSERT(store.document()["endpoint_v4_port"] == "2408", "existing port left alone");

    TEST_ASSERT(store.set_endpoint("2606:4700:103::2", &err), "bare v6 accepted");
    TEST_ASSERT(store.document()["endpoint_v6"] == "2606:4700:103::2", "v6 ip written");
    TEST_ASSERT(!store.document().contains("endpoint_v6_port"), "no port key invented for a bare ip");

    TEST_ASSERT(store.set_endpoint("162.159.198.2:8443", &err), "explicit port");
    TEST_ASSERT(store.document()["endpoint_v4_port"] == "8443", "explicit port written");

    std::filesystem::remove(path);
    TEST_PASS("bare IP endpoint leaves the port key alone");
    return true;
}

static bool test_missing_and_malformed() {
    const std::string missing = temp_path("missing");
    std::filesystem::remove(missing);
    EndpointConfigStore store(missing);
    std::string err;
    TEST_ASSERT(!store.exists(), "missing file");
    TEST_ASSERT(store.load(&err) && store.document().empty(), "missing file loads as empty object");

    const std::string bad = temp_path("malformed");
    {
        std::ofstream out(bad);
        out << "{\"endpoint_v4\": ";
    }
    EndpointConfigStore broken(bad);
    err.clear();
    TEST_ASSERT(!broken.load(&err), "malformed JSON is an error");
    TEST_ASSERT(err.find(bad) != std::string::npos, "error names the file");
    std::filesystem::remove(bad);
    TEST_PASS("missing and malformed configs");
    return true;
}

static bool test_run_state() {
    const std::string path = temp_path("state");
    RunState state;
    state.endpoint = "162.159.198.2:443";
    state.socks = "127.0.0.1:1080";
    std::string err;
    TEST_ASSERT(save_run_state(path, state, &err), "state saved: " + err);

    RunState loaded;
    TEST_ASSERT(load_run_state(path, &loaded, &err), "state loaded: " + err);
    TEST_ASSERT(loaded.endpoint == state.endpoint && loaded.socks == state.socks, "fields survive");

    const std::string text = read_file(path);
    TEST_ASSERT(text.find("\"socks\": \"127.0.0.1:1080\"") != std::string::npos, "state file layout");

    TEST_ASSERT(!load_run_state(temp_path("no_state"), &loaded, &err), "missing state is an error");
    std::filesystem::remove(path);
    TEST_PASS("run state persistence");
    return true;
}

int main() {
    set_log_level(LogLevel::ERROR);

    test_parse_endpoint();
    test_parse_bind_address();
    test_host_port_helpers();
    test_set_endpoint_preserves_keys();
    test_bare_ip_keeps_port_key();
    test_missing_and_malformed();
    test_run_state();

    std::cout << "\n========================================" << std::endl;
    std::cout << "Test Summary:" << std::endl;
    std::cout << "  Passed: " << tests_passed << std::endl;
    std::cout << "  Failed: " << tests_failed << std::endl;
    std::cout << "========================================" << std::endl;

    return tests_failed > 0 ? 1 : 0;
}
