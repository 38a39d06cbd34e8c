#include "config_manager.h"
#include "logger.h"

#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <iostream>
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

using masqueplus::ConfigManager;
using masqueplus::json;

static bool test_defaults_for_empty_document() {
    ConfigManager& cfg = ConfigManager::getInstance();
    cfg.reset();

    TEST_ASSERT(cfg.getUsqueBinary() == "./usque", "default usque binary");
    TEST_ASSERT(cfg.getUsqueConfigPath() == "./config.json", "default usque config");
    TEST_ASSERT(cfg.getStatePath() == "./state.json", "default state path");
    TEST_ASSERT(cfg.getBindAddress() == "127.0.0.1:1080", "default bind");
    TEST_ASSERT(cfg.getConnectTimeoutMs() == 15 * 60 * 1000, "default connect timeout is 15m");
    TEST_ASSERT(cfg.getIpVersion() == "any", "default ip version");
    TEST_ASSERT(cfg.getV4Ranges().size() == 1 && cfg.getV4Ranges()[0] == "162.159.198.0/24", "default v4 range");
    TEST_ASSERT(cfg.getV6Ranges().size() == 1 && cfg.getV6Ranges()[0] == "2606:4700:103::/64", "default v6 range");
    TEST_ASSERT(cfg.getPorts().size() == 1 && cfg.getPorts()[0] == 443, "default port list");
    TEST_ASSERT(cfg.getMaxCandidates() == 0, "default cap means all");
    TEST_ASSERT(cfg.getScanTimeoutMs() == 10000, "default scan timeout");
    TEST_ASSERT(!cfg.isShuffleEnabled(), "shuffle off by default");
    TEST_ASSERT(cfg.getRandomSeed() == 0, "seed 0 by default");
    TEST_ASSERT(!cfg.isPrecheckEnabled(), "precheck off by default");
    TEST_ASSERT(cfg.getPrecheckMode() == "quic", "precheck mode quic");
    TEST_ASSERT(cfg.getProbeTimeoutMs() == 3000, "probe timeout 3s");
    TEST_ASSERT(cfg.getTunnelFailureThreshold() == 3, "tunnel threshold 3");
    TEST_ASSERT(!cfg.isWarpCheckEnabled() && !cfg.isWarpCheckEnforced(), "warp check off");
    TEST_ASSERT(cfg.getWarpCheckUrl() == "https://www.cloudflare.com/cdn-cgi/trace", "trace url");
    TEST_ASSERT(cfg.getWarpCheckTimeoutMs() == 5000, "warp check timeout");
    TEST_ASSERT(cfg.getLogLevel() == "info", "log level info");
    TEST_PASS("empty settings fall back to built-in defaults");
    return true;
}

static bool test_load_from_string() {
    ConfigManager& cfg = ConfigManager::getInstance();
    std::string err;
    const bool ok = cfg.loadFromString(R"({
        "proxy": {"bind": "127.0.0.1:2080"},
        "scanner": {"ports": [443, 8443, "bad"], "shuffle": true, "seed": 42, "ip_version": "v6"},
        "supervisor": {"tunnel_failure_threshold": 5}
    })", &err);
    TEST_ASSERT(ok, "valid settings load: " + err);
    TEST_ASSERT(cfg.getBindAddress() == "127.0.0.1:2080", "bind overridden");
    TEST_ASSERT(cfg.getPorts().size() == 2 && cfg.getPorts()[1] == 8443, "non-integer port entries ignored");
    TEST_ASSERT(cfg.isShuffleEnabled(), "shuffle on");
    TEST_ASSERT(cfg.getRandomSeed() == 42, "seed read");
    TEST_ASSERT(cfg.getIpVersion() == "v6", "ip version read");
    TEST_ASSERT(cfg.getTunnelFailureThreshold() == 5, "threshold read");
    TEST_ASSERT(cfg.getScanTimeoutMs() == 10000, "untouched keys keep defaults");
    TEST_PASS("partial settings document overrides only its keys");
    return true;
}

static bool test_wrong_types_fall_back() {
    ConfigManager& cfg = ConfigManager::getInstance();
    std::string err;
    TEST_ASSERT(cfg.loadFromString(R"({"proxy": {"connect_timeout_ms": "soon"}, "probe": "yes"})", &err),
                "document loads");
    TEST_ASSERT(cfg.getConnectTimeoutMs() == 15 * 60 * 1000, "string timeout ignored");
    TEST_ASSERT(!cfg.isPrecheckEnabled(), "non-object section ignored");
    TEST_PASS("mistyped values fall back to defaults");
    return true;
}

static bool test_rejects_bad_documents() {
    ConfigManager& cfg = ConfigManager::getInstance();
    std::string err;
    TEST_ASSERT(!cfg.loadFromString("{not json", &err), "malformed JSON rejected");
    TEST_ASSERT(err.find("settings parse failed") != std::string::npos, "parse error reported");
    err.clear();
    TEST_ASSERT(!cfg.loadFromString("[1, 2]", &err), "non-object rejected");
    err.clear();
    TEST_ASSERT(!cfg.loadConfig("/nonexistent/masque-plus.json", &err), "missing file is an error");
    TEST_ASSERT(err.find("/nonexistent/masque-plus.json") != std::string::npos, "error names the path");
    TEST_PASS("malformed or missing settings are reported");
    return true;
}

static bool test_load_file_and_overrides() {
    ConfigManager& cfg = ConfigManager::getInstance();
    const std::string path = (std::filesystem::temp_directory_path() /
                              ("masqueplus_settings_" + std::to_string(::getpid()) + ".json")).string();
    {
        std::ofstream out(path);
        out << R"({"usque": {"binary": "/opt/usque"}, "logging": {"level": "debug"}})";
    }

    std::string err;
    TEST_ASSERT(cfg.loadConfig(path, &err), "settings file loads: " + err);
    TEST_ASSERT(cfg.getUsqueBinary() == "/opt/usque", "binary from file");
    TEST_ASSERT(cfg.getLogLevel() == "debug", "log level from file");

    cfg.setValueAtPath({"usque", "binary"}, "/usr/local/bin/usque");
    cfg.setValueAtPath({"warp_check", "enforce"}, true);
    cfg.setValueAtPath({"scanner", "v4_ranges"}, json::array({"192.0.2.0/30", "198.51.100.0/31"}));
    TEST_ASSERT(cfg.getUsqueBinary() == "/usr/local/bin/usque", "override replaces file value");
    TEST_ASSERT(cfg.isWarpCheckEnforced(), "override creates missing section");
    TEST_ASSERT(cfg.getV4Ranges().size() == 2, "list override");
    TEST_ASSERT(!cfg.setValueAtPath({}, 1), "empty path rejected");

    std::filesystem::remove(path);
    cfg.reset();
    TEST_PASS("settings file plus command-line overrides");
    return true;
}

int main() {
    masqueplus::set_log_level(LogLevel::ERROR);

    test_defaults_for_empty_document();
    test_load_from_string();
    test_wrong_types_fall_back();
    test_rejects_bad_documents();
    test_load_file_and_overrides();

    std::cout << "\n========================================" << std::endl;
    std::cout << "Test Summary:" << std::endl;
    std::cout << "  Passed: " << tests_passed << std::endl;
    std::cout << "  Failed: " << tests_failed << std::endl;
    std::cout << "========================================" << std::endl;

    return tests_failed > 0 ? 1 : 0;
}
