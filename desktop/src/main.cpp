#include "masque_app.h"
#include "config_manager.h"
#include "duration_utils.h"
#include "logger.h"
#include <atomic>
#include <iostream>
#include <string>
#include <vector>
#include <cctype>
#include <stdexcept>
#include <signal.h>
#include <filesystem>

using masqueplus::ConfigManager;
using masqueplus::json;

namespace {

std::atomic<bool> g_shutdown{false};

void handle_shutdown_signal(int) {
    g_shutdown.store(true);
}

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> out;
    std::string item;
    for (char c : value + ",") {
        if (c == ',') {
            size_t b = item.find_first_not_of(" \t");
            size_t e = item.find_last_not_of(" \t");
            if (b != std::string::npos) out.push_back(item.substr(b, e - b + 1));
            item.clear();
        } else {
            item.push_back(c);
        }
    }
    return out;
}

bool parse_int_arg(const std::string& flag, const std::string& value, int min_value, int* out) {
    try {
        size_t used = 0;
        int v = std::stoi(value, &used);
        if (used != value.size() || v < min_value) {
            std::cerr << "Error: invalid " << flag << " value: " << value << std::endl;
            return false;
        }
        *out = v;
        return true;
    } catch (const std::exception&) {
        std::cerr << "Error: invalid " << flag << " value: " << value << std::endl;
        return false;
    }
}

bool parse_duration_arg(const std::string& flag, const std::string& value, int* out) {
    std::string err;
    if (!masqueplus::parse_duration_ms(value, out, &err) || *out <= 0) {
        std::cerr << "Error: invalid " << flag << " value: " << (err.empty() ? value : err) << std::endl;
        return false;
    }
    return true;
}

} // namespace

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --endpoint EP          Endpoint to connect (IP, IP:Port or [IPv6]:Port)\n"
              << "  --bind IP:PORT         Local SOCKS proxy bind address (default: 127.0.0.1:1080)\n"
              << "  --renew                Force registration even if the usque config exists\n"
              << "  --scan                 Scan ranges and auto-select an endpoint\n"
              << "  -4 | -6                Restrict scanning to IPv4 or IPv6\n"
              << "  --connect-timeout DUR  Final connect timeout, e.g. 15s, 2m, 1h (default: 15m)\n"
              << "  --usque PATH           usque binary (default: ./usque)\n"
              << "  --config PATH          usque config file (default: ./config.json)\n"
              << "  --settings PATH        masque-plus settings file (default: masque-plus.json if present)\n"
              << "  --v4-ranges LIST       Comma separated IPv4 CIDRs to scan\n"
              << "  --v6-ranges LIST       Comma separated IPv6 CIDRs to scan\n"
              << "  --ports LIST           Comma separated ports to pair with scanned hosts\n"
              << "  --scan-timeout DUR     Per-candidate connect timeout (default: 10s)\n"
              << "  --scan-max N           Maximum candidates to try (default: all)\n"
              << "  --ping                 Probe candidates before starting usque\n"
              << "  --precheck MODE        Same as --ping with an explicit probe: quic|tls|icmp\n"
              << "  --shuffle              Shuffle candidates before trying them\n"
              << "  --seed N               Deterministic seed for port picks and shuffling\n"
              << "  --tunnel-fail-limit N  Tunnel failures tolerated per candidate (default: 3)\n"
              << "  --warp-check           Fetch the trace page through the proxy after connect\n"
              << "  --warp-check-enforce   Reject candidates whose trace lacks warp=on\n"
              << "  --log-level LVL        Log level: debug|info|warning|error|none (default: info)\n"
              << "  --help                 Show this help message\n"
              << std::endl;
}

int main(int argc, char* argv[]) {
    // Ignore SIGPIPE to prevent process termination on socket write errors
    signal(SIGPIPE, SIG_IGN);
    signal(SIGINT, handle_shutdown_signal);
    signal(SIGTERM, handle_shutdown_signal);

    masqueplus::AppOptions options;
    std::string settings_path;
    bool force_v4 = false;
    bool force_v6 = false;
    std::string log_level_arg;

    // Flag overrides are applied after the settings file is loaded.
    std::vector<std::pair<std::vector<std::string>, json>> overrides;

    // Parse arguments
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        auto next = [&](std::string* out) -> bool {
            if (i + 1 < argc) {
                *out = argv[++i];
                return true;
            }
            std::cerr << "Error: " << arg << " requires an argument" << std::endl;
            return false;
        };
        std::string value;

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--endpoint") {
            if (!next(&options.endpoint)) return 1;
        } else if (arg == "--bind") {
            if (!next(&value)) return 1;
            overrides.push_back({{"proxy", "bind"}, value});
        } else if (arg == "--renew") {
            options.renew = true;
        } else if (arg == "--scan") {
            options.scan = true;
        } else if (arg == "-4") {
            force_v4 = true;
        } else if (arg == "-6") {
            force_v6 = true;
        } else if (arg == "--connect-timeout") {
            int ms = 0;
            if (!next(&value) || !parse_duration_arg(arg, value, &ms)) return 1;
            overrides.push_back({{"proxy", "connect_timeout_ms"}, ms});
        } else if (arg == "--usque") {
            if (!next(&value)) return 1;
            overrides.push_back({{"usque", "binary"}, value});
        } else if (arg == "--config") {
            if (!next(&value)) return 1;
            overrides.push_back({{"usque", "config_path"}, value});
        } else if (arg == "--settings") {
            if (!next(&settings_path)) return 1;
        } else if (arg == "--v4-ranges") {
            if (!next(&value)) return 1;
            overrides.push_back({{"scanner", "v4_ranges"}, split_list(value)});
        } else if (arg == "--v6-ranges") {
            if (!next(&value)) return 1;
            overrides.push_back({{"scanner", "v6_ranges"}, split_list(value)});
        } else if (arg == "--ports") {
            if (!next(&value)) return 1;
            json ports = json::array();
            for (const auto& p : split_list(value)) {
                int port = 0;
                if (!parse_int_arg(arg, p, 1, &port) || port > 65535) {
                    if (port > 65535) std::cerr << "Error: Port must be between 1 and 65535" << std::endl;
                    return 1;
                }
                ports.push_back(port);
            }
            overrides.push_back({{"scanner", "ports"}, ports});
        } else if (arg == "--scan-timeout") {
            int ms = 0;
            if (!next(&value) || !parse_duration_arg(arg, value, &ms)) return 1;
            overrides.push_back({{"scanner", "scan_timeout_ms"}, ms});
        } else if (arg == "--scan-max") {
            int n = 0;
            if (!next(&value) || !parse_int_arg(arg, value, 0, &n)) return 1;
            overrides.push_back({{"scanner", "max_candidates"}, n});
        } else if (arg == "--ping") {
            overrides.push_back({{"probe", "precheck"}, true});
        } else if (arg == "--precheck") {
            if (!next(&value)) return 1;
            overrides.push_back({{"probe", "precheck"}, true});
            overrides.push_back({{"probe", "mode"}, value});
        } else if (arg == "--shuffle") {
            overrides.push_back({{"scanner", "shuffle"}, true});
        } else if (arg == "--seed") {
            if (!next(&value)) return 1;
            try {
                size_t used = 0;
                unsigned long long seed = std::stoull(value, &used);
                if (used != value.size()) throw std::invalid_argument(value);
                overrides.push_back({{"scanner", "seed"}, static_cast<uint64_t>(seed)});
            } catch (const std::exception&) {
                std::cerr << "Error: invalid --seed value: " << value << std::endl;
                return 1;
            }
        } else if (arg == "--tunnel-fail-limit") {
            int n = 0;
            if (!next(&value) || !parse_int_arg(arg, value, 1, &n)) return 1;
            overrides.push_back({{"supervisor", "tunnel_failure_threshold"}, n});
        } else if (arg == "--warp-check") {
            overrides.push_back({{"warp_check", "enabled"}, true});
        } else if (arg == "--warp-check-enforce") {
            overrides.push_back({{"warp_check", "enabled"}, true});
            overrides.push_back({{"warp_check", "enforce"}, true});
        } else if (arg == "--log-level") {
            if (!next(&log_level_arg)) return 1;
        } else {
            std::cerr << "Error: Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    if (force_v4 && force_v6) {
        std::cerr << "Error: -4 and -6 are mutually exclusive" << std::endl;
        return 1;
    }
    if (force_v4) overrides.push_back({{"scanner", "ip_version"}, "v4"});
    if (force_v6) overrides.push_back({{"scanner", "ip_version"}, "v6"});

    ConfigManager& config = ConfigManager::getInstance();
    if (!settings_path.empty()) {
        std::string err;
        if (!config.loadConfig(settings_path, &err)) {
            std::cerr << "CRITICAL ERROR: Failed to load settings: " << err << std::endl;
            return 1;
        }
    } else {
        // Optional settings file next to the working directory or the executable
        std::vector<std::string> candidates;
        candidates.push_back("masque-plus.json");
        std::error_code ec;
        std::filesystem::path exe_path = std::filesystem::absolute(argv[0], ec);
        if (!ec) {
            std::filesystem::path exe_dir = exe_path.parent_path();
            candidates.push_back((exe_dir / "masque-plus.json").string());
            candidates.push_back((exe_dir / "../config/masque-plus.json").lexically_normal().string());
        }
        for (const auto& c : candidates) {
            if (!std::filesystem::exists(c, ec)) continue;
            std::string err;
            if (!config.loadConfig(c, &err)) {
                std::cerr << "CRITICAL ERROR: Failed to load settings: " << err << std::endl;
                return 1;
            }
            break;
        }
    }

    for (const auto& o : overrides) {
        config.setValueAtPath(o.first, o.second);
    }

    LogLevel level = LogLevel::INFO;
    const std::string level_name = log_level_arg.empty() ? config.getLogLevel() : log_level_arg;
    if (!masqueplus::parse_log_level(level_name, &level)) {
        std::cerr << "Error: invalid log level: " << level_name << std::endl;
        return 1;
    }
    masqueplus::set_log_level(level);

    try {
        masqueplus::MasqueApp app(options, &g_shutdown);
        return app.run();
    } catch (const std::exception& e) {
        LOG_ERROR("fatal error", {{"err", e.what()}});
        return 1;
    }
}
