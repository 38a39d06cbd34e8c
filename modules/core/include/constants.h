#ifndef MASQUEPLUS_CONSTANTS_H
#define MASQUEPLUS_CONSTANTS_H

#include <cstddef>

// Wrapped binary
constexpr const char* DEFAULT_USQUE_BINARY = "./usque";
constexpr const char* DEFAULT_USQUE_CONFIG = "./config.json";
constexpr const char* DEFAULT_STATE_FILE = "./state.json";
constexpr const char* REGISTER_DEVICE_NAME = "masque-plus";
constexpr const char* REGISTER_CONFIRMATIONS = "y\ny\n";
constexpr int REGISTER_TIMEOUT_MS = 120000;

// Local proxy
constexpr const char* DEFAULT_BIND_ADDRESS = "127.0.0.1:1080";
constexpr int DEFAULT_CONNECT_TIMEOUT_MS = 15 * 60 * 1000;

// Endpoint scanning
constexpr const char* DEFAULT_V4_RANGE = "162.159.198.0/24";
constexpr const char* DEFAULT_V6_RANGE = "2606:4700:103::/64";
constexpr int DEFAULT_ENDPOINT_PORT = 443;
constexpr size_t IPV6_HOSTS_PER_CIDR_CAP = 1024;
constexpr int DEFAULT_SCAN_TIMEOUT_MS = 10000;
constexpr int DEFAULT_PROBE_TIMEOUT_MS = 3000;

// Endpoint that means "pick one for me"
constexpr const char* AUTO_SCAN_ENDPOINT = "engage.cloudflareclient.com:2408";

// Built-in fallbacks when no candidate could be generated
constexpr const char* DEFAULT_V4_ENDPOINTS[] = {"162.159.198.1:443", "162.159.198.2:443"};
constexpr const char* DEFAULT_V6_ENDPOINTS[] = {"[2606:4700:103::1]:443", "[2606:4700:103::2]:443"};

// Supervision
constexpr int DEFAULT_TUNNEL_FAILURE_THRESHOLD = 3;
constexpr int SUPERVISOR_POLL_INTERVAL_MS = 50;
constexpr int READER_DRAIN_GRACE_MS = 500;
constexpr int READER_POLL_INTERVAL_MS = 100;

// Secondary WARP check
constexpr const char* DEFAULT_WARP_CHECK_URL = "https://www.cloudflare.com/cdn-cgi/trace";
constexpr const char* WARP_ON_MARKER = "warp=on";
constexpr int WARP_CHECK_TIMEOUT_CAP_MS = 5000;
constexpr size_t WARP_CHECK_BODY_LIMIT = 1 << 20;

#endif // MASQUEPLUS_CONSTANTS_H
