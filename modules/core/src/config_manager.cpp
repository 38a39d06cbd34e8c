#include "config_manager.h"
#include "constants.h"
#include "logger.h"

#include <fstream>

namespace masqueplus {

ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

bool ConfigManager::loadConfig(const std::string& config_path, std::string* out_err) {
    std::ifstream config_file(config_path);
    if (!config_file.is_open()) {
        if (out_err) *out_err = "failed to open settings file: " + config_path;
        return false;
    }
    try {
        json parsed;
        config_file >> parsed;
        if (!parsed.is_object()) {
            if (out_err) *out_err = "settings file is not a JSON object: " + config_path;
            return false;
        }
        m_config = std::move(parsed);
    } catch (const std::exception& e) {
        if (out_err) *out_err = std::string("settings parse failed: ") + e.what();
        return false;
    }
    LOG_DEBUG("settings loaded", {{"path", config_path}});
    return true;
}

bool ConfigManager::loadFromString(const std::string& text, std::string* out_err) {
    try {
        json parsed = json::parse(text);
        if (!parsed.is_object()) {
            if (out_err) *out_err = "settings document is not a JSON object";
            return false;
        }
        m_config = std::move(parsed);
        return true;
    } catch (const std::exception& e) {
        if (out_err) *out_err = std::string("settings parse failed: ") + e.what();
        return false;
    }
}

void ConfigManager::reset() {
    m_config = json::object();
}

bool ConfigManager::setValueAtPath(const std::vector<std::string>& path, const json& value) {
    if (path.empty()) {
        return false;
    }
    json* node = &m_config;
    for (size_t i = 0; i + 1 < path.size(); ++i) {
        json& child = (*node)[path[i]];
        if (!child.is_object()) {
            child = json::object();
        }
        node = &child;
    }
    (*node)[path.back()] = value;
    return true;
}

const json* ConfigManager::find(const char* section, const char* key) const {
    auto sit = m_config.find(section);
    if (sit == m_config.end() || !sit->is_object()) {
        return nullptr;
    }
    auto kit = sit->find(key);
    if (kit == sit->end()) {
        return nullptr;
    }
    return &(*kit);
}

int ConfigManager::getInt(const char* section, const char* key, int fallback) const {
    const json* v = find(section, key);
    if (!v || !v->is_number_integer()) return fallback;
    return v->get<int>();
}

bool ConfigManager::getBool(const char* section, const char* key, bool fallback) const {
    const json* v = find(section, key);
    if (!v || !v->is_boolean()) return fallback;
    return v->get<bool>();
}

std::string ConfigManager::getString(const char* section, const char* key, const std::string& fallback) const {
    const json* v = find(section, key);
    if (!v || !v->is_string()) return fallback;
    return v->get<std::string>();
}

std::vector<std::string> ConfigManager::getStringList(const char* section, const char* key,
                                                      const std::vector<std::string>& fallback) const {
    const json* v = find(section, key);
    if (!v || !v->is_array()) return fallback;
    std::vector<std::string> out;
    for (const auto& item : *v) {
        if (item.is_string()) {
            out.push_back(item.get<std::string>());
        }
    }
    return out;
}

std::string ConfigManager::getUsqueBinary() const {
    return getString("usque", "binary", DEFAULT_USQUE_BINARY);
}

std::string ConfigManager::getUsqueConfigPath() const {
    return getString("usque", "config_path", DEFAULT_USQUE_CONFIG);
}

std::string ConfigManager::getStatePath() const {
    return getString("usque", "state_path", DEFAULT_STATE_FILE);
}

int ConfigManager::getRegisterTimeoutMs() const {
    return getInt("usque", "register_timeout_ms", REGISTER_TIMEOUT_MS);
}

std::string ConfigManager::getBindAddress() const {
    return getString("proxy", "bind", DEFAULT_BIND_ADDRESS);
}

int ConfigManager::getConnectTimeoutMs() const {
    return getInt("proxy", "connect_timeout_ms", DEFAULT_CONNECT_TIMEOUT_MS);
}

std::string ConfigManager::getIpVersion() const {
    return getString("scanner", "ip_version", "any");
}

std::vector<std::string> ConfigManager::getV4Ranges() const {
    return getStringList("scanner", "v4_ranges", {DEFAULT_V4_RANGE});
}

std::vector<std::string> ConfigManager::getV6Ranges() const {
    return getStringList("scanner", "v6_ranges", {DEFAULT_V6_RANGE});
}

std::vector<int> ConfigManager::getPorts() const {
    const json* v = find("scanner", "ports");
    if (!v || !v->is_array()) {
        return {DEFAULT_ENDPOINT_PORT};
    }
    std::vector<int> ports;
    for (const auto& item : *v) {
        if (item.is_number_integer()) {
            ports.push_back(item.get<int>());
        }
    }
    return ports;
}

int ConfigManager::getMaxCandidates() const {
    return getInt("scanner", "max_candidates", 0);
}

int ConfigManager::getScanTimeoutMs() const {
    return getInt("scanner", "scan_timeout_ms", DEFAULT_SCAN_TIMEOUT_MS);
}

bool ConfigManager::isShuffleEnabled() const {
    return getBool("scanner", "shuffle", false);
}

uint64_t ConfigManager::getRandomSeed() const {
    const json* v = find("scanner", "seed");
    if (!v || !v->is_number_unsigned()) return 0;
    return v->get<uint64_t>();
}

bool ConfigManager::isPrecheckEnabled() const {
    return getBool("probe", "precheck", false);
}

std::string ConfigManager::getPrecheckMode() const {
    return getString("probe", "mode", "quic");
}

int ConfigManager::getProbeTimeoutMs() const {
    return getInt("probe", "timeout_ms", DEFAULT_PROBE_TIMEOUT_MS);
}

int ConfigManager::getTunnelFailureThreshold() const {
    return getInt("supervisor", "tunnel_failure_threshold", DEFAULT_TUNNEL_FAILURE_THRESHOLD);
}

int ConfigManager::getPollIntervalMs() const {
    return getInt("supervisor", "poll_interval_ms", SUPERVISOR_POLL_INTERVAL_MS);
}

bool ConfigManager::isWarpCheckEnabled() const {
    return getBool("warp_check", "enabled", false);
}

bool ConfigManager::isWarpCheckEnforced() const {
    return getBool("warp_check", "enforce", false);
}

std::string ConfigManager::getWarpCheckUrl() const {
    return getString("warp_check", "url", DEFAULT_WARP_CHECK_URL);
}

int ConfigManager::getWarpCheckTimeoutMs() const {
    return getInt("warp_check", "timeout_ms", WARP_CHECK_TIMEOUT_CAP_MS);
}

std::string ConfigManager::getLogLevel() const {
    return getString("logging", "level", "info");
}

} // namespace masqueplus
