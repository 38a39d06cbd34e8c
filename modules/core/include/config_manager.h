#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace masqueplus {

using json = nlohmann::json;

// Application settings. Every getter falls back to the built-in default when
// the key is absent or has the wrong type, so an empty document is valid.
class ConfigManager {
public:
    static ConfigManager& getInstance();

    bool loadConfig(const std::string& config_path, std::string* out_err = nullptr);
    bool loadFromString(const std::string& text, std::string* out_err = nullptr);
    void reset();

    // Creates intermediate objects as needed. Used for CLI overrides.
    bool setValueAtPath(const std::vector<std::string>& path, const json& value);
    const json& document() const { return m_config; }

    // usque
    std::string getUsqueBinary() const;
    std::string getUsqueConfigPath() const;
    std::string getStatePath() const;
    int getRegisterTimeoutMs() const;

    // Local proxy
    std::string getBindAddress() const;
    int getConnectTimeoutMs() const;

    // Scanner
    std::string getIpVersion() const;
    std::vector<std::string> getV4Ranges() const;
    std::vector<std::string> getV6Ranges() const;
    std::vector<int> getPorts() const;
    int getMaxCandidates() const;
    int getScanTimeoutMs() const;
    bool isShuffleEnabled() const;
    uint64_t getRandomSeed() const;

    // Probe
    bool isPrecheckEnabled() const;
    std::string getPrecheckMode() const;
    int getProbeTimeoutMs() const;

    // Supervisor
    int getTunnelFailureThreshold() const;
    int getPollIntervalMs() const;

    // WARP check
    bool isWarpCheckEnabled() const;
    bool isWarpCheckEnforced() const;
    std::string getWarpCheckUrl() const;
    int getWarpCheckTimeoutMs() const;

    // Logging
    std::string getLogLevel() const;

private:
    ConfigManager() = default;

    const json* find(const char* section, const char* key) const;
    int getInt(const char* section, const char* key, int fallback) const;
    bool getBool(const char* section, const char* key, bool fallback) const;
    std::string getString(const char* section, const char* key, const std::string& fallback) const;
    std::vector<std::string> getStringList(const char* section, const char* key,
                                           const std::vector<std::string>& fallback) const;

    json m_config = json::object();
};

} // namespace masqueplus
