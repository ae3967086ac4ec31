#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <mutex>

namespace p2plink {

using json = nlohmann::json;

class ConfigManager {
public:
    static ConfigManager& getInstance();

    bool loadConfig(const std::string& config_path);
    bool loadFromString(const std::string& text);

    // Drop everything loaded so far; getters fall back to their defaults.
    void reset();

    // In-memory override, e.g. setValueAtPath({"discovery", "window_ms"}, 2000).
    // Intermediate objects are created as needed.
    bool setValueAtPath(const std::vector<std::string>& path, const json& value);

    json snapshot() const;

    // Logging
    std::string getLogLevel() const;
    bool isConsoleOutput() const;
    bool isAsyncLogging() const;

    // Discovery agent (wpa_supplicant / wpa_cli)
    std::string getAgentBinary() const;
    std::string getAgentCliBinary() const;
    std::string getAgentDriver() const;
    std::string getAgentConfigDir() const;
    std::string getAgentCtrlInterface() const;
    std::string getAgentDeviceName() const;
    std::string getAgentDeviceType() const;
    int getAgentGoIntent() const;
    bool isAgentGoHt40() const;
    int getAgentStartSettleMs() const;
    int getAgentLivenessWindowMs() const;
    int getAgentCommandTimeoutMs() const;

    // Interface control
    int getInterfaceUpSettleMs() const;
    int getInterfaceCommandTimeoutMs() const;

    // Discovery
    int getDiscoveryWindowMs() const;
    int getDiscoveryPollIntervalMs() const;
    bool isResolvePeerNames() const;

    // Negotiation / connection wait
    int getConnectDeadlineMs() const;
    int getConnectPollIntervalMs() const;
    std::vector<std::string> getConnectedMarkers() const;

    // Verification
    int getVerifySettleMs() const;
    int getVerifyAttempts() const;
    int getVerifyPerAttemptTimeoutMs() const;

    // Ad-hoc fallback
    int getFallbackChannel() const;
    std::string getFallbackNetworkName() const;
    int getFallbackSettleMs() const;
    int getFallbackAgentStopSettleMs() const;

    // Diagnostics
    bool isDiagnosticsEnabled() const;

private:
    ConfigManager() = default;

    json section(const char* name) const;

    mutable std::mutex m_mutex;
    json m_config = json::object();
};

} // namespace p2plink
