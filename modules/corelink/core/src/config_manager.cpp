#include "config_manager.h"
#include "logger.h"
#include <fstream>

namespace p2plink {

ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

bool ConfigManager::loadConfig(const std::string& config_path) {
    try {
        std::ifstream config_file(config_path);
        if (!config_file.is_open()) {
            LOG_ERROR("Config: failed to open config file: " + config_path);
            return false;
        }
        json parsed;
        config_file >> parsed;
        if (!parsed.is_object()) {
            LOG_ERROR("Config: top level of " + config_path + " is not an object");
            return false;
        }
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_config = std::move(parsed);
        }
        LOG_INFO("Config: loaded from " + config_path);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Config: loading failed: ") + e.what());
        return false;
    }
}

bool ConfigManager::loadFromString(const std::string& text) {
    try {
        json parsed = json::parse(text);
        if (!parsed.is_object()) {
            return false;
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config = std::move(parsed);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Config: parse failed: ") + e.what());
        return false;
    }
}

void ConfigManager::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_config = json::object();
}

bool ConfigManager::setValueAtPath(const std::vector<std::string>& path, const json& value) {
    if (path.empty()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    json* node = &m_config;
    for (size_t i = 0; i + 1 < path.size(); ++i) {
        json& child = (*node)[path[i]];
        if (!child.is_object()) {
            if (!child.is_null()) {
                return false;
            }
            child = json::object();
        }
        node = &child;
    }
    (*node)[path.back()] = value;
    return true;
}

json ConfigManager::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_config;
}

json ConfigManager::section(const char* name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_config.find(name);
    if (it == m_config.end() || !it->is_object()) {
        return json::object();
    }
    return *it;
}

std::string ConfigManager::getLogLevel() const {
    return section("logging").value("level", "info");
}

bool ConfigManager::isConsoleOutput() const {
    return section("logging").value("console_output", true);
}

bool ConfigManager::isAsyncLogging() const {
    return section("logging").value("async", false);
}

std::string ConfigManager::getAgentBinary() const {
    return section("agent").value("binary", "wpa_supplicant");
}

std::string ConfigManager::getAgentCliBinary() const {
    return section("agent").value("cli", "wpa_cli");
}

std::string ConfigManager::getAgentDriver() const {
    return section("agent").value("driver", "nl80211");
}

std::string ConfigManager::getAgentConfigDir() const {
    return section("agent").value("config_dir", "/tmp");
}

std::string ConfigManager::getAgentCtrlInterface() const {
    return section("agent").value("ctrl_interface", "/var/run/wpa_supplicant");
}

std::string ConfigManager::getAgentDeviceName() const {
    return section("agent").value("device_name", "STA");
}

std::string ConfigManager::getAgentDeviceType() const {
    return section("agent").value("device_type", "1-0050F204-1");
}

int ConfigManager::getAgentGoIntent() const {
    return section("agent").value("go_intent", 7);
}

bool ConfigManager::isAgentGoHt40() const {
    return section("agent").value("go_ht40", true);
}

int ConfigManager::getAgentStartSettleMs() const {
    return section("agent").value("start_settle_ms", 3000);
}

int ConfigManager::getAgentLivenessWindowMs() const {
    return section("agent").value("liveness_window_ms", 3000);
}

int ConfigManager::getAgentCommandTimeoutMs() const {
    return section("agent").value("command_timeout_ms", 5000);
}

int ConfigManager::getInterfaceUpSettleMs() const {
    return section("interface").value("up_settle_ms", 2000);
}

int ConfigManager::getInterfaceCommandTimeoutMs() const {
    return section("interface").value("command_timeout_ms", 5000);
}

int ConfigManager::getDiscoveryWindowMs() const {
    return section("discovery").value("window_ms", 10000);
}

int ConfigManager::getDiscoveryPollIntervalMs() const {
    return section("discovery").value("poll_interval_ms", 1000);
}

bool ConfigManager::isResolvePeerNames() const {
    return section("discovery").value("resolve_peer_names", false);
}

int ConfigManager::getConnectDeadlineMs() const {
    return section("negotiation").value("connect_deadline_ms", 30000);
}

int ConfigManager::getConnectPollIntervalMs() const {
    return section("negotiation").value("poll_interval_ms", 1000);
}

std::vector<std::string> ConfigManager::getConnectedMarkers() const {
    const json negotiation = section("negotiation");
    auto it = negotiation.find("connected_markers");
    if (it == negotiation.end() || !it->is_array() || it->empty()) {
        return {"p2p_state=GO_NEGOTIATION_COMPLETE", "p2p_state=ACTIVE"};
    }
    std::vector<std::string> markers;
    for (const auto& marker : *it) {
        if (marker.is_string()) {
            markers.push_back(marker.get<std::string>());
        }
    }
    return markers;
}

int ConfigManager::getVerifySettleMs() const {
    return section("verification").value("settle_ms", 5000);
}

int ConfigManager::getVerifyAttempts() const {
    return section("verification").value("attempts", 3);
}

int ConfigManager::getVerifyPerAttemptTimeoutMs() const {
    return section("verification").value("per_attempt_timeout_ms", 2000);
}

int ConfigManager::getFallbackChannel() const {
    return section("fallback").value("channel", 6);
}

std::string ConfigManager::getFallbackNetworkName() const {
    return section("fallback").value("network_name", "test-adhoc");
}

int ConfigManager::getFallbackSettleMs() const {
    return section("fallback").value("settle_ms", 3000);
}

int ConfigManager::getFallbackAgentStopSettleMs() const {
    return section("fallback").value("agent_stop_settle_ms", 1000);
}

bool ConfigManager::isDiagnosticsEnabled() const {
    return section("diagnostics").value("collect", true);
}

} // namespace p2plink
