#include "discovery_phase.h"
#include "endpoint.h"
#include "link_errors.h"
#include "logger.h"
#include <algorithm>
#include <sstream>

namespace p2plink {

DiscoveryPhase::DiscoveryPhase(IDiscoveryAgent& agent, IClock& clock)
    : m_agent(agent), m_clock(clock) {}

std::vector<std::string> DiscoveryPhase::parsePeerList(const std::string& output) {
    std::vector<std::string> peers;
    std::istringstream in(output);
    std::string token;
    while (in >> token) {
        // Allow "aa:bb:..:ff," or "[aa:..]" decorations around a record
        token.erase(std::remove_if(token.begin(), token.end(),
                                   [](char c) { return c == ',' || c == ';' || c == '[' || c == ']'; }),
                    token.end());
        const std::string mac = normalize_mac(token);
        if (mac.empty()) {
            continue;
        }
        if (std::find(peers.begin(), peers.end(), mac) == peers.end()) {
            peers.push_back(mac);
        }
    }
    return peers;
}

std::optional<std::string> DiscoveryPhase::parseDeviceName(const std::string& output) {
    static const std::string key = "device_name=";
    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line)) {
        if (line.compare(0, key.size(), key) == 0) {
            std::string value = line.substr(key.size());
            while (!value.empty() && (value.back() == '\r' || value.back() == ' ')) {
                value.pop_back();
            }
            if (!value.empty()) {
                return value;
            }
        }
    }
    return std::nullopt;
}

std::vector<std::string> DiscoveryPhase::discover(const AgentHandle& handle, Millis window, Millis poll_interval) {
    const std::string find_reply = m_agent.command(handle, "p2p_find");
    if (find_reply.find("FAIL") != std::string::npos) {
        LOG_WARN("Discovery: p2p_find rejected on " + handle.interface_name + ": " + find_reply);
    }

    std::vector<std::string> peers;
    poll_until(m_clock, poll_interval, window, [&]() {
        peers = parsePeerList(m_agent.command(handle, "p2p_peers"));
        return !peers.empty();
    });

    LOG_INFO("Discovery: " + handle.interface_name + " found " + std::to_string(peers.size()) + " peer(s)");
    return peers;
}

std::optional<std::string> DiscoveryPhase::describePeer(const AgentHandle& handle, const std::string& address) {
    try {
        return parseDeviceName(m_agent.command(handle, "p2p_peer " + address));
    } catch (const AgentUnavailable& e) {
        LOG_DEBUG("Discovery: could not describe " + address + ": " + e.what());
        return std::nullopt;
    }
}

} // namespace p2plink
