#include "connection_monitor.h"
#include "link_errors.h"
#include "logger.h"

namespace p2plink {

ConnectionMonitor::ConnectionMonitor(IDiscoveryAgent& agent, IClock& clock, std::vector<std::string> connected_markers)
    : m_agent(agent), m_clock(clock), m_markers(std::move(connected_markers)) {}

bool ConnectionMonitor::isConnectedStatus(const std::string& status_text) const {
    for (const auto& marker : m_markers) {
        if (!marker.empty() && status_text.find(marker) != std::string::npos) {
            return true;
        }
    }
    return false;
}

bool ConnectionMonitor::awaitConnected(const AgentHandle& handle, Millis poll_interval, Millis deadline) {
    LOG_INFO("Monitor: waiting up to " + std::to_string(deadline.count()) + "ms for " +
             handle.interface_name + " to connect");

    int polls = 0;
    const bool connected = poll_until(m_clock, poll_interval, deadline, [&]() {
        ++polls;
        try {
            return isConnectedStatus(m_agent.status(handle));
        } catch (const AgentUnavailable& e) {
            // The agent may be restarting its control socket during group formation
            LOG_DEBUG(std::string("Monitor: status unavailable: ") + e.what());
            return false;
        }
    });

    if (connected) {
        LOG_INFO("Monitor: " + handle.interface_name + " connected after " + std::to_string(polls) + " poll(s)");
    } else {
        LOG_WARN("Monitor: " + handle.interface_name + " not connected within " +
                 std::to_string(deadline.count()) + "ms");
    }
    return connected;
}

} // namespace p2plink
