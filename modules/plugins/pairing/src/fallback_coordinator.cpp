#include "fallback_coordinator.h"
#include "link_errors.h"
#include "logger.h"

namespace p2plink {

FallbackCoordinator::FallbackCoordinator(IDiscoveryAgent& agent, IInterfaceController& interfaces,
                                         IClock& clock, Delays delays)
    : m_agent(agent), m_interfaces(interfaces), m_clock(clock), m_delays(delays) {}

void FallbackCoordinator::activateAdHoc(const Endpoint& endpoint1, const Endpoint& endpoint2,
                                        int channel, const std::string& network_name) {
    LOG_INFO("Fallback: switching " + endpoint1.label() + " and " + endpoint2.label() +
             " to ad-hoc '" + network_name + "' on channel " + std::to_string(channel));

    for (const Endpoint* endpoint : {&endpoint1, &endpoint2}) {
        try {
            m_agent.stopInterface(*endpoint);
        } catch (const AgentUnavailable& e) {
            LOG_WARN("Fallback: stopping agent on " + endpoint->label() + " failed: " + e.what());
        }
    }
    m_clock.sleepFor(m_delays.agent_stop_settle);

    reconfigure(endpoint1, channel, network_name);
    reconfigure(endpoint2, channel, network_name);

    m_clock.sleepFor(m_delays.mode_settle);
}

void FallbackCoordinator::reconfigure(const Endpoint& endpoint, int channel, const std::string& network_name) {
    // Each step is attempted even if the previous one failed
    try {
        m_interfaces.setAdHocMode(endpoint);
    } catch (const InterfaceError& e) {
        LOG_WARN(std::string("Fallback: ") + e.what());
    }
    try {
        m_interfaces.setSharedChannel(endpoint, channel, network_name);
    } catch (const InterfaceError& e) {
        LOG_WARN(std::string("Fallback: ") + e.what());
    }
    try {
        m_interfaces.bringUp(endpoint);
    } catch (const InterfaceError& e) {
        LOG_WARN(std::string("Fallback: ") + e.what());
    }
}

} // namespace p2plink
