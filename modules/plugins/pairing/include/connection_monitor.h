#ifndef P2PLINK_CONNECTION_MONITOR_H
#define P2PLINK_CONNECTION_MONITOR_H

#include "discovery_agent.h"
#include "clock.h"
#include <string>
#include <vector>

namespace p2plink {

class ConnectionMonitor {
public:
    ConnectionMonitor(IDiscoveryAgent& agent, IClock& clock, std::vector<std::string> connected_markers);

    // Polls agent status until a connected marker appears or `deadline`
    // elapses. Timeout is a normal false result; never throws.
    bool awaitConnected(const AgentHandle& handle, Millis poll_interval, Millis deadline);

    bool isConnectedStatus(const std::string& status_text) const;

private:
    IDiscoveryAgent& m_agent;
    IClock& m_clock;
    std::vector<std::string> m_markers;
};

} // namespace p2plink

#endif // P2PLINK_CONNECTION_MONITOR_H
