#ifndef P2PLINK_DISCOVERY_PHASE_H
#define P2PLINK_DISCOVERY_PHASE_H

#include "discovery_agent.h"
#include "clock.h"
#include <optional>
#include <string>
#include <vector>

namespace p2plink {

// Drives one agent through a bounded peer scan.
class DiscoveryPhase {
public:
    DiscoveryPhase(IDiscoveryAgent& agent, IClock& clock);

    /**
     * Starts a scan, then polls the peer table every `poll_interval` until a
     * peer shows up or `window` elapses. An empty result is not an error.
     * Throws AgentUnavailable if the agent stops answering.
     */
    std::vector<std::string> discover(const AgentHandle& handle, Millis window, Millis poll_interval);

    // Advertised device name of a discovered peer, if the agent knows it.
    std::optional<std::string> describePeer(const AgentHandle& handle, const std::string& address);

    // MAC-shaped tokens in agent output, lower-cased, first-seen order, no duplicates.
    static std::vector<std::string> parsePeerList(const std::string& output);
    static std::optional<std::string> parseDeviceName(const std::string& output);

private:
    IDiscoveryAgent& m_agent;
    IClock& m_clock;
};

} // namespace p2plink

#endif // P2PLINK_DISCOVERY_PHASE_H
