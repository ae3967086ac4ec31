#ifndef P2PLINK_FALLBACK_COORDINATOR_H
#define P2PLINK_FALLBACK_COORDINATOR_H

#include "discovery_agent.h"
#include "interface_controller.h"
#include "clock.h"
#include <string>

namespace p2plink {

/**
 * Degraded, unauthenticated mode used once PIN pairing is exhausted: both
 * interfaces join one IBSS (shared channel + network name) without any
 * negotiation. Reconfiguration errors are logged and tolerated; the
 * connectivity check that follows reports the real outcome.
 */
class FallbackCoordinator {
public:
    struct Delays {
        Millis agent_stop_settle = Millis(1000);
        Millis mode_settle = Millis(3000);
    };

    FallbackCoordinator(IDiscoveryAgent& agent, IInterfaceController& interfaces, IClock& clock, Delays delays);

    // Idempotent; never throws.
    void activateAdHoc(const Endpoint& endpoint1, const Endpoint& endpoint2,
                       int channel, const std::string& network_name);

private:
    void reconfigure(const Endpoint& endpoint, int channel, const std::string& network_name);

    IDiscoveryAgent& m_agent;
    IInterfaceController& m_interfaces;
    IClock& m_clock;
    Delays m_delays;
};

} // namespace p2plink

#endif // P2PLINK_FALLBACK_COORDINATOR_H
