#ifndef P2PLINK_PAIRING_OPTIONS_H
#define P2PLINK_PAIRING_OPTIONS_H

#include "discovery_agent.h"
#include "clock.h"
#include <string>
#include <vector>

namespace p2plink {

class ConfigManager;

// Tunables for one pairing session; defaults mirror config.json.
struct PairingOptions {
    AgentConfig agent;

    Millis interface_up_settle = Millis(2000);
    Millis agent_start_settle = Millis(3000);
    Millis agent_liveness_window = Millis(3000);
    Millis agent_liveness_poll = Millis(500);

    Millis discovery_window = Millis(10000);
    Millis discovery_poll_interval = Millis(1000);
    bool resolve_peer_names = false;

    Millis connect_deadline = Millis(30000);
    Millis connect_poll_interval = Millis(1000);
    std::vector<std::string> connected_markers = {
        "p2p_state=GO_NEGOTIATION_COMPLETE",
        "p2p_state=ACTIVE",
    };

    Millis verify_settle = Millis(5000);
    int verify_attempts = 3;
    Millis verify_per_attempt_timeout = Millis(2000);

    int fallback_channel = 6;
    std::string fallback_network_name = "test-adhoc";
    Millis fallback_agent_stop_settle = Millis(1000);
    Millis fallback_settle = Millis(3000);

    bool collect_diagnostics = true;

    static PairingOptions fromConfig(const ConfigManager& config);
};

} // namespace p2plink

#endif // P2PLINK_PAIRING_OPTIONS_H
