#include "pairing_options.h"
#include "config_manager.h"
#include <algorithm>

namespace p2plink {

namespace {
Millis ms(int value) {
    return Millis(std::max(0, value));
}
} // namespace

PairingOptions PairingOptions::fromConfig(const ConfigManager& config) {
    PairingOptions options;

    options.agent.ctrl_interface = config.getAgentCtrlInterface();
    options.agent.device_name = config.getAgentDeviceName();
    options.agent.device_type = config.getAgentDeviceType();
    options.agent.go_intent = std::min(15, std::max(0, config.getAgentGoIntent()));
    options.agent.go_ht40 = config.isAgentGoHt40();

    options.interface_up_settle = ms(config.getInterfaceUpSettleMs());
    options.agent_start_settle = ms(config.getAgentStartSettleMs());
    options.agent_liveness_window = ms(config.getAgentLivenessWindowMs());

    options.discovery_window = ms(config.getDiscoveryWindowMs());
    options.discovery_poll_interval = ms(config.getDiscoveryPollIntervalMs());
    options.resolve_peer_names = config.isResolvePeerNames();

    options.connect_deadline = ms(config.getConnectDeadlineMs());
    options.connect_poll_interval = ms(config.getConnectPollIntervalMs());
    options.connected_markers = config.getConnectedMarkers();

    options.verify_settle = ms(config.getVerifySettleMs());
    options.verify_attempts = std::max(1, config.getVerifyAttempts());
    options.verify_per_attempt_timeout = ms(config.getVerifyPerAttemptTimeoutMs());

    options.fallback_channel = config.getFallbackChannel();
    options.fallback_network_name = config.getFallbackNetworkName();
    options.fallback_agent_stop_settle = ms(config.getFallbackAgentStopSettleMs());
    options.fallback_settle = ms(config.getFallbackSettleMs());

    options.collect_diagnostics = config.isDiagnosticsEnabled();
    return options;
}

} // namespace p2plink
