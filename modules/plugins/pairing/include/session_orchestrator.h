#ifndef P2PLINK_SESSION_ORCHESTRATOR_H
#define P2PLINK_SESSION_ORCHESTRATOR_H

#include "pairing_session.h"
#include "pairing_options.h"
#include "interface_controller.h"
#include "discovery_agent.h"
#include "reachability_probe.h"
#include "discovery_phase.h"
#include "pairing_negotiator.h"
#include "connection_monitor.h"
#include "fallback_coordinator.h"
#include "connectivity_verifier.h"
#include "clock.h"
#include <atomic>
#include <string>

namespace p2plink {

// Set from any thread; honoured between phases only.
class CancellationToken {
public:
    void cancel() { m_cancelled.store(true); }
    bool isCancelled() const { return m_cancelled.load(); }

private:
    std::atomic<bool> m_cancelled{false};
};

// External collaborators a session drives. All references must outlive the orchestrator.
struct PairingDependencies {
    IInterfaceController& interfaces;
    IDiscoveryAgent& agent;
    IReachabilityProbe& probe;
    IClock& clock;
};

/**
 * Top-level pairing state machine.
 *
 * Init -> InterfacesUp -> AgentsStarted -> Discovering -> PeersFound|NoPeersFound
 *      -> Negotiating -> AwaitingConnection -> Verified
 * with Negotiating|AwaitingConnection -> FallbackAdHoc -> Verified when the PIN
 * handshake fails or the link never comes up. Only bring-up and agent start
 * failures (or cancellation) end in Failed.
 *
 * Each phase runs at most once per session. Agents are left running after a
 * Verified non-fallback session so the caller can use the link.
 */
class SessionOrchestrator {
public:
    SessionOrchestrator(PairingDependencies deps, PairingOptions options);

    SessionOutcome run(const Endpoint& initiator, const Endpoint& responder,
                       const CancellationToken* cancel = nullptr);

    const PairingOptions& options() const { return m_options; }

private:
    bool bringUpInterfaces(PairingSession& session);
    bool startAgents(PairingSession& session);
    bool discoverPeers(PairingSession& session);
    void negotiate(PairingSession& session, const CancellationToken* cancel);
    void fallBackToAdHoc(PairingSession& session, const std::string& reason);
    void verifyAndFinish(PairingSession& session, const std::string& detail);

    // true if the session was cancelled (and is now Failed)
    bool cancelled(PairingSession& session, const CancellationToken* cancel);
    void fail(PairingSession& session, const std::string& reason);
    void stopAgents(PairingSession& session);
    void collectDiagnostics(const PairingSession& session, SessionOutcome& outcome);

    PairingDependencies m_deps;
    PairingOptions m_options;

    DiscoveryPhase m_discovery;
    PairingNegotiator m_negotiator;
    ConnectionMonitor m_monitor;
    FallbackCoordinator m_fallback;
    ConnectivityVerifier m_verifier;
};

} // namespace p2plink

#endif // P2PLINK_SESSION_ORCHESTRATOR_H
