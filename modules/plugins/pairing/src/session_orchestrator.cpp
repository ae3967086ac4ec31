#include "session_orchestrator.h"
#include "link_errors.h"
#include "logger.h"
#include <algorithm>
#include <future>

namespace p2plink {

namespace {

FallbackCoordinator::Delays fallback_delays(const PairingOptions& options) {
    FallbackCoordinator::Delays delays;
    delays.agent_stop_settle = options.fallback_agent_stop_settle;
    delays.mode_settle = options.fallback_settle;
    return delays;
}

} // namespace

SessionOrchestrator::SessionOrchestrator(PairingDependencies deps, PairingOptions options)
    : m_deps(deps),
      m_options(std::move(options)),
      m_discovery(deps.agent, deps.clock),
      m_negotiator(deps.agent, deps.clock),
      m_monitor(deps.agent, deps.clock, m_options.connected_markers),
      m_fallback(deps.agent, deps.interfaces, deps.clock, fallback_delays(m_options)),
      m_verifier(deps.probe) {}

SessionOutcome SessionOrchestrator::run(const Endpoint& initiator, const Endpoint& responder,
                                        const CancellationToken* cancel) {
    PairingSession session(initiator, responder, m_deps.clock.now());
    LOG_INFO("Session: pairing " + session.initiator().label() + " [" + session.initiator().hwAddress() +
             "] with " + session.responder().label() + " [" + session.responder().hwAddress() + "]");

    if (!cancelled(session, cancel) &&
        bringUpInterfaces(session) && !cancelled(session, cancel) &&
        startAgents(session) && !cancelled(session, cancel) &&
        discoverPeers(session) && !cancelled(session, cancel)) {
        negotiate(session, cancel);
    }

    SessionOutcome outcome = session.toOutcome();
    if (m_options.collect_diagnostics) {
        collectDiagnostics(session, outcome);
    }

    LOG_INFO(std::string("Session: finished ") + to_string(outcome.state) +
             " path=" + to_string(outcome.path) +
             " connectivity=" + std::to_string(outcome.connectivity.replies) + "/" +
             std::to_string(outcome.connectivity.attempts) +
             (outcome.failure_reason.empty() ? "" : " reason=" + outcome.failure_reason));
    return outcome;
}

// ----------------------------------------------------------
// Init -> InterfacesUp
// ----------------------------------------------------------
bool SessionOrchestrator::bringUpInterfaces(PairingSession& session) {
    try {
        m_deps.interfaces.bringUp(session.initiator());
        m_deps.interfaces.bringUp(session.responder());
    } catch (const InterfaceError& e) {
        fail(session, std::string("interface: ") + e.what());
        return false;
    }

    m_deps.clock.sleepFor(m_options.interface_up_settle);
    for (const Endpoint* endpoint : {&session.initiator(), &session.responder()}) {
        const std::string link = m_deps.interfaces.status(*endpoint);
        LOG_DEBUG("Session: " + endpoint->label() + " link: " + link);
    }

    session.transition(SessionState::InterfacesUp, m_deps.clock.now());
    return true;
}

// ----------------------------------------------------------
// InterfacesUp -> AgentsStarted
// ----------------------------------------------------------
bool SessionOrchestrator::startAgents(PairingSession& session) {
    try {
        session.setInitiatorAgent(m_deps.agent.start(session.initiator(), m_options.agent));
        session.setResponderAgent(m_deps.agent.start(session.responder(), m_options.agent));
    } catch (const AgentUnavailable& e) {
        fail(session, std::string("agent: ") + e.what());
        return false;
    }

    // First liveness check right after launch may be a false negative
    m_deps.clock.sleepFor(m_options.agent_start_settle);
    const bool alive = poll_until(m_deps.clock, m_options.agent_liveness_poll, m_options.agent_liveness_window,
                                  [&]() {
                                      return m_deps.agent.isAlive(session.initiatorAgent()) &&
                                             m_deps.agent.isAlive(session.responderAgent());
                                  });
    if (!alive) {
        fail(session, "agent: not running after start");
        return false;
    }

    session.transition(SessionState::AgentsStarted, m_deps.clock.now());
    return true;
}

// ----------------------------------------------------------
// AgentsStarted -> Discovering -> PeersFound | NoPeersFound
// ----------------------------------------------------------
bool SessionOrchestrator::discoverPeers(PairingSession& session) {
    const auto now = m_deps.clock.now();
    session.transition(SessionState::Discovering, now,
                       "window " + std::to_string(m_options.discovery_window.count()) + "ms");
    if (m_options.discovery_window.count() > 0) {
        session.setPhaseDeadline(now + m_options.discovery_window);
    }

    // The two scans target different agents; run them side by side and join both
    auto scan = [this](AgentHandle handle) {
        return m_discovery.discover(handle, m_options.discovery_window, m_options.discovery_poll_interval);
    };
    auto initiator_scan = std::async(std::launch::async, scan, session.initiatorAgent());
    auto responder_scan = std::async(std::launch::async, scan, session.responderAgent());
    initiator_scan.wait();
    responder_scan.wait();

    std::vector<std::string> initiator_peers;
    std::vector<std::string> responder_peers;
    try {
        initiator_peers = initiator_scan.get();
        responder_peers = responder_scan.get();
    } catch (const AgentUnavailable& e) {
        fail(session, std::string("discovery: ") + e.what());
        return false;
    }

    LOG_INFO("Session: " + session.initiator().label() + " sees " + std::to_string(initiator_peers.size()) +
             " peer(s), " + session.responder().label() + " sees " + std::to_string(responder_peers.size()));

    for (const auto& address : initiator_peers) {
        std::optional<std::string> name;
        if (m_options.resolve_peer_names) {
            name = m_discovery.describePeer(session.initiatorAgent(), address);
        }
        session.addDiscoveredPeer(address, name);
    }
    for (const auto& address : responder_peers) {
        std::optional<std::string> name;
        if (m_options.resolve_peer_names) {
            name = m_discovery.describePeer(session.responderAgent(), address);
        }
        session.addDiscoveredPeer(address, name);
    }

    if (session.discoveredPeers().empty()) {
        session.transition(SessionState::NoPeersFound, m_deps.clock.now());
        session.setPath(SessionPath::Blind);
    } else {
        session.transition(SessionState::PeersFound, m_deps.clock.now(),
                           std::to_string(session.discoveredPeers().size()) + " peer(s)");
        session.setPath(SessionPath::Discovery);
        if (std::find(initiator_peers.begin(), initiator_peers.end(), session.responder().hwAddress()) ==
            initiator_peers.end()) {
            LOG_WARN("Session: " + session.responder().hwAddress() + " not advertised to " +
                     session.initiator().label() + "; pairing with it anyway");
        }
    }

    // Both paths target the responder's own hardware address
    session.setSelectedPeer(session.responder().hwAddress());
    return true;
}

// ----------------------------------------------------------
// Negotiating -> AwaitingConnection -> Verified (or fallback)
// ----------------------------------------------------------
void SessionOrchestrator::negotiate(PairingSession& session, const CancellationToken* cancel) {
    session.transition(SessionState::Negotiating, m_deps.clock.now(),
                       std::string(to_string(session.path())) + " -> " + session.selectedPeer());

    try {
        session.setPin(m_negotiator.initiate(session.initiatorAgent(), session.selectedPeer()));
        m_negotiator.respond(session.responderAgent(), session.initiator().hwAddress(), *session.pin());
    } catch (const NegotiationError& e) {
        fallBackToAdHoc(session, std::string("negotiation: ") + e.what());
        return;
    } catch (const AgentUnavailable& e) {
        fallBackToAdHoc(session, std::string("negotiation: ") + e.what());
        return;
    }

    if (cancelled(session, cancel)) {
        return;
    }

    const auto now = m_deps.clock.now();
    session.transition(SessionState::AwaitingConnection, now);
    if (m_options.connect_deadline.count() > 0) {
        session.setPhaseDeadline(now + m_options.connect_deadline);
    }

    if (!m_monitor.awaitConnected(session.initiatorAgent(), m_options.connect_poll_interval,
                                  m_options.connect_deadline)) {
        fallBackToAdHoc(session, "connection timeout after " +
                                 std::to_string(m_options.connect_deadline.count()) + "ms");
        return;
    }

    if (cancelled(session, cancel)) {
        return;
    }

    // Let the group interface pick up its addressing
    m_deps.clock.sleepFor(m_options.verify_settle);
    verifyAndFinish(session, "p2p group formed");
}

// ----------------------------------------------------------
// Negotiating | AwaitingConnection -> FallbackAdHoc -> Verified
// ----------------------------------------------------------
void SessionOrchestrator::fallBackToAdHoc(PairingSession& session, const std::string& reason) {
    LOG_WARN("Session: " + reason);
    session.transition(SessionState::FallbackAdHoc, m_deps.clock.now(), reason);
    session.setPath(SessionPath::AdHoc);

    m_fallback.activateAdHoc(session.initiator(), session.responder(),
                             m_options.fallback_channel, m_options.fallback_network_name);
    // The coordinator stopped both agents
    session.clearAgents();

    verifyAndFinish(session, "ad-hoc '" + m_options.fallback_network_name + "'");
}

void SessionOrchestrator::verifyAndFinish(PairingSession& session, const std::string& detail) {
    ConnectivityResult result = m_verifier.verify(session.initiator(), session.responder(),
                                                  m_options.verify_attempts,
                                                  m_options.verify_per_attempt_timeout);
    const std::string summary = detail + ", " + std::to_string(result.replies) + "/" +
                                std::to_string(result.attempts) + " probe replies";
    session.setConnectivity(std::move(result));
    session.transition(SessionState::Verified, m_deps.clock.now(), summary);
}

bool SessionOrchestrator::cancelled(PairingSession& session, const CancellationToken* cancel) {
    if (cancel == nullptr || !cancel->isCancelled()) {
        return false;
    }
    session.setCancelled();
    fail(session, "cancelled");
    return true;
}

void SessionOrchestrator::fail(PairingSession& session, const std::string& reason) {
    LOG_ERROR("Session: " + reason);
    stopAgents(session);
    session.setFailureReason(reason);
    session.transition(SessionState::Failed, m_deps.clock.now(), reason);
}

void SessionOrchestrator::stopAgents(PairingSession& session) {
    for (const AgentHandle* handle : {&session.initiatorAgent(), &session.responderAgent()}) {
        if (handle->valid()) {
            m_deps.agent.stop(*handle);
        }
    }
    session.clearAgents();
}

void SessionOrchestrator::collectDiagnostics(const PairingSession& session, SessionOutcome& outcome) {
    auto collect = [&](const Endpoint& endpoint, const AgentHandle& handle) {
        std::string text = m_deps.interfaces.addresses(endpoint);
        if (handle.valid()) {
            try {
                text += "\n" + m_deps.agent.status(handle);
            } catch (const AgentUnavailable& e) {
                text += std::string("\nagent status unavailable: ") + e.what();
            }
        }
        outcome.diagnostics[endpoint.label()] = text;
    };
    collect(session.initiator(), session.initiatorAgent());
    collect(session.responder(), session.responderAgent());
}

} // namespace p2plink
