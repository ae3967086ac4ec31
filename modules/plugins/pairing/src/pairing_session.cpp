#include "pairing_session.h"
#include "logger.h"
#include <stdexcept>

namespace p2plink {

PairingSession::PairingSession(Endpoint initiator, Endpoint responder, Clock::time_point created_at)
    : m_initiator(std::move(initiator)),
      m_responder(std::move(responder)),
      m_created_at(created_at),
      m_phase_started_at(created_at) {
    if (m_initiator.interfaceName() == m_responder.interfaceName() &&
        m_initiator.netns() == m_responder.netns()) {
        throw std::invalid_argument("initiator and responder share interface " + m_initiator.interfaceName());
    }
    m_initiator.setPhase(SessionState::Init);
    m_responder.setPhase(SessionState::Init);
}

bool PairingSession::isAllowed(SessionState from, SessionState to) {
    if (is_terminal(from)) {
        return false;
    }
    // Abort (interface error, agent failure, cancellation) is reachable from every live phase
    if (to == SessionState::Failed) {
        return true;
    }

    switch (from) {
    case SessionState::Init:
        return to == SessionState::InterfacesUp;
    case SessionState::InterfacesUp:
        return to == SessionState::AgentsStarted;
    case SessionState::AgentsStarted:
        return to == SessionState::Discovering;
    case SessionState::Discovering:
        return to == SessionState::PeersFound || to == SessionState::NoPeersFound;
    case SessionState::PeersFound:
    case SessionState::NoPeersFound:
        return to == SessionState::Negotiating;
    case SessionState::Negotiating:
        return to == SessionState::AwaitingConnection || to == SessionState::FallbackAdHoc;
    case SessionState::AwaitingConnection:
        return to == SessionState::Verified || to == SessionState::FallbackAdHoc;
    case SessionState::FallbackAdHoc:
        return to == SessionState::Verified;
    default:
        return false;
    }
}

void PairingSession::transition(SessionState next, Clock::time_point now, const std::string& detail) {
    if (!isAllowed(m_state, next)) {
        throw std::logic_error(std::string("illegal pairing transition ") +
                               to_string(m_state) + " -> " + to_string(next));
    }

    const SessionState old_state = m_state;
    m_state = next;
    m_phase_started_at = now;
    m_phase_deadline.reset();
    m_initiator.setPhase(next);
    m_responder.setPhase(next);

    m_transitions.push_back(SessionTransition{
        old_state, next, std::chrono::duration_cast<Millis>(now - m_created_at), detail});

    LOG_INFO(std::string("[PairingFSM] ") + to_string(old_state) + " --> " + to_string(next) +
             (detail.empty() ? "" : " (" + detail + ")") +
             " " + m_initiator.label() + " <-> " + m_responder.label());
}

void PairingSession::setPhaseDeadline(Clock::time_point deadline) {
    if (!(deadline > m_phase_started_at)) {
        throw std::invalid_argument("phase deadline must be later than the phase start");
    }
    m_phase_deadline = deadline;
}

void PairingSession::addDiscoveredPeer(const std::string& address, std::optional<std::string> metadata) {
    auto it = m_discovered_peers.find(address);
    if (it == m_discovered_peers.end()) {
        m_discovered_peers.emplace(address, std::move(metadata));
    } else if (metadata && !it->second) {
        it->second = std::move(metadata);
    }
}

void PairingSession::clearAgents() {
    m_initiator_agent = AgentHandle{};
    m_responder_agent = AgentHandle{};
}

SessionOutcome PairingSession::toOutcome() const {
    SessionOutcome outcome;
    outcome.state = m_state;
    outcome.path = m_path;
    outcome.connectivity = m_connectivity;
    outcome.failure_reason = m_failure_reason;
    outcome.cancelled = m_cancelled;
    outcome.initiator = m_initiator.label();
    outcome.responder = m_responder.label();
    outcome.selected_peer = m_selected_peer;
    outcome.discovered_peers = m_discovered_peers;
    outcome.transitions = m_transitions;
    return outcome;
}

} // namespace p2plink
