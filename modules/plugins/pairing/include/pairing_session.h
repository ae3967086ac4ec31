#ifndef P2PLINK_PAIRING_SESSION_H
#define P2PLINK_PAIRING_SESSION_H

#include "endpoint.h"
#include "discovery_agent.h"
#include "clock.h"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace p2plink {

struct ConnectivityResult {
    bool success = false;
    int attempts = 0;
    int replies = 0;
    std::string evidence;
};

struct SessionTransition {
    SessionState from;
    SessionState to;
    Millis elapsed;        // since session creation
    std::string detail;
};

// What a caller gets back once a session reaches Verified or Failed.
struct SessionOutcome {
    SessionState state = SessionState::Failed;
    SessionPath path = SessionPath::None;
    ConnectivityResult connectivity;
    std::string failure_reason;
    bool cancelled = false;
    std::string initiator;
    std::string responder;
    std::string selected_peer;
    std::map<std::string, std::optional<std::string>> discovered_peers;
    std::vector<SessionTransition> transitions;
    std::map<std::string, std::string> diagnostics;   // endpoint label -> text

    bool verified() const { return state == SessionState::Verified; }
};

/**
 * Aggregate root for one pairing attempt. Only SessionOrchestrator mutates
 * it; transitions are validated against the phase graph so the state
 * sequence cannot drift.
 */
class PairingSession {
public:
    PairingSession(Endpoint initiator, Endpoint responder, Clock::time_point created_at);

    Endpoint& initiator() { return m_initiator; }
    Endpoint& responder() { return m_responder; }
    const Endpoint& initiator() const { return m_initiator; }
    const Endpoint& responder() const { return m_responder; }

    SessionState state() const { return m_state; }
    SessionPath path() const { return m_path; }
    void setPath(SessionPath path) { m_path = path; }

    // Moves to `next`, stamping the phase start. Throws std::logic_error for
    // an edge not in the phase graph.
    void transition(SessionState next, Clock::time_point now, const std::string& detail = "");

    // Throws std::invalid_argument unless deadline > phase start.
    void setPhaseDeadline(Clock::time_point deadline);
    Clock::time_point phaseStartedAt() const { return m_phase_started_at; }
    std::optional<Clock::time_point> phaseDeadline() const { return m_phase_deadline; }

    void addDiscoveredPeer(const std::string& address, std::optional<std::string> metadata = std::nullopt);
    const std::map<std::string, std::optional<std::string>>& discoveredPeers() const { return m_discovered_peers; }

    void setSelectedPeer(const std::string& address) { m_selected_peer = address; }
    const std::string& selectedPeer() const { return m_selected_peer; }

    void setPin(const std::string& pin) { m_pin = pin; }
    const std::optional<std::string>& pin() const { return m_pin; }

    void setConnectivity(ConnectivityResult result) { m_connectivity = std::move(result); }
    const ConnectivityResult& connectivity() const { return m_connectivity; }

    void setFailureReason(const std::string& reason) { m_failure_reason = reason; }
    void setCancelled() { m_cancelled = true; }

    void setInitiatorAgent(const AgentHandle& handle) { m_initiator_agent = handle; }
    void setResponderAgent(const AgentHandle& handle) { m_responder_agent = handle; }
    void clearAgents();
    const AgentHandle& initiatorAgent() const { return m_initiator_agent; }
    const AgentHandle& responderAgent() const { return m_responder_agent; }

    SessionOutcome toOutcome() const;

    static bool isAllowed(SessionState from, SessionState to);

private:
    Endpoint m_initiator;
    Endpoint m_responder;
    AgentHandle m_initiator_agent;
    AgentHandle m_responder_agent;
    Clock::time_point m_created_at;
    SessionState m_state = SessionState::Init;
    SessionPath m_path = SessionPath::None;
    Clock::time_point m_phase_started_at;
    std::optional<Clock::time_point> m_phase_deadline;
    std::map<std::string, std::optional<std::string>> m_discovered_peers;
    std::string m_selected_peer;
    std::optional<std::string> m_pin;
    ConnectivityResult m_connectivity;
    std::string m_failure_reason;
    bool m_cancelled = false;
    std::vector<SessionTransition> m_transitions;
};

} // namespace p2plink

#endif // P2PLINK_PAIRING_SESSION_H
