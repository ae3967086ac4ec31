#ifndef P2PLINK_PAIRING_NEGOTIATOR_H
#define P2PLINK_PAIRING_NEGOTIATOR_H

#include "discovery_agent.h"
#include "clock.h"
#include <mutex>
#include <optional>
#include <string>

namespace p2plink {

// Pause between the initiator publishing a PIN and the responder using it,
// so the initiator's agent reaches its awaiting state. Shared by the
// discovery and blind paths.
static constexpr Millis kPinSettleDelay = Millis(3000);

/**
 * PIN-based handshake between two agents.
 *
 * initiate() asks the initiator's agent for a PIN toward the responder;
 * respond() hands that same PIN to the responder's agent. A respond() with
 * any PIN other than the one produced by the latest initiate() is refused.
 */
class PairingNegotiator {
public:
    PairingNegotiator(IDiscoveryAgent& agent, IClock& clock);

    // Throws NegotiationError if no usable PIN comes back, AgentUnavailable
    // if the agent is gone.
    std::string initiate(const AgentHandle& initiator, const std::string& peer_address);

    // Waits out kPinSettleDelay since initiate() completed, then accepts.
    // Throws NegotiationError on PIN mismatch or refusal.
    void respond(const AgentHandle& responder, const std::string& peer_address, const std::string& pin);

    // First standalone 4-8 digit token in the reply; empty when none
    static std::string parsePin(const std::string& reply);

private:
    IDiscoveryAgent& m_agent;
    IClock& m_clock;

    std::mutex m_mutex;
    std::optional<std::string> m_issued_pin;
    Clock::time_point m_issued_at;
};

} // namespace p2plink

#endif // P2PLINK_PAIRING_NEGOTIATOR_H
