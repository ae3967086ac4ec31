#include "pairing_negotiator.h"
#include "link_errors.h"
#include "logger.h"
#include <cctype>
#include <sstream>

namespace p2plink {

PairingNegotiator::PairingNegotiator(IDiscoveryAgent& agent, IClock& clock)
    : m_agent(agent), m_clock(clock) {}

std::string PairingNegotiator::parsePin(const std::string& reply) {
    std::istringstream in(reply);
    std::string token;
    while (in >> token) {
        if (token.size() < 4 || token.size() > 8) {
            continue;
        }
        bool digits = true;
        for (char c : token) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                digits = false;
                break;
            }
        }
        if (digits) {
            return token;
        }
    }
    return "";
}

std::string PairingNegotiator::initiate(const AgentHandle& initiator, const std::string& peer_address) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_issued_pin.reset();
    }

    const std::string reply = m_agent.command(initiator, "p2p_connect " + peer_address + " pin auth");
    if (reply.find("FAIL") != std::string::npos) {
        throw NegotiationError("initiator " + initiator.interface_name + " refused pairing with " +
                               peer_address + ": " + reply);
    }
    const std::string pin = parsePin(reply);
    if (pin.empty()) {
        throw NegotiationError("initiator " + initiator.interface_name + " returned no PIN: " + reply);
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_issued_pin = pin;
        m_issued_at = m_clock.now();
    }
    LOG_INFO("Negotiation: " + initiator.interface_name + " issued PIN for " + peer_address);
    return pin;
}

void PairingNegotiator::respond(const AgentHandle& responder, const std::string& peer_address, const std::string& pin) {
    Clock::time_point issued_at;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_issued_pin) {
            throw NegotiationError("respond called before a PIN was issued");
        }
        if (*m_issued_pin != pin) {
            throw NegotiationError("PIN does not match the one issued for this attempt");
        }
        issued_at = m_issued_at;
    }

    const auto ready_at = issued_at + kPinSettleDelay;
    const auto now = m_clock.now();
    if (now < ready_at) {
        m_clock.sleepFor(std::chrono::duration_cast<Millis>(ready_at - now));
    }

    const std::string reply = m_agent.command(responder, "p2p_connect " + peer_address + " " + pin);
    if (reply.find("FAIL") != std::string::npos) {
        throw NegotiationError("responder " + responder.interface_name + " rejected PIN: " + reply);
    }
    LOG_INFO("Negotiation: " + responder.interface_name + " accepted PIN from " + peer_address);
}

} // namespace p2plink
