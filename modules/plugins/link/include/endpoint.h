#ifndef P2PLINK_ENDPOINT_H
#define P2PLINK_ENDPOINT_H

#include "session_state.h"
#include <string>

namespace p2plink {

/**
 * One side of a pairing attempt: a radio interface and the addresses it is
 * known by. Identity is fixed at construction; only the phase marker moves.
 */
class Endpoint {
public:
    Endpoint(std::string name,
             std::string interface_name,
             std::string hw_address,
             std::string ip_address,
             std::string netns = "");

    const std::string& name() const { return m_name; }
    const std::string& interfaceName() const { return m_interface_name; }
    const std::string& hwAddress() const { return m_hw_address; }
    const std::string& ipAddress() const { return m_ip_address; }
    const std::string& netns() const { return m_netns; }

    SessionState phase() const { return m_phase; }
    void setPhase(SessionState phase) { m_phase = phase; }

    // "name(iface)"
    std::string label() const;

    // Parses "name:iface:mac:ip[:netns]" (the MAC itself contains colons,
    // so it is taken as the six fields after the interface).
    // Throws std::invalid_argument on malformed input.
    static Endpoint parse(const std::string& spec);

private:
    std::string m_name;
    std::string m_interface_name;
    std::string m_hw_address;
    std::string m_ip_address;
    std::string m_netns;
    SessionState m_phase = SessionState::Init;
};

// Lower-cases a MAC and checks the xx:xx:xx:xx:xx:xx shape; empty result if invalid.
std::string normalize_mac(const std::string& mac);

} // namespace p2plink

#endif // P2PLINK_ENDPOINT_H
