#ifndef P2PLINK_LINK_ERRORS_H
#define P2PLINK_LINK_ERRORS_H

#include <stdexcept>
#include <string>

namespace p2plink {

// Interface activation or reconfiguration failed. Fatal for a session.
class InterfaceError : public std::runtime_error {
public:
    explicit InterfaceError(const std::string& what) : std::runtime_error(what) {}
};

// A command was issued to an agent that is not running (or was superseded).
class AgentUnavailable : public std::runtime_error {
public:
    explicit AgentUnavailable(const std::string& what) : std::runtime_error(what) {}
};

// The agent refused, or could not produce or consume, a pairing PIN.
class NegotiationError : public std::runtime_error {
public:
    explicit NegotiationError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace p2plink

#endif // P2PLINK_LINK_ERRORS_H
