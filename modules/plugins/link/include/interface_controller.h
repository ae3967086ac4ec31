#ifndef P2PLINK_INTERFACE_CONTROLLER_H
#define P2PLINK_INTERFACE_CONTROLLER_H

#include "endpoint.h"
#include "command_runner.h"
#include "clock.h"
#include <string>

namespace p2plink {

// Control surface for one radio interface.
class IInterfaceController {
public:
    virtual ~IInterfaceController() = default;

    // Idempotent. Throws InterfaceError when activation reports failure.
    virtual void bringUp(const Endpoint& endpoint) = 0;
    virtual void bringDown(const Endpoint& endpoint) = 0;

    // Advisory link text; empty on error, never throws.
    virtual std::string status(const Endpoint& endpoint) = 0;
    virtual std::string addresses(const Endpoint& endpoint) = 0;

    // Connectionless (IBSS) mode with a shared channel and network name.
    // Throw InterfaceError on failure.
    virtual void setAdHocMode(const Endpoint& endpoint) = 0;
    virtual void setSharedChannel(const Endpoint& endpoint, int channel, const std::string& network_name) = 0;
};

// iproute2 + wireless-tools implementation.
class IwInterfaceController : public IInterfaceController {
public:
    IwInterfaceController(ICommandRunner& runner, Millis command_timeout);

    void bringUp(const Endpoint& endpoint) override;
    void bringDown(const Endpoint& endpoint) override;
    std::string status(const Endpoint& endpoint) override;
    std::string addresses(const Endpoint& endpoint) override;
    void setAdHocMode(const Endpoint& endpoint) override;
    void setSharedChannel(const Endpoint& endpoint, int channel, const std::string& network_name) override;

private:
    void runChecked(const Endpoint& endpoint, const std::string& command, const std::string& what);
    std::string runAdvisory(const Endpoint& endpoint, const std::string& command);

    ICommandRunner& m_runner;
    Millis m_command_timeout;
};

} // namespace p2plink

#endif // P2PLINK_INTERFACE_CONTROLLER_H
