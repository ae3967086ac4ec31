#ifndef P2PLINK_DISCOVERY_AGENT_H
#define P2PLINK_DISCOVERY_AGENT_H

#include "endpoint.h"
#include "command_runner.h"
#include "clock.h"
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace p2plink {

// Configuration blob handed to the agent at start (P2P device parameters).
struct AgentConfig {
    std::string ctrl_interface = "/var/run/wpa_supplicant";
    std::string device_name = "STA";
    std::string device_type = "1-0050F204-1";
    int go_intent = 7;
    bool go_ht40 = true;

    // Rendered configuration file contents
    std::string render() const;
};

/**
 * Opaque reference to one started agent. A handle stays valid until the
 * agent is stopped or superseded by a newer start on the same interface
 * (same network namespace); after that every operation on it behaves as
 * "not running".
 */
struct AgentHandle {
    std::string interface_name;
    std::string netns;
    std::string ctrl_dir;   // control socket directory (namespaced agents only)
    uint64_t generation = 0;

    bool valid() const { return generation != 0; }
};

// Capability set every agent backend provides.
class IDiscoveryAgent {
public:
    virtual ~IDiscoveryAgent() = default;

    // Stops any agent already running for the endpoint's interface first.
    // Throws AgentUnavailable if the launch itself fails.
    virtual AgentHandle start(const Endpoint& endpoint, const AgentConfig& config) = 0;

    // No-op for stopped or superseded handles.
    virtual void stop(const AgentHandle& handle) = 0;

    // Stops whatever agent serves this interface, tracked or not.
    virtual void stopInterface(const Endpoint& endpoint) = 0;

    // May briefly report false right after start(); callers settle first.
    virtual bool isAlive(const AgentHandle& handle) = 0;

    // Throws AgentUnavailable if the agent is not running.
    virtual std::string command(const AgentHandle& handle, const std::string& cmd) = 0;

    std::string status(const AgentHandle& handle) { return command(handle, "status"); }
};

// wpa_supplicant (P2P enabled) driven through wpa_cli.
class WpaSupplicantAgent : public IDiscoveryAgent {
public:
    struct Options {
        std::string binary = "wpa_supplicant";
        std::string cli = "wpa_cli";
        std::string driver = "nl80211";
        std::string config_dir = "/tmp";
        Millis command_timeout = Millis(5000);
    };

    WpaSupplicantAgent(ICommandRunner& runner, Options options);

    AgentHandle start(const Endpoint& endpoint, const AgentConfig& config) override;
    void stop(const AgentHandle& handle) override;
    void stopInterface(const Endpoint& endpoint) override;
    bool isAlive(const AgentHandle& handle) override;
    std::string command(const AgentHandle& handle, const std::string& cmd) override;

    // Number of (namespace, interface) pairs with a tracked live agent
    size_t liveCount() const;

    // "<dir>/<iface>_wpa.conf", or "<dir>/<netns>_<iface>_wpa.conf" inside a namespace
    std::string configPathFor(const std::string& interface_name, const std::string& netns = "") const;

    // Matches only the agent launched with this endpoint's config file
    std::string processPattern(const std::string& interface_name, const std::string& netns = "") const;

private:
    bool isCurrent(const AgentHandle& handle) const;
    void killInterface(const std::string& interface_name, const std::string& netns);

    ICommandRunner& m_runner;
    Options m_options;

    mutable std::mutex m_mutex;
    uint64_t m_next_generation = 1;
    std::unordered_map<std::string, uint64_t> m_live;   // registry_key(netns, interface) -> generation
};

} // namespace p2plink

#endif // P2PLINK_DISCOVERY_AGENT_H
