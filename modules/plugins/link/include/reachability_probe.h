#ifndef P2PLINK_REACHABILITY_PROBE_H
#define P2PLINK_REACHABILITY_PROBE_H

#include "endpoint.h"
#include "command_runner.h"
#include "clock.h"
#include <string>

namespace p2plink {

struct ProbeReport {
    int sent = 0;
    int received = 0;
    std::string evidence;   // raw probe tool output
};

// "send N probes to address, with per-probe timeout" -> reply count
class IReachabilityProbe {
public:
    virtual ~IReachabilityProbe() = default;
    // Never throws; an unreachable target yields received == 0.
    virtual ProbeReport probe(const Endpoint& from, const std::string& target_ip,
                              int count, Millis per_probe_timeout) = 0;
};

// ICMP echo via ping(8), run in the source endpoint's namespace.
class PingProbe : public IReachabilityProbe {
public:
    explicit PingProbe(ICommandRunner& runner);

    ProbeReport probe(const Endpoint& from, const std::string& target_ip,
                      int count, Millis per_probe_timeout) override;

    // Extracts "<n> received" (or "<n> packets received") from ping output; -1 if absent.
    static int parseReceived(const std::string& output);

private:
    ICommandRunner& m_runner;
};

} // namespace p2plink

#endif // P2PLINK_REACHABILITY_PROBE_H
