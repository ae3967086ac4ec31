#include "connectivity_verifier.h"
#include "logger.h"
#include <algorithm>

namespace p2plink {

ConnectivityVerifier::ConnectivityVerifier(IReachabilityProbe& probe) : m_probe(probe) {}

ConnectivityResult ConnectivityVerifier::verify(const Endpoint& endpoint1, const Endpoint& endpoint2,
                                                int attempts, Millis per_attempt_timeout) {
    ConnectivityResult result;
    result.attempts = std::max(1, attempts);

    LOG_INFO("Verify: " + endpoint1.label() + "(" + endpoint1.ipAddress() + ") -> " +
             endpoint2.label() + "(" + endpoint2.ipAddress() + ")");

    if (endpoint2.ipAddress().empty()) {
        result.evidence = "no address assigned to " + endpoint2.label();
        LOG_WARN("Verify: " + result.evidence);
        return result;
    }

    ProbeReport report = m_probe.probe(endpoint1, endpoint2.ipAddress(), result.attempts, per_attempt_timeout);
    result.replies = std::max(0, report.received);
    result.evidence = std::move(report.evidence);
    result.success = result.replies >= result.attempts;

    if (result.success) {
        LOG_INFO("Verify: PASSED " + std::to_string(result.replies) + "/" + std::to_string(result.attempts));
    } else {
        LOG_WARN("Verify: FAILED " + std::to_string(result.replies) + "/" + std::to_string(result.attempts) +
                 "\n" + result.evidence);
    }
    return result;
}

} // namespace p2plink
