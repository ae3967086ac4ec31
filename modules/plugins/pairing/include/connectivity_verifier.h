#ifndef P2PLINK_CONNECTIVITY_VERIFIER_H
#define P2PLINK_CONNECTIVITY_VERIFIER_H

#include "pairing_session.h"
#include "reachability_probe.h"

namespace p2plink {

// All-or-nothing reachability check: success needs a reply to every probe.
class ConnectivityVerifier {
public:
    explicit ConnectivityVerifier(IReachabilityProbe& probe);

    // Never throws.
    ConnectivityResult verify(const Endpoint& endpoint1, const Endpoint& endpoint2,
                              int attempts, Millis per_attempt_timeout);

private:
    IReachabilityProbe& m_probe;
};

} // namespace p2plink

#endif // P2PLINK_CONNECTIVITY_VERIFIER_H
