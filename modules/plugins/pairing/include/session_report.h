#ifndef P2PLINK_SESSION_REPORT_H
#define P2PLINK_SESSION_REPORT_H

#include "pairing_session.h"
#include <nlohmann/json.hpp>
#include <string>

namespace p2plink {

// Machine-readable form of a session result (CLI --json output).
nlohmann::json outcome_to_json(const SessionOutcome& outcome, bool include_evidence = true);

// One-line human summary: "Verified via blind, 3/3 replies"
std::string outcome_summary(const SessionOutcome& outcome);

} // namespace p2plink

#endif // P2PLINK_SESSION_REPORT_H
