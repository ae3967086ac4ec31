#include "session_report.h"

namespace p2plink {

nlohmann::json outcome_to_json(const SessionOutcome& outcome, bool include_evidence) {
    nlohmann::json j;
    j["state"] = to_string(outcome.state);
    j["path"] = to_string(outcome.path);
    j["initiator"] = outcome.initiator;
    j["responder"] = outcome.responder;
    j["selected_peer"] = outcome.selected_peer;
    j["cancelled"] = outcome.cancelled;
    if (!outcome.failure_reason.empty()) {
        j["failure_reason"] = outcome.failure_reason;
    }

    nlohmann::json connectivity;
    connectivity["success"] = outcome.connectivity.success;
    connectivity["attempts"] = outcome.connectivity.attempts;
    connectivity["replies"] = outcome.connectivity.replies;
    if (include_evidence) {
        connectivity["evidence"] = outcome.connectivity.evidence;
    }
    j["connectivity"] = connectivity;

    nlohmann::json peers = nlohmann::json::object();
    for (const auto& entry : outcome.discovered_peers) {
        peers[entry.first] = entry.second ? nlohmann::json(*entry.second) : nlohmann::json(nullptr);
    }
    j["discovered_peers"] = peers;

    nlohmann::json transitions = nlohmann::json::array();
    for (const auto& t : outcome.transitions) {
        nlohmann::json entry;
        entry["from"] = to_string(t.from);
        entry["to"] = to_string(t.to);
        entry["elapsed_ms"] = t.elapsed.count();
        if (!t.detail.empty()) {
            entry["detail"] = t.detail;
        }
        transitions.push_back(entry);
    }
    j["transitions"] = transitions;

    if (include_evidence && !outcome.diagnostics.empty()) {
        j["diagnostics"] = outcome.diagnostics;
    }
    return j;
}

std::string outcome_summary(const SessionOutcome& outcome) {
    std::string line = to_string(outcome.state);
    if (outcome.state == SessionState::Verified) {
        line += " via " + std::string(to_string(outcome.path)) + ", " +
                std::to_string(outcome.connectivity.replies) + "/" +
                std::to_string(outcome.connectivity.attempts) + " replies" +
                (outcome.connectivity.success ? "" : " (link not reachable)");
    } else if (!outcome.failure_reason.empty()) {
        line += ": " + outcome.failure_reason;
    }
    return line;
}

} // namespace p2plink
