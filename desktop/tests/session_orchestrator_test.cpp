#include "session_orchestrator.h"
#include "session_report.h"
#include "logger.h"
#include "test_support.h"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace p2plink;

namespace {

const std::string kStaMac = "02:00:00:00:00:00";
const std::string kApMac = "02:00:00:00:01:00";

Endpoint sta() { return Endpoint("sta1", "sta1-wlan0", kStaMac, "10.0.0.1"); }
Endpoint ap() { return Endpoint("sta2", "sta2-wlan0", kApMac, "10.0.0.2"); }

// One orchestrator plus the fakes it drives
struct Harness {
    FakeInterfaceController interfaces;
    FakeAgent agent;
    FakeProbe probe;
    FakeClock clock;
    PairingOptions options;

    SessionOutcome run(const CancellationToken* cancel = nullptr) {
        SessionOrchestrator orchestrator(PairingDependencies{interfaces, agent, probe, clock}, options);
        return orchestrator.run(sta(), ap(), cancel);
    }

    SessionOutcome run(const Endpoint& initiator, const Endpoint& responder) {
        SessionOrchestrator orchestrator(PairingDependencies{interfaces, agent, probe, clock}, options);
        return orchestrator.run(initiator, responder);
    }
};

std::vector<SessionState> states_visited(const SessionOutcome& outcome) {
    std::vector<SessionState> states;
    for (const auto& t : outcome.transitions) {
        states.push_back(t.to);
    }
    return states;
}

bool visited(const SessionOutcome& outcome, SessionState state) {
    auto states = states_visited(outcome);
    return std::find(states.begin(), states.end(), state) != states.end();
}

Millis entered_at(const SessionOutcome& outcome, SessionState state) {
    for (const auto& t : outcome.transitions) {
        if (t.to == state) return t.elapsed;
    }
    return Millis(-1);
}

// Cancels the session from inside the discovery phase
class CancellingAgent : public FakeAgent {
public:
    explicit CancellingAgent(CancellationToken& token) : m_token(token) {}

    std::string command(const AgentHandle& handle, const std::string& cmd) override {
        if (cmd == "p2p_find") {
            m_token.cancel();
        }
        return FakeAgent::command(handle, cmd);
    }

private:
    CancellationToken& m_token;
};

} // namespace

bool test_happy_path_via_discovery() {
    std::cout << "Testing pairing via discovery..." << std::endl;

    Harness h;
    h.agent.peers_by_interface["sta1-wlan0"] = {kApMac};
    h.agent.peers_by_interface["sta2-wlan0"] = {kStaMac};

    SessionOutcome outcome = h.run();
    TEST_ASSERT(outcome.verified(), "should end Verified, got " + std::string(to_string(outcome.state)));
    TEST_ASSERT(outcome.path == SessionPath::Discovery, "path should be discovery");
    TEST_ASSERT(outcome.connectivity.success, "3/3 probes");
    TEST_ASSERT(outcome.connectivity.replies == 3 && outcome.connectivity.attempts == 3, "reply counts");
    TEST_ASSERT(outcome.selected_peer == kApMac, "initiator targets the responder");
    TEST_ASSERT(outcome.discovered_peers.size() == 2, "both sides' peers recorded");

    const std::vector<SessionState> expected = {
        SessionState::InterfacesUp, SessionState::AgentsStarted, SessionState::Discovering,
        SessionState::PeersFound, SessionState::Negotiating, SessionState::AwaitingConnection,
        SessionState::Verified};
    TEST_ASSERT(states_visited(outcome) == expected, "phases should advance monotonically");

    TEST_ASSERT(h.agent.starts().size() == 2, "one agent per endpoint");
    TEST_ASSERT(h.agent.liveCount() == 2, "agents stay up for the paired link");
    TEST_ASSERT(h.probe.last_from == "sta1-wlan0" && h.probe.last_target == "10.0.0.2", "probe initiator -> responder");
    TEST_ASSERT(h.agent.lastConfig().device_name == "STA", "agent config from options");

    TEST_ASSERT(outcome.diagnostics.size() == 2, "diagnostics for both endpoints");
    TEST_ASSERT(outcome.diagnostics["sta1(sta1-wlan0)"].find("p2p_state=ACTIVE") != std::string::npos,
                "diagnostics include agent status");

    TEST_PASS("pairing via discovery");
    return true;
}

bool test_blind_pairing_without_peers() {
    std::cout << "Testing blind pairing when discovery finds nothing..." << std::endl;

    Harness h;
    SessionOutcome outcome = h.run();
    TEST_ASSERT(outcome.verified(), "should end Verified");
    TEST_ASSERT(outcome.path == SessionPath::Blind, "path should be blind");
    TEST_ASSERT(visited(outcome, SessionState::NoPeersFound), "NoPeersFound recorded");
    TEST_ASSERT(!visited(outcome, SessionState::PeersFound), "PeersFound not recorded");
    TEST_ASSERT(outcome.discovered_peers.empty(), "no peers");
    TEST_ASSERT(outcome.selected_peer == kApMac, "blind path uses the known address");

    bool targeted = false;
    for (const auto& c : h.agent.commands()) {
        if (c.first == "sta1-wlan0" && c.second == "p2p_connect " + kApMac + " pin auth") targeted = true;
    }
    TEST_ASSERT(targeted, "initiator asked for a PIN toward the responder's MAC");

    TEST_PASS("blind pairing when discovery finds nothing");
    return true;
}

bool test_negotiation_failure_falls_back() {
    std::cout << "Testing fallback after negotiation failure..." << std::endl;

    Harness h;
    h.agent.pin_reply = "FAIL";
    h.probe.replies = 0;

    SessionOutcome outcome = h.run();
    TEST_ASSERT(outcome.verified(), "fallback always ends Verified");
    TEST_ASSERT(outcome.path == SessionPath::AdHoc, "path should be adhoc");
    TEST_ASSERT(!outcome.connectivity.success, "unreachable link is reported, not hidden");
    TEST_ASSERT(h.probe.calls == 1, "verification ran once");
    TEST_ASSERT(visited(outcome, SessionState::FallbackAdHoc), "FallbackAdHoc recorded");
    TEST_ASSERT(!visited(outcome, SessionState::AwaitingConnection), "never waited for a connection");
    TEST_ASSERT(h.agent.receivedPins().empty(), "responder never got a PIN");

    auto s1 = h.interfaces.state("sta1-wlan0");
    auto s2 = h.interfaces.state("sta2-wlan0");
    TEST_ASSERT(s1.mode == "ad-hoc" && s2.mode == "ad-hoc", "both sides in ad-hoc mode");
    TEST_ASSERT(s1.channel == 6 && s2.channel == 6, "shared channel");
    TEST_ASSERT(s1.essid == "test-adhoc" && s2.essid == "test-adhoc", "shared network name");
    TEST_ASSERT(h.agent.liveCount() == 0, "agents stopped for ad-hoc mode");

    TEST_PASS("fallback after negotiation failure");
    return true;
}

bool test_vanished_agent_during_negotiation_falls_back() {
    std::cout << "Testing fallback when the agent disappears mid-negotiation..." << std::endl;

    Harness h;
    h.agent.initiate_unavailable = true;

    SessionOutcome outcome = h.run();
    TEST_ASSERT(outcome.verified(), "should end Verified");
    TEST_ASSERT(outcome.path == SessionPath::AdHoc, "path should be adhoc");
    TEST_ASSERT(outcome.connectivity.success, "ad-hoc link reachable");

    TEST_PASS("fallback when the agent disappears mid-negotiation");
    return true;
}

bool test_connection_timeout_falls_back() {
    std::cout << "Testing fallback after connection timeout..." << std::endl;

    Harness h;
    h.agent.peers_by_interface["sta1-wlan0"] = {kApMac};
    h.agent.connected_after_polls = -1;

    SessionOutcome outcome = h.run();
    TEST_ASSERT(outcome.verified(), "should end Verified");
    TEST_ASSERT(outcome.path == SessionPath::AdHoc, "path should be adhoc");
    TEST_ASSERT(visited(outcome, SessionState::AwaitingConnection), "waited for the link");
    TEST_ASSERT(visited(outcome, SessionState::FallbackAdHoc), "then fell back");

    const Millis waited = entered_at(outcome, SessionState::FallbackAdHoc) -
                          entered_at(outcome, SessionState::AwaitingConnection);
    TEST_ASSERT(waited >= h.options.connect_deadline, "full deadline honoured");
    TEST_ASSERT(waited <= h.options.connect_deadline + h.options.connect_poll_interval,
                "gave up within one poll of the deadline, waited " + std::to_string(waited.count()));
    TEST_ASSERT(h.agent.receivedPins() == h.agent.issuedPins(), "PIN handoff completed before the wait");

    TEST_PASS("fallback after connection timeout");
    return true;
}

bool test_interface_failure_aborts() {
    std::cout << "Testing interface failure aborts the session..." << std::endl;

    Harness h;
    h.interfaces.fail_bring_up.insert("sta2-wlan0");

    SessionOutcome outcome = h.run();
    TEST_ASSERT(outcome.state == SessionState::Failed, "should end Failed");
    TEST_ASSERT(outcome.failure_reason.find("interface") != std::string::npos, "reason names the interface step");
    TEST_ASSERT(!outcome.cancelled, "not a cancellation");
    TEST_ASSERT(h.agent.starts().empty(), "no agents started");
    TEST_ASSERT(!visited(outcome, SessionState::FallbackAdHoc), "no fallback attempted");
    TEST_ASSERT(h.probe.calls == 0, "no verification");
    TEST_ASSERT(outcome.transitions.size() == 1, "Init -> Failed only");

    TEST_PASS("interface failure aborts the session");
    return true;
}

bool test_agent_start_failure_aborts() {
    std::cout << "Testing agent start failure aborts the session..." << std::endl;

    Harness h;
    h.agent.fail_start_on.insert("sta2-wlan0");
    SessionOutcome outcome = h.run();
    TEST_ASSERT(outcome.state == SessionState::Failed, "should end Failed");
    TEST_ASSERT(outcome.failure_reason.find("agent") != std::string::npos, "reason names the agent step");
    TEST_ASSERT(h.agent.liveCount() == 0, "the agent that did start is stopped again");
    TEST_ASSERT(h.agent.stops().size() == 1 && h.agent.stops()[0] == "sta1-wlan0", "initiator agent stopped");

    Harness dead;
    dead.agent.report_alive = false;
    SessionOutcome dead_outcome = dead.run();
    TEST_ASSERT(dead_outcome.state == SessionState::Failed, "agents that never come alive fail the session");
    TEST_ASSERT(dead.agent.liveCount() == 0, "both agents cleaned up");

    TEST_PASS("agent start failure aborts the session");
    return true;
}

bool test_discovery_agent_failure_aborts() {
    std::cout << "Testing an agent that stops answering during discovery aborts the session..." << std::endl;

    Harness h;
    h.agent.discover_unavailable_on.insert("sta2-wlan0");
    SessionOutcome outcome = h.run();
    TEST_ASSERT(outcome.state == SessionState::Failed, "should end Failed, got " + std::string(to_string(outcome.state)));
    TEST_ASSERT(outcome.failure_reason.rfind("discovery:", 0) == 0,
                "reason names the discovery step, got: " + outcome.failure_reason);
    TEST_ASSERT(!outcome.cancelled, "not a cancellation");
    TEST_ASSERT(h.agent.liveCount() == 0, "both agents stopped");

    auto stops = h.agent.stops();
    std::sort(stops.begin(), stops.end());
    TEST_ASSERT((stops == std::vector<std::string>{"sta1-wlan0", "sta2-wlan0"}), "stop issued for each agent");
    TEST_ASSERT(visited(outcome, SessionState::Discovering), "failure happened while discovering");
    TEST_ASSERT(!visited(outcome, SessionState::Negotiating), "no negotiation after a failed discovery");
    TEST_ASSERT(!visited(outcome, SessionState::FallbackAdHoc), "no fallback either");
    TEST_ASSERT(h.probe.calls == 0, "no verification");

    TEST_PASS("an agent that stops answering during discovery aborts the session");
    return true;
}

bool test_same_interface_name_in_two_namespaces() {
    std::cout << "Testing endpoints sharing an interface name across namespaces..." << std::endl;

    Harness h;
    Endpoint a("sta1", "wlan0", kStaMac, "10.0.0.1", "ns1");
    Endpoint b("sta2", "wlan0", kApMac, "10.0.0.2", "ns2");

    SessionOutcome outcome = h.run(a, b);
    TEST_ASSERT(outcome.verified(), "should end Verified, got " + std::string(to_string(outcome.state)) +
                " (" + outcome.failure_reason + ")");
    TEST_ASSERT(h.agent.superseded() == 0, "second start must not replace the first agent");
    TEST_ASSERT(h.agent.liveCount() == 2, "one live agent per namespace");
    TEST_ASSERT(h.agent.starts().size() == 2, "two starts");

    TEST_PASS("endpoints sharing an interface name across namespaces");
    return true;
}

bool test_cancellation() {
    std::cout << "Testing cancellation..." << std::endl;

    Harness h;
    CancellationToken token;
    token.cancel();
    SessionOutcome outcome = h.run(&token);
    TEST_ASSERT(outcome.state == SessionState::Failed, "cancelled session ends Failed");
    TEST_ASSERT(outcome.cancelled, "cancelled flag set");
    TEST_ASSERT(outcome.failure_reason == "cancelled", "reason");
    TEST_ASSERT(h.interfaces.bringUps() == 0, "nothing touched");

    CancellationToken mid;
    FakeInterfaceController interfaces;
    CancellingAgent agent(mid);
    FakeProbe probe;
    FakeClock clock;
    SessionOrchestrator orchestrator(PairingDependencies{interfaces, agent, probe, clock}, PairingOptions());
    SessionOutcome mid_outcome = orchestrator.run(sta(), ap(), &mid);
    TEST_ASSERT(mid_outcome.state == SessionState::Failed && mid_outcome.cancelled, "cancelled after discovery");
    TEST_ASSERT(!visited(mid_outcome, SessionState::Negotiating), "negotiation never started");
    TEST_ASSERT(agent.liveCount() == 0, "agents stopped on cancellation");

    TEST_PASS("cancellation");
    return true;
}

bool test_pin_is_handed_over_unchanged() {
    std::cout << "Testing PIN equality across sessions..." << std::endl;

    const std::vector<std::string> pins = {"1234", "00000000", "55667788", "90210"};
    for (const auto& pin : pins) {
        Harness h;
        h.agent.pin_reply = pin;
        SessionOutcome outcome = h.run();
        TEST_ASSERT(outcome.verified() && outcome.path == SessionPath::Blind, "pairing with pin " + pin);
        TEST_ASSERT(h.agent.issuedPins().size() == 1, "one PIN issued");
        TEST_ASSERT(h.agent.receivedPins().size() == 1, "one PIN consumed");
        TEST_ASSERT(h.agent.receivedPins()[0] == pin, "responder got the initiator's PIN " + pin);
    }

    TEST_PASS("PIN equality across sessions");
    return true;
}

bool test_star_pairing_reuses_orchestrator() {
    std::cout << "Testing one hub paired with two stations..." << std::endl;

    FakeInterfaceController interfaces;
    FakeAgent agent;
    FakeProbe probe;
    FakeClock clock;
    SessionOrchestrator orchestrator(PairingDependencies{interfaces, agent, probe, clock}, PairingOptions());

    Endpoint hub("hub", "hub-wlan0", "02:00:00:00:0a:00", "10.0.0.10");
    Endpoint st1("st1", "st1-wlan0", "02:00:00:00:0b:00", "10.0.0.11");
    Endpoint st2("st2", "st2-wlan0", "02:00:00:00:0c:00", "10.0.0.12");

    SessionOutcome first = orchestrator.run(hub, st1);
    SessionOutcome second = orchestrator.run(hub, st2);
    TEST_ASSERT(first.verified() && second.verified(), "both pairings verified");
    TEST_ASSERT(agent.superseded() == 1, "hub agent restarted for the second session");
    TEST_ASSERT(agent.liveCount() == 3, "one agent per interface");
    TEST_ASSERT(probe.last_target == "10.0.0.12", "second session probed the second station");

    bool threw = false;
    try {
        orchestrator.run(hub, hub);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    TEST_ASSERT(threw, "pairing an interface with itself is rejected");

    TEST_PASS("one hub paired with two stations");
    return true;
}

bool test_outcome_report() {
    std::cout << "Testing outcome report..." << std::endl;

    Harness h;
    h.agent.peers_by_interface["sta1-wlan0"] = {kApMac};
    h.options.resolve_peer_names = true;
    h.options.collect_diagnostics = false;
    SessionOutcome outcome = h.run();

    TEST_ASSERT(outcome.diagnostics.empty(), "diagnostics can be switched off");
    TEST_ASSERT(outcome.discovered_peers.at(kApMac) == std::string("peer-sta1-wlan0"), "peer name resolved");

    nlohmann::json j = outcome_to_json(outcome);
    TEST_ASSERT(j["state"] == "Verified", "state in JSON");
    TEST_ASSERT(j["path"] == "discovery", "path in JSON");
    TEST_ASSERT(j["connectivity"]["replies"] == 3, "replies in JSON");
    TEST_ASSERT(j["transitions"].size() == outcome.transitions.size(), "transitions in JSON");
    TEST_ASSERT(j["discovered_peers"][kApMac] == "peer-sta1-wlan0", "peers in JSON");
    TEST_ASSERT(!j.contains("failure_reason"), "no failure reason on success");

    const std::string summary = outcome_summary(outcome);
    TEST_ASSERT(summary == "Verified via discovery, 3/3 replies", "summary line, got: " + summary);

    Harness broken;
    broken.interfaces.fail_bring_up.insert("sta1-wlan0");
    SessionOutcome failed = broken.run();
    TEST_ASSERT(outcome_summary(failed).rfind("Failed: interface", 0) == 0, "failure summary");
    TEST_ASSERT(outcome_to_json(failed)["failure_reason"].is_string(), "failure reason in JSON");

    TEST_PASS("outcome report");
    return true;
}

int main() {
    std::cout << "Running session orchestrator tests..." << std::endl;
    set_log_level(LogLevel::ERROR);

    test_happy_path_via_discovery();
    test_blind_pairing_without_peers();
    test_negotiation_failure_falls_back();
    test_vanished_agent_during_negotiation_falls_back();
    test_connection_timeout_falls_back();
    test_interface_failure_aborts();
    test_agent_start_failure_aborts();
    test_discovery_agent_failure_aborts();
    test_same_interface_name_in_two_namespaces();
    test_cancellation();
    test_pin_is_handed_over_unchanged();
    test_star_pairing_reuses_orchestrator();
    test_outcome_report();

    return finish_tests("SESSION ORCHESTRATOR");
}
