#include "reachability_probe.h"
#include "logger.h"
#include <algorithm>
#include <regex>

namespace p2plink {

PingProbe::PingProbe(ICommandRunner& runner) : m_runner(runner) {}

int PingProbe::parseReceived(const std::string& output) {
    // iputils: "3 packets transmitted, 3 received"; busybox: "3 packets received"
    static const std::regex received_re(R"((\d+)\s+(?:packets\s+)?received)");
    std::smatch match;
    if (std::regex_search(output, match, received_re)) {
        try {
            return std::stoi(match[1].str());
        } catch (const std::exception&) {
            return -1;
        }
    }
    return -1;
}

ProbeReport PingProbe::probe(const Endpoint& from, const std::string& target_ip,
                             int count, Millis per_probe_timeout) {
    ProbeReport report;
    report.sent = std::max(1, count);

    // ping -W takes whole seconds
    const long wait_s = std::max<long>(1, static_cast<long>((per_probe_timeout.count() + 999) / 1000));
    const std::string cmd = "ping -c " + std::to_string(report.sent) + " -W " + std::to_string(wait_s) +
                            " " + shell_quote(target_ip);
    // One second between echo requests plus the wait for the last reply
    const Millis budget = Millis((report.sent + wait_s + 2) * 1000L);

    CommandResult result = m_runner.run(in_namespace(from.netns(), cmd), budget);
    report.evidence = result.output;

    const int received = parseReceived(result.output);
    report.received = received < 0 ? 0 : std::min(received, report.sent);

    LOG_DEBUG("Probe: " + from.label() + " -> " + target_ip + " " +
              std::to_string(report.received) + "/" + std::to_string(report.sent));
    return report;
}

} // namespace p2plink
