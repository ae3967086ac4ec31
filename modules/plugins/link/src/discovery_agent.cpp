#include "discovery_agent.h"
#include "link_errors.h"
#include "logger.h"
#include <fstream>
#include <sstream>

namespace p2plink {

std::string AgentConfig::render() const {
    std::ostringstream out;
    out << "ctrl_interface=" << ctrl_interface << "\n"
        << "ap_scan=1\n"
        << "device_name=" << device_name << "\n"
        << "device_type=" << device_type << "\n"
        << "p2p_go_intent=" << go_intent << "\n"
        << "p2p_go_ht40=" << (go_ht40 ? 1 : 0) << "\n";
    return out.str();
}

namespace {

std::string registry_key(const std::string& netns, const std::string& interface_name) {
    return netns + "/" + interface_name;
}

} // namespace

WpaSupplicantAgent::WpaSupplicantAgent(ICommandRunner& runner, Options options)
    : m_runner(runner), m_options(std::move(options)) {}

std::string WpaSupplicantAgent::configPathFor(const std::string& interface_name, const std::string& netns) const {
    const std::string prefix = netns.empty() ? "" : netns + "_";
    return m_options.config_dir + "/" + prefix + interface_name + "_wpa.conf";
}

std::string WpaSupplicantAgent::processPattern(const std::string& interface_name, const std::string& netns) const {
    // Bracket the first character so the pattern never matches the shell
    // that is running pgrep/pkill with this very string on its command line.
    std::string binary = m_options.binary;
    if (!binary.empty()) {
        binary = "[" + binary.substr(0, 1) + "]" + binary.substr(1);
    }
    // PIDs are not namespaced: two agents on the same interface name in
    // different namespaces are told apart by their config file only.
    return binary + ".*-i " + interface_name + " -c " + configPathFor(interface_name, netns) + " ";
}

void WpaSupplicantAgent::killInterface(const std::string& interface_name, const std::string& netns) {
    const std::string cmd = "pkill -f " + shell_quote(processPattern(interface_name, netns));
    CommandResult result = m_runner.run(in_namespace(netns, cmd), m_options.command_timeout);
    // pkill exits 1 when nothing matched; that is the normal "already stopped" case
    if (result.timed_out || (result.exit_code != 0 && result.exit_code != 1)) {
        LOG_WARN("Agent: stopping agent on " + interface_name + " reported: " + result.output);
    }
}

AgentHandle WpaSupplicantAgent::start(const Endpoint& endpoint, const AgentConfig& config) {
    std::lock_guard<std::mutex> lock(m_mutex);
    const std::string& iface = endpoint.interfaceName();
    const std::string key = registry_key(endpoint.netns(), iface);

    auto it = m_live.find(key);
    if (it != m_live.end()) {
        LOG_INFO("Agent: superseding agent #" + std::to_string(it->second) + " on " + endpoint.label());
        m_live.erase(it);
    }
    // Also catches instances left behind by an earlier run
    killInterface(iface, endpoint.netns());

    // /var/run is shared between namespaces; give each namespace its own socket directory
    AgentConfig effective = config;
    std::string ctrl_dir;
    if (!endpoint.netns().empty()) {
        ctrl_dir = config.ctrl_interface + "/" + endpoint.netns();
        effective.ctrl_interface = ctrl_dir;
    }

    const std::string config_path = configPathFor(iface, endpoint.netns());
    {
        std::ofstream config_file(config_path, std::ios::trunc);
        if (!config_file.is_open()) {
            throw AgentUnavailable("cannot write agent config " + config_path);
        }
        config_file << effective.render();
        if (!config_file) {
            throw AgentUnavailable("failed writing agent config " + config_path);
        }
    }

    const std::string cmd = m_options.binary + " -B -i " + iface + " -c " + shell_quote(config_path) +
                            " -D" + m_options.driver;
    CommandResult result = m_runner.run(in_namespace(endpoint.netns(), cmd), m_options.command_timeout);
    if (!result.ok()) {
        throw AgentUnavailable("agent launch failed on " + endpoint.label() + ": " + result.output);
    }

    AgentHandle handle;
    handle.interface_name = iface;
    handle.netns = endpoint.netns();
    handle.ctrl_dir = ctrl_dir;
    handle.generation = m_next_generation++;
    m_live[key] = handle.generation;

    LOG_INFO("Agent: started #" + std::to_string(handle.generation) + " on " + endpoint.label());
    return handle;
}

void WpaSupplicantAgent::stop(const AgentHandle& handle) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_live.find(registry_key(handle.netns, handle.interface_name));
    if (it == m_live.end() || it->second != handle.generation) {
        return;
    }
    m_live.erase(it);
    killInterface(handle.interface_name, handle.netns);
    LOG_INFO("Agent: stopped #" + std::to_string(handle.generation) + " on " + handle.interface_name);
}

void WpaSupplicantAgent::stopInterface(const Endpoint& endpoint) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_live.erase(registry_key(endpoint.netns(), endpoint.interfaceName()));
    killInterface(endpoint.interfaceName(), endpoint.netns());
}

bool WpaSupplicantAgent::isCurrent(const AgentHandle& handle) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_live.find(registry_key(handle.netns, handle.interface_name));
    return it != m_live.end() && it->second == handle.generation;
}

bool WpaSupplicantAgent::isAlive(const AgentHandle& handle) {
    if (!isCurrent(handle)) {
        return false;
    }
    const std::string cmd = "pgrep -f " + shell_quote(processPattern(handle.interface_name, handle.netns));
    CommandResult result = m_runner.run(in_namespace(handle.netns, cmd), m_options.command_timeout);
    return result.ok() && result.output.find_first_not_of(" \t\r\n") != std::string::npos;
}

std::string WpaSupplicantAgent::command(const AgentHandle& handle, const std::string& cmd) {
    if (!isCurrent(handle)) {
        throw AgentUnavailable("no running agent for " + handle.interface_name +
                               (handle.netns.empty() ? "" : "@" + handle.netns) +
                               " (handle #" + std::to_string(handle.generation) + ")");
    }
    std::string line = m_options.cli;
    if (!handle.ctrl_dir.empty()) {
        line += " -p " + shell_quote(handle.ctrl_dir);
    }
    line += " -i" + handle.interface_name + " " + cmd;
    CommandResult result = m_runner.run(in_namespace(handle.netns, line), m_options.command_timeout);
    if (!result.ok()) {
        // wpa_cli exits non-zero when it cannot reach the control socket
        throw AgentUnavailable("agent on " + handle.interface_name + " did not answer '" + cmd + "': " +
                               (result.timed_out ? std::string("timed out") : result.output));
    }
    LOG_DEBUG("Agent: " + handle.interface_name + " '" + cmd + "' -> " + result.output);
    return result.output;
}

size_t WpaSupplicantAgent::liveCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_live.size();
}

} // namespace p2plink
