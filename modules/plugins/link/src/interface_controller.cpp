#include "interface_controller.h"
#include "link_errors.h"
#include "logger.h"

namespace p2plink {

IwInterfaceController::IwInterfaceController(ICommandRunner& runner, Millis command_timeout)
    : m_runner(runner), m_command_timeout(command_timeout) {}

void IwInterfaceController::bringUp(const Endpoint& endpoint) {
    runChecked(endpoint, "ip link set " + shell_quote(endpoint.interfaceName()) + " up", "bring up");
    LOG_INFO("Link: " + endpoint.label() + " is up");
}

void IwInterfaceController::bringDown(const Endpoint& endpoint) {
    runChecked(endpoint, "ip link set " + shell_quote(endpoint.interfaceName()) + " down", "bring down");
}

std::string IwInterfaceController::status(const Endpoint& endpoint) {
    return runAdvisory(endpoint, "ip link show " + shell_quote(endpoint.interfaceName()));
}

std::string IwInterfaceController::addresses(const Endpoint& endpoint) {
    return runAdvisory(endpoint, "ip addr show " + shell_quote(endpoint.interfaceName()));
}

void IwInterfaceController::setAdHocMode(const Endpoint& endpoint) {
    runChecked(endpoint, "iwconfig " + shell_quote(endpoint.interfaceName()) + " mode ad-hoc", "set ad-hoc mode");
}

void IwInterfaceController::setSharedChannel(const Endpoint& endpoint, int channel, const std::string& network_name) {
    runChecked(endpoint,
               "iwconfig " + shell_quote(endpoint.interfaceName()) +
               " essid " + shell_quote(network_name) +
               " channel " + std::to_string(channel),
               "set essid/channel");
}

void IwInterfaceController::runChecked(const Endpoint& endpoint, const std::string& command, const std::string& what) {
    CommandResult result = m_runner.run(in_namespace(endpoint.netns(), command), m_command_timeout);
    if (!result.ok()) {
        std::string reason = result.timed_out ? "timed out" : "exit " + std::to_string(result.exit_code);
        throw InterfaceError("failed to " + what + " on " + endpoint.label() + " (" + reason + "): " + result.output);
    }
}

std::string IwInterfaceController::runAdvisory(const Endpoint& endpoint, const std::string& command) {
    CommandResult result = m_runner.run(in_namespace(endpoint.netns(), command), m_command_timeout);
    if (!result.ok()) {
        LOG_WARN("Link: '" + command + "' failed on " + endpoint.label() + ": " + result.output);
        return "";
    }
    return result.output;
}

} // namespace p2plink
