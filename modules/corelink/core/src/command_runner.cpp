#include "command_runner.h"
#include "logger.h"
#include <array>
#include <cstdio>
#include <memory>
#include <sstream>
#include <iomanip>
#include <csignal>
#include <sys/wait.h>

namespace p2plink {

namespace {

// Exit status timeout(1) reports when it had to kill the command.
constexpr int kTimeoutExitCode = 124;

std::string format_seconds(std::chrono::milliseconds timeout) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(3) << (static_cast<double>(timeout.count()) / 1000.0);
    return out.str();
}

} // namespace

std::string shell_quote(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::string in_namespace(const std::string& netns, const std::string& command) {
    if (netns.empty()) {
        return command;
    }
    return "ip netns exec " + shell_quote(netns) + " sh -c " + shell_quote(command);
}

CommandResult ShellCommandRunner::run(const std::string& command, std::chrono::milliseconds timeout) {
    CommandResult result;
    if (timeout.count() <= 0) {
        timeout = std::chrono::milliseconds(1);
    }

    // -k: escalate to SIGKILL if the command ignores SIGTERM
    const std::string wrapped = "timeout -k 1 " + format_seconds(timeout) + " sh -c " +
                                shell_quote(command) + " 2>&1";
    LOG_DEBUG("Exec: " + command);

    std::unique_ptr<FILE, decltype(&pclose)> pipe(popen(wrapped.c_str(), "r"), pclose);
    if (!pipe) {
        LOG_ERROR("Exec: popen failed for: " + command);
        return result;
    }

    std::array<char, 256> buffer;
    std::string output;
    while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe.get()) != nullptr) {
        output += buffer.data();
    }

    // Close explicitly; the deleter would discard the exit status
    const int status = pclose(pipe.release());
    result.output = std::move(output);
    if (status == -1) {
        LOG_ERROR("Exec: pclose failed for: " + command);
        return result;
    }
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
        result.timed_out = (result.exit_code == kTimeoutExitCode);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
        result.timed_out = (WTERMSIG(status) == SIGKILL);
    }

    if (result.timed_out) {
        LOG_WARN("Exec: timed out after " + std::to_string(timeout.count()) + "ms: " + command);
    }
    return result;
}

} // namespace p2plink
