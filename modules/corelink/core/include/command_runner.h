#ifndef P2PLINK_COMMAND_RUNNER_H
#define P2PLINK_COMMAND_RUNNER_H

#include <chrono>
#include <string>

namespace p2plink {

struct CommandResult {
    int exit_code = -1;
    bool timed_out = false;
    std::string output;   // stdout and stderr, interleaved

    bool ok() const { return exit_code == 0 && !timed_out; }
};

// Runs a shell command line and waits for it, never longer than `timeout`.
class ICommandRunner {
public:
    virtual ~ICommandRunner() = default;
    virtual CommandResult run(const std::string& command, std::chrono::milliseconds timeout) = 0;
};

// popen()-based runner. The command is wrapped in timeout(1) so a hung
// external tool cannot block the caller past its deadline.
class ShellCommandRunner : public ICommandRunner {
public:
    CommandResult run(const std::string& command, std::chrono::milliseconds timeout) override;
};

// Single-quote `value` for /bin/sh.
std::string shell_quote(const std::string& value);

// Prefix a command so it runs inside a network namespace (no-op for empty ns).
std::string in_namespace(const std::string& netns, const std::string& command);

} // namespace p2plink

#endif // P2PLINK_COMMAND_RUNNER_H
