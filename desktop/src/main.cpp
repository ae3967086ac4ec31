#include "session_orchestrator.h"
#include "session_report.h"
#include "interface_controller.h"
#include "discovery_agent.h"
#include "reachability_probe.h"
#include "command_runner.h"
#include "config_manager.h"
#include "logger.h"
#include <iostream>
#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <stdexcept>
#include <signal.h>

using namespace p2plink;

namespace {

CancellationToken g_cancel;

void on_interrupt(int) {
    g_cancel.cancel();
}

struct CliOptions {
    std::string config_path = "config.json";
    std::string log_level;
    std::vector<std::string> initiators;
    std::vector<std::string> responders;
    bool json_output = false;
    bool diagnostics = true;
    int discovery_window_ms = -1;
    int connect_deadline_ms = -1;
};

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " --initiator SPEC --responder SPEC [--responder SPEC ...] [OPTIONS]\n\n"
              << "Endpoint SPEC: name:iface:mac:ip[:netns]\n"
              << "  e.g. sta1:sta1-wlan0:02:00:00:00:00:00:10.0.0.1\n\n"
              << "Options:\n"
              << "  --config FILE              Path to configuration file (default: config.json)\n"
              << "  --log-level LVL            debug|info|warning|error|none (default: from config)\n"
              << "  --discovery-window-ms MS   Override the peer scan window\n"
              << "  --connect-deadline-ms MS   Override the connection wait deadline\n"
              << "  --json                     Print each session outcome as JSON\n"
              << "  --no-diagnostics           Skip the post-session interface/agent dump\n"
              << "  --help                     Show this help message\n"
              << "\nSeveral --responder options pair the initiator with each in turn.\n"
              << "Ctrl-C cancels the running session at the next phase boundary.\n"
              << std::endl;
}

int parse_int(const std::string& name, const std::string& value) {
    try {
        size_t used = 0;
        int v = std::stoi(value, &used);
        if (used != value.size() || v < 0) {
            throw std::invalid_argument(value);
        }
        return v;
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + name + ": " + value);
    }
}

CliOptions parse_args(int argc, char* argv[]) {
    CliOptions opts;
    auto need = [&](int& i, const std::string& name) -> std::string {
        if (i + 1 >= argc) throw std::runtime_error("Missing value for " + name);
        return argv[++i];
    };

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config") opts.config_path = need(i, arg);
        else if (arg == "--log-level") opts.log_level = need(i, arg);
        else if (arg == "--initiator") opts.initiators.push_back(need(i, arg));
        else if (arg == "--responder") opts.responders.push_back(need(i, arg));
        else if (arg == "--discovery-window-ms") opts.discovery_window_ms = parse_int(arg, need(i, arg));
        else if (arg == "--connect-deadline-ms") opts.connect_deadline_ms = parse_int(arg, need(i, arg));
        else if (arg == "--json") opts.json_output = true;
        else if (arg == "--no-diagnostics") opts.diagnostics = false;
        else throw std::runtime_error("Unknown option: " + arg);
    }

    if (opts.initiators.size() != 1) throw std::runtime_error("exactly one --initiator is required");
    if (opts.responders.empty()) throw std::runtime_error("at least one --responder is required");
    return opts;
}

bool load_config(const std::string& config_path, const char* argv0) {
    std::vector<std::string> candidates;
    candidates.push_back(config_path);
    try {
        std::filesystem::path exe_dir = std::filesystem::absolute(argv0).parent_path();
        candidates.push_back((exe_dir / "config.json").string());
        candidates.push_back((exe_dir / "../config.json").lexically_normal().string());
    } catch (const std::filesystem::filesystem_error&) {
        // argv[0] not resolvable; the explicit path is still tried
    }

    for (const auto& c : candidates) {
        if (std::filesystem::exists(c) && ConfigManager::getInstance().loadConfig(c)) {
            return true;
        }
    }
    std::cerr << "Error: failed to load configuration. Tried paths:" << std::endl;
    for (const auto& c : candidates) {
        std::cerr << "  - " << c << std::endl;
    }
    return false;
}

} // namespace

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        }
    }

    CliOptions cli;
    std::optional<Endpoint> initiator;
    std::vector<Endpoint> responders;
    try {
        cli = parse_args(argc, argv);
        initiator = Endpoint::parse(cli.initiators.front());
        for (const auto& spec : cli.responders) {
            responders.push_back(Endpoint::parse(spec));
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        print_usage(argv[0]);
        return 2;
    }

    if (!load_config(cli.config_path, argv[0])) {
        return 2;
    }
    ConfigManager& config = ConfigManager::getInstance();
    if (cli.discovery_window_ms >= 0) {
        config.setValueAtPath({"discovery", "window_ms"}, cli.discovery_window_ms);
    }
    if (cli.connect_deadline_ms >= 0) {
        config.setValueAtPath({"negotiation", "connect_deadline_ms"}, cli.connect_deadline_ms);
    }
    if (!cli.diagnostics) {
        config.setValueAtPath({"diagnostics", "collect"}, false);
    }

    LogLevel level = log_level_from_string(cli.log_level.empty() ? config.getLogLevel() : cli.log_level);
    if (!config.isConsoleOutput() && cli.log_level.empty()) {
        level = LogLevel::NONE;
    }
    set_log_level(level);
    if (config.isAsyncLogging()) {
        enable_async_logging();
    }

    signal(SIGINT, on_interrupt);
    signal(SIGTERM, on_interrupt);

    ShellCommandRunner runner;
    SteadyClock clock;
    IwInterfaceController interfaces(runner, Millis(config.getInterfaceCommandTimeoutMs()));

    WpaSupplicantAgent::Options agent_options;
    agent_options.binary = config.getAgentBinary();
    agent_options.cli = config.getAgentCliBinary();
    agent_options.driver = config.getAgentDriver();
    agent_options.config_dir = config.getAgentConfigDir();
    agent_options.command_timeout = Millis(config.getAgentCommandTimeoutMs());
    WpaSupplicantAgent agent(runner, agent_options);

    PingProbe probe(runner);

    SessionOrchestrator orchestrator(PairingDependencies{interfaces, agent, probe, clock},
                                     PairingOptions::fromConfig(config));

    int exit_code = 0;
    for (const auto& responder : responders) {
        if (g_cancel.isCancelled()) {
            exit_code = 1;
            break;
        }
        setSessionId(generate_session_id(8));

        SessionOutcome outcome;
        try {
            outcome = orchestrator.run(*initiator, responder, &g_cancel);
        } catch (const std::invalid_argument& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            exit_code = 2;
            continue;
        }

        if (cli.json_output) {
            std::cout << outcome_to_json(outcome).dump(2) << std::endl;
        } else {
            std::cout << outcome.initiator << " <-> " << outcome.responder << ": "
                      << outcome_summary(outcome) << std::endl;
        }
        if (!outcome.verified() && exit_code == 0) {
            exit_code = 1;
        }
    }

    disable_async_logging();
    return exit_code;
}
