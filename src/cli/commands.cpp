#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>
#include <unistd.h>
#include <unordered_map>

#include "config/config_loader.hpp"
#include "heartbeat/schedule_poller.hpp"
#include "sandbox/command_runner.hpp"
#include "schedule/schedule_store.hpp"
#include "tools/schedule_tool.hpp"
#include "utils/logging.hpp"

namespace {

std::atomic<bool> g_running{true};
volatile std::sig_atomic_t g_signal = 0;

void HandleSignal(int signal) {
    g_signal = signal;
}

std::string DefaultOwnerId() {
    char host[256] = {0};
    if (::gethostname(host, sizeof(host) - 1) != 0 || host[0] == '\0') {
        return "cadence-" + std::to_string(::getpid());
    }
    return std::string(host) + "-" + std::to_string(::getpid());
}

void PrintUsage() {
    std::cout << "Usage: cadence schedule <create|list|get|delete|pause|resume|run> [--key value]...\n"
              << "       cadence daemon" << std::endl;
}

cadence::heartbeat::SchedulePoller::Options BuildPollerOptions(const cadence::config::Config& config) {
    cadence::heartbeat::SchedulePoller::Options options;
    options.owner_id = config.scheduler.owner_id.empty() ? DefaultOwnerId() : config.scheduler.owner_id;
    if (!config.scheduler.session_id.empty()) {
        options.session_id = config.scheduler.session_id;
    }
    options.claim_global = config.scheduler.claim_global;
    options.tick_interval = std::chrono::milliseconds(config.scheduler.tick_interval_ms);
    options.lock_ttl_ms = config.scheduler.lock_ttl_ms;
    return options;
}

cadence::heartbeat::SchedulePoller::ActionHandler BuildActionHandler(const cadence::config::Config& config) {
    const auto timeout = std::chrono::seconds(config.scheduler.command_timeout_s);
    const std::filesystem::path working_dir = std::filesystem::current_path();
    return [timeout, working_dir](const cadence::schedule::ScheduleRecord& record) {
        cadence::schedule::RunResult result;
        if (record.action_type == cadence::schedule::ActionType::kMessage) {
            const auto text = record.message.has_value() && !record.message->empty() ? *record.message
                                                                                    : record.command;
            cadence::utils::Log(cadence::utils::LogLevel::kInfo, "schedule", record.id + ": " + text);
            result.ok = true;
            result.summary = text;
            return result;
        }

        const auto exec = cadence::sandbox::CommandRunner::Run(record.command, working_dir, timeout);
        result.ok = exec.exit_code == 0 && !exec.timed_out;
        result.summary = exec.output;
        if (exec.timed_out) {
            result.error = "timed out after " + std::to_string(timeout.count()) + "s";
        } else if (!result.ok) {
            result.error = exec.error.empty() ? "exit code " + std::to_string(exec.exit_code) : exec.error;
        }
        return result;
    };
}

int RunSchedule(int argc, char** argv) {
    if (argc < 3) {
        PrintUsage();
        return 1;
    }
    std::unordered_map<std::string, std::string> params;
    params["action"] = argv[2];
    for (int i = 3; i < argc; ++i) {
        std::string key = argv[i];
        if (key.rfind("--", 0) != 0) {
            std::cout << "Unexpected argument: " << key << std::endl;
            return 1;
        }
        key = key.substr(2);
        for (auto& ch : key) {
            if (ch == '-') {
                ch = '_';
            }
        }
        if (i + 1 >= argc) {
            std::cout << "Missing value for --" << key << std::endl;
            return 1;
        }
        params[key] = argv[++i];
    }

    const auto config = cadence::config::LoadConfig();
    cadence::utils::ConfigureLogging({cadence::utils::ParseLogLevel(config.logging.level)});

    cadence::schedule::ScheduleStore store(config.scheduler.root);
    cadence::heartbeat::SchedulePoller poller(store, BuildActionHandler(config), BuildPollerOptions(config));
    cadence::tools::ScheduleTool tool(&store, &poller);

    const auto output = tool.Execute(params);
    std::cout << output << std::endl;
    return output.rfind("Error:", 0) == 0 ? 1 : 0;
}

int RunDaemon() {
    const auto config = cadence::config::LoadConfig();
    cadence::utils::ConfigureLogging({cadence::utils::ParseLogLevel(config.logging.level)});
    if (!config.scheduler.enabled) {
        std::cout << "cadence scheduler disabled by configuration." << std::endl;
        return 0;
    }

    cadence::schedule::ScheduleStore store(config.scheduler.root);
    const auto options = BuildPollerOptions(config);
    cadence::heartbeat::SchedulePoller poller(store, BuildActionHandler(config), options);

    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    poller.Start();
    cadence::utils::Log(cadence::utils::LogLevel::kInfo, "daemon",
                        "started as " + options.owner_id + " on " + store.SchedulesDir().string());
    std::cout << "cadence daemon started. Press Ctrl+C to stop." << std::endl;

    bool shutdown_guard_started = false;
    while (g_running.load()) {
        if (g_signal != 0) {
            g_running.store(false);
            if (!shutdown_guard_started) {
                shutdown_guard_started = true;
                std::thread([] {
                    std::this_thread::sleep_for(std::chrono::seconds(5));
                    std::_Exit(130);
                }).detach();
            }
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    poller.Stop();
    cadence::utils::Log(cadence::utils::LogLevel::kInfo, "daemon", "stopped");
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc >= 2 && std::string(argv[1]) == "daemon") {
        return RunDaemon();
    }
    if (argc >= 2 && std::string(argv[1]) == "schedule") {
        return RunSchedule(argc, argv);
    }
    PrintUsage();
    return 1;
}
