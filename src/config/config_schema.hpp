#pragma once

#include <string>

namespace cadence::config {

struct SchedulerConfig {
    bool enabled = true;
    // Directory holding schedules/ and schedules/locks/.
    std::string root = ".cadence";
    int tick_interval_ms = 30 * 1000;
    long long lock_ttl_ms = 10 * 60 * 1000;
    // Empty means <hostname>-<pid>.
    std::string owner_id;
    std::string session_id;
    bool claim_global = false;
    int command_timeout_s = 5 * 60;
};

struct LoggingConfig {
    std::string level = "info";
};

struct Config {
    SchedulerConfig scheduler;
    LoggingConfig logging;
};

}  // namespace cadence::config
