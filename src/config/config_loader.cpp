#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>

#include "nlohmann/json.hpp"
#include "utils/logging.hpp"

namespace cadence::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("scheduler") && data["scheduler"].is_object()) {
        const auto& scheduler = data["scheduler"];
        if (scheduler.contains("enabled") && scheduler["enabled"].is_boolean()) {
            config.scheduler.enabled = scheduler["enabled"].get<bool>();
        }
        if (scheduler.contains("root") && scheduler["root"].is_string()) {
            config.scheduler.root = scheduler["root"].get<std::string>();
        }
        if (scheduler.contains("tickIntervalMs") && scheduler["tickIntervalMs"].is_number_integer()) {
            config.scheduler.tick_interval_ms = scheduler["tickIntervalMs"].get<int>();
        }
        if (scheduler.contains("lockTtlMs") && scheduler["lockTtlMs"].is_number_integer()) {
            config.scheduler.lock_ttl_ms = scheduler["lockTtlMs"].get<long long>();
        }
        if (scheduler.contains("ownerId") && scheduler["ownerId"].is_string()) {
            config.scheduler.owner_id = scheduler["ownerId"].get<std::string>();
        }
        if (scheduler.contains("sessionId") && scheduler["sessionId"].is_string()) {
            config.scheduler.session_id = scheduler["sessionId"].get<std::string>();
        }
        if (scheduler.contains("claimGlobal") && scheduler["claimGlobal"].is_boolean()) {
            config.scheduler.claim_global = scheduler["claimGlobal"].get<bool>();
        }
        if (scheduler.contains("commandTimeoutS") && scheduler["commandTimeoutS"].is_number_integer()) {
            config.scheduler.command_timeout_s = scheduler["commandTimeoutS"].get<int>();
        }
    }

    if (data.contains("logging") && data["logging"].is_object()) {
        const auto& logging = data["logging"];
        if (logging.contains("level") && logging["level"].is_string()) {
            config.logging.level = logging["level"].get<std::string>();
        }
    }
}

bool ParseBool(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

long long ParseLongLong(const std::string& value, long long fallback) {
    try {
        return std::stoll(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

void ApplyEnvironment(Config& config) {
    const auto root = GetEnvFallback("CADENCE_SCHEDULER__ROOT", "CADENCE_ROOT");
    if (!root.empty()) {
        config.scheduler.root = root;
    }

    const auto enabled = GetEnv("CADENCE_SCHEDULER__ENABLED");
    if (!enabled.empty()) {
        config.scheduler.enabled = ParseBool(enabled);
    }

    const auto tick = GetEnv("CADENCE_SCHEDULER__TICK_INTERVAL_MS");
    if (!tick.empty()) {
        config.scheduler.tick_interval_ms = ParseInt(tick, config.scheduler.tick_interval_ms);
    }

    const auto ttl = GetEnv("CADENCE_SCHEDULER__LOCK_TTL_MS");
    if (!ttl.empty()) {
        config.scheduler.lock_ttl_ms = ParseLongLong(ttl, config.scheduler.lock_ttl_ms);
    }

    const auto owner = GetEnv("CADENCE_SCHEDULER__OWNER_ID");
    if (!owner.empty()) {
        config.scheduler.owner_id = owner;
    }

    const auto session = GetEnv("CADENCE_SCHEDULER__SESSION_ID");
    if (!session.empty()) {
        config.scheduler.session_id = session;
    }

    const auto claim_global = GetEnv("CADENCE_SCHEDULER__CLAIM_GLOBAL");
    if (!claim_global.empty()) {
        config.scheduler.claim_global = ParseBool(claim_global);
    }

    const auto timeout = GetEnv("CADENCE_SCHEDULER__COMMAND_TIMEOUT_S");
    if (!timeout.empty()) {
        config.scheduler.command_timeout_s = ParseInt(timeout, config.scheduler.command_timeout_s);
    }

    const auto level = GetEnvFallback("CADENCE_LOGGING__LEVEL", "CADENCE_LOG_LEVEL");
    if (!level.empty()) {
        config.logging.level = level;
    }
}

}  // namespace

std::filesystem::path DefaultConfigPath() {
    return GetHomePath() / ".cadence" / "config.json";
}

Config LoadConfig(const std::filesystem::path& config_path) {
    Config config{};

    std::error_code ec;
    if (!config_path.empty() && std::filesystem::exists(config_path, ec)) {
        std::ifstream input(config_path);
        const auto data = nlohmann::json::parse(input, nullptr, false);
        if (data.is_discarded()) {
            utils::Log(utils::LogLevel::kWarn, "config", "ignoring unparsable " + config_path.string());
        } else {
            ApplyConfigFromJson(config, data);
        }
    }

    ApplyEnvironment(config);
    return config;
}

Config LoadConfig() {
    return LoadConfig(DefaultConfigPath());
}

}  // namespace cadence::config
