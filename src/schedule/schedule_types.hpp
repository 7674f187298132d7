#pragma once

#include <optional>
#include <string>
#include <variant>

namespace cadence::schedule {

enum class CreatedBy {
    kUser,
    kAgent,
    kSystem
};

enum class ActionType {
    kCommand,
    kMessage
};

enum class ScheduleStatus {
    kActive,
    kPaused,
    kCompleted,
    kError
};

enum class IntervalUnit {
    kSeconds,
    kMinutes,
    kHours
};

// Fires once at an absolute instant, or at wall-clock time in timezone.
struct OnceSchedule {
    std::string at;
    std::string timezone;
};

struct CronSchedule {
    std::string cron;
    std::string timezone;
};

struct IntervalSchedule {
    double interval = 0;
    IntervalUnit unit = IntervalUnit::kMinutes;
};

// Fires after a uniformly drawn delay in [min_interval, max_interval].
struct RandomSchedule {
    double min_interval = 0;
    double max_interval = 0;
    IntervalUnit unit = IntervalUnit::kMinutes;
};

using ScheduleSpec = std::variant<OnceSchedule, CronSchedule, IntervalSchedule, RandomSchedule>;

struct RunResult {
    bool ok = false;
    std::string summary;
    std::string error;
};

struct ScheduleRecord {
    std::string id;
    long long created_at_ms = 0;
    long long updated_at_ms = 0;
    CreatedBy created_by = CreatedBy::kUser;
    std::optional<std::string> session_id;
    ActionType action_type = ActionType::kCommand;
    std::string command;
    std::optional<std::string> message;
    std::optional<std::string> description;
    ScheduleStatus status = ScheduleStatus::kActive;
    ScheduleSpec schedule;
    std::optional<long long> next_run_at_ms;
    std::optional<long long> last_run_at_ms;
    std::optional<RunResult> last_result;
};

inline bool operator==(const OnceSchedule& a, const OnceSchedule& b) {
    return a.at == b.at && a.timezone == b.timezone;
}

inline bool operator==(const CronSchedule& a, const CronSchedule& b) {
    return a.cron == b.cron && a.timezone == b.timezone;
}

inline bool operator==(const IntervalSchedule& a, const IntervalSchedule& b) {
    return a.interval == b.interval && a.unit == b.unit;
}

inline bool operator==(const RandomSchedule& a, const RandomSchedule& b) {
    return a.min_interval == b.min_interval && a.max_interval == b.max_interval && a.unit == b.unit;
}

inline bool operator==(const RunResult& a, const RunResult& b) {
    return a.ok == b.ok && a.summary == b.summary && a.error == b.error;
}

inline bool operator==(const ScheduleRecord& a, const ScheduleRecord& b) {
    return a.id == b.id &&
           a.created_at_ms == b.created_at_ms &&
           a.updated_at_ms == b.updated_at_ms &&
           a.created_by == b.created_by &&
           a.session_id == b.session_id &&
           a.action_type == b.action_type &&
           a.command == b.command &&
           a.message == b.message &&
           a.description == b.description &&
           a.status == b.status &&
           a.schedule == b.schedule &&
           a.next_run_at_ms == b.next_run_at_ms &&
           a.last_run_at_ms == b.last_run_at_ms &&
           a.last_result == b.last_result;
}

const char* ToString(CreatedBy value);
const char* ToString(ActionType value);
const char* ToString(ScheduleStatus value);
const char* ToString(IntervalUnit value);

std::optional<CreatedBy> CreatedByFromString(const std::string& value);
std::optional<ActionType> ActionTypeFromString(const std::string& value);
std::optional<ScheduleStatus> StatusFromString(const std::string& value);
std::optional<IntervalUnit> UnitFromString(const std::string& value);

// "once", "cron", "interval" or "random".
const char* KindName(const ScheduleSpec& spec);

long long UnitMultiplierMs(IntervalUnit unit);

// Ids become file names, so only [A-Za-z0-9_-]+ is accepted.
bool IsSafeId(const std::string& id);

}  // namespace cadence::schedule
