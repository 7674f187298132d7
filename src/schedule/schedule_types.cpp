#include "schedule/schedule_types.hpp"

#include <cctype>

namespace cadence::schedule {
namespace {

struct KindNameVisitor {
    const char* operator()(const OnceSchedule&) const { return "once"; }
    const char* operator()(const CronSchedule&) const { return "cron"; }
    const char* operator()(const IntervalSchedule&) const { return "interval"; }
    const char* operator()(const RandomSchedule&) const { return "random"; }
};

}  // namespace

const char* ToString(CreatedBy value) {
    switch (value) {
        case CreatedBy::kUser: return "user";
        case CreatedBy::kAgent: return "agent";
        case CreatedBy::kSystem: return "system";
    }
    return "user";
}

const char* ToString(ActionType value) {
    switch (value) {
        case ActionType::kCommand: return "command";
        case ActionType::kMessage: return "message";
    }
    return "command";
}

const char* ToString(ScheduleStatus value) {
    switch (value) {
        case ScheduleStatus::kActive: return "active";
        case ScheduleStatus::kPaused: return "paused";
        case ScheduleStatus::kCompleted: return "completed";
        case ScheduleStatus::kError: return "error";
    }
    return "active";
}

const char* ToString(IntervalUnit value) {
    switch (value) {
        case IntervalUnit::kSeconds: return "seconds";
        case IntervalUnit::kMinutes: return "minutes";
        case IntervalUnit::kHours: return "hours";
    }
    return "minutes";
}

std::optional<CreatedBy> CreatedByFromString(const std::string& value) {
    if (value == "user") {
        return CreatedBy::kUser;
    }
    if (value == "agent") {
        return CreatedBy::kAgent;
    }
    if (value == "system") {
        return CreatedBy::kSystem;
    }
    return std::nullopt;
}

std::optional<ActionType> ActionTypeFromString(const std::string& value) {
    if (value == "command") {
        return ActionType::kCommand;
    }
    if (value == "message") {
        return ActionType::kMessage;
    }
    return std::nullopt;
}

std::optional<ScheduleStatus> StatusFromString(const std::string& value) {
    if (value == "active") {
        return ScheduleStatus::kActive;
    }
    if (value == "paused") {
        return ScheduleStatus::kPaused;
    }
    if (value == "completed") {
        return ScheduleStatus::kCompleted;
    }
    if (value == "error") {
        return ScheduleStatus::kError;
    }
    return std::nullopt;
}

std::optional<IntervalUnit> UnitFromString(const std::string& value) {
    if (value == "seconds") {
        return IntervalUnit::kSeconds;
    }
    if (value == "minutes") {
        return IntervalUnit::kMinutes;
    }
    if (value == "hours") {
        return IntervalUnit::kHours;
    }
    return std::nullopt;
}

const char* KindName(const ScheduleSpec& spec) {
    return std::visit(KindNameVisitor{}, spec);
}

long long UnitMultiplierMs(IntervalUnit unit) {
    switch (unit) {
        case IntervalUnit::kSeconds: return 1000LL;
        case IntervalUnit::kMinutes: return 60LL * 1000LL;
        case IntervalUnit::kHours: return 60LL * 60LL * 1000LL;
    }
    return 60LL * 1000LL;
}

bool IsSafeId(const std::string& id) {
    if (id.empty()) {
        return false;
    }
    for (const char c : id) {
        const auto uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '-' && c != '_') {
            return false;
        }
    }
    return true;
}

}  // namespace cadence::schedule
