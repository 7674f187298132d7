#include "tools/schedule_tool.hpp"

#include <algorithm>
#include <exception>
#include <optional>
#include <random>
#include <sstream>
#include <vector>

#include "cron/time_zone.hpp"
#include "nlohmann/json.hpp"
#include "schedule/next_run.hpp"
#include "schedule/schedule_json.hpp"
#include "utils/common.hpp"

namespace cadence::tools {
namespace {

using schedule::ScheduleRecord;
using schedule::ScheduleStatus;

std::string GetParam(const std::unordered_map<std::string, std::string>& params,
                     const std::string& name) {
    auto it = params.find(name);
    if (it == params.end()) {
        return {};
    }
    return it->second;
}

std::string GetParamAlias(const std::unordered_map<std::string, std::string>& params,
                          const std::string& primary,
                          const std::string& fallback) {
    auto value = GetParam(params, primary);
    if (!value.empty()) {
        return value;
    }
    return GetParam(params, fallback);
}

std::optional<double> ParseNumber(const std::string& value) {
    if (value.empty()) {
        return std::nullopt;
    }
    try {
        std::size_t consumed = 0;
        const double parsed = std::stod(value, &consumed);
        if (consumed != value.size()) {
            return std::nullopt;
        }
        return parsed;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

bool ParseBool(const std::string& value, bool fallback = false) {
    if (value.empty()) {
        return fallback;
    }
    const auto lowered = utils::ToLower(value);
    return lowered == "true" || lowered == "1" || lowered == "yes" || lowered == "y";
}

std::string GenerateId() {
    static const char* kChars = "0123456789abcdef";
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<int> dist(0, 15);
    std::string id;
    id.reserve(12);
    for (int i = 0; i < 12; ++i) {
        id.push_back(kChars[dist(gen)]);
    }
    return id;
}

std::string FormatAmount(double value) {
    std::ostringstream out;
    out << value;
    return out.str();
}

std::string DescribeSpec(const schedule::ScheduleSpec& spec) {
    if (const auto* interval = std::get_if<schedule::IntervalSchedule>(&spec)) {
        return " (every " + FormatAmount(interval->interval) + " " + schedule::ToString(interval->unit) + ")";
    }
    if (const auto* random = std::get_if<schedule::RandomSchedule>(&spec)) {
        return " (random: " + FormatAmount(random->min_interval) + "-" + FormatAmount(random->max_interval) +
               " " + schedule::ToString(random->unit) + ")";
    }
    if (const auto* cron = std::get_if<schedule::CronSchedule>(&spec)) {
        return " (cron: " + cron->cron + ")";
    }
    return {};
}

}  // namespace

ScheduleTool::ScheduleTool(schedule::ScheduleStore* store, heartbeat::SchedulePoller* poller)
    : store_(store), poller_(poller) {}

std::string ScheduleTool::ParametersJson() const {
    return R"({"type":"object","properties":{"action":{"type":"string","enum":["create","list","get","delete","pause","resume","run"]},"id":{"type":"string"},"command":{"type":"string"},"at":{"type":"string","description":"ISO 8601 timestamp for a one-time schedule"},"cron":{"type":"string","description":"5-field cron expression"},"every":{"type":"number","description":"fixed interval, minimum 1 second"},"min_interval":{"type":"number"},"max_interval":{"type":"number"},"unit":{"type":"string","enum":["seconds","minutes","hours"]},"timezone":{"type":"string","description":"IANA timezone name"},"description":{"type":"string"},"action_type":{"type":"string","enum":["command","message"]},"message":{"type":"string"},"session_id":{"type":"string"},"created_by":{"type":"string","enum":["user","agent","system"]},"all":{"type":"boolean"}},"required":["action"]})";
}

std::string ScheduleTool::Execute(const std::unordered_map<std::string, std::string>& params) {
    if (!store_) {
        return "Error: schedule store not configured";
    }
    const auto action = utils::ToLower(GetParam(params, "action"));
    if (action.empty()) {
        return "Error: action is required.";
    }

    try {
        if (action == "create") {
            return Create(params);
        }
        if (action == "list") {
            return List(params);
        }

        const auto id = utils::Trim(GetParam(params, "id"));
        if (action == "get" || action == "delete" || action == "pause" || action == "resume" || action == "run") {
            if (id.empty()) {
                return "Error: id is required.";
            }
        }
        if (action == "get") {
            return Get(id);
        }
        if (action == "delete") {
            return Delete(id);
        }
        if (action == "pause" || action == "resume") {
            return SetPaused(id, action == "pause");
        }
        if (action == "run") {
            return Run(id);
        }
    } catch (const std::exception& ex) {
        return std::string("Error: ") + ex.what();
    }
    return "Error: unknown action \"" + action + "\".";
}

std::string ScheduleTool::Create(const Params& params) {
    const auto command = utils::Trim(GetParam(params, "command"));
    if (command.empty()) {
        return "Error: command is required.";
    }
    const auto at = utils::Trim(GetParam(params, "at"));
    const auto cron = utils::Trim(GetParam(params, "cron"));
    const auto every_raw = GetParamAlias(params, "every", "interval");
    const auto min_raw = GetParamAlias(params, "min_interval", "minInterval");
    const auto max_raw = GetParamAlias(params, "max_interval", "maxInterval");

    const bool has_interval = !every_raw.empty();
    const bool has_random = !min_raw.empty() && !max_raw.empty();
    if (at.empty() && cron.empty() && !has_interval && !has_random) {
        return "Error: provide at (ISO time), cron, every (fixed interval), or min_interval+max_interval "
               "for random scheduling.";
    }

    const auto unit_raw = GetParam(params, "unit");
    const auto unit = unit_raw.empty() ? std::optional<schedule::IntervalUnit>(schedule::IntervalUnit::kMinutes)
                                       : schedule::UnitFromString(utils::ToLower(unit_raw));
    if ((has_interval || has_random) && !unit.has_value()) {
        return "Error: unit must be seconds, minutes or hours.";
    }
    const auto time_zone = utils::Trim(GetParam(params, "timezone"));

    ScheduleRecord record;
    if (has_interval) {
        const auto every = ParseNumber(every_raw);
        if (!every.has_value()) {
            return "Error: every must be a number.";
        }
        schedule::IntervalSchedule spec;
        spec.interval = every.value();
        spec.unit = unit.value();
        record.schedule = spec;
    } else if (has_random) {
        const auto min_interval = ParseNumber(min_raw);
        const auto max_interval = ParseNumber(max_raw);
        if (!min_interval.has_value() || !max_interval.has_value()) {
            return "Error: min_interval and max_interval must be numbers.";
        }
        schedule::RandomSchedule spec;
        spec.min_interval = min_interval.value();
        spec.max_interval = max_interval.value();
        spec.unit = unit.value();
        record.schedule = spec;
    } else if (!cron.empty()) {
        record.schedule = schedule::CronSchedule{cron, time_zone};
    } else {
        record.schedule = schedule::OnceSchedule{at, time_zone};
    }

    const auto action_type_raw = GetParamAlias(params, "action_type", "actionType");
    const auto action_type = action_type_raw.empty()
        ? std::optional<schedule::ActionType>(schedule::ActionType::kCommand)
        : schedule::ActionTypeFromString(utils::ToLower(action_type_raw));
    if (!action_type.has_value()) {
        return "Error: action_type must be command or message.";
    }
    const auto created_by_raw = GetParamAlias(params, "created_by", "createdBy");
    const auto created_by = created_by_raw.empty()
        ? std::optional<schedule::CreatedBy>(schedule::CreatedBy::kUser)
        : schedule::CreatedByFromString(utils::ToLower(created_by_raw));
    if (!created_by.has_value()) {
        return "Error: created_by must be user, agent or system.";
    }

    const auto now = store_->Now();
    const auto requested_id = utils::Trim(GetParam(params, "id"));
    record.id = requested_id.empty() ? GenerateId() : requested_id;
    record.created_at_ms = now;
    record.updated_at_ms = now;
    record.created_by = created_by.value();
    const auto session_id = GetParamAlias(params, "session_id", "sessionId");
    if (!session_id.empty()) {
        record.session_id = session_id;
    }
    record.action_type = action_type.value();
    record.command = command;
    if (record.action_type == schedule::ActionType::kMessage) {
        const auto message = GetParam(params, "message");
        if (!message.empty()) {
            record.message = message;
        }
    }
    const auto description = GetParam(params, "description");
    if (!description.empty()) {
        record.description = description;
    }
    record.status = ScheduleStatus::kActive;

    if (const auto error = schedule::ValidateSchedule(record)) {
        return "Error: " + *error;
    }
    record.next_run_at_ms = schedule::ComputeNextRun(record, now);
    if (!record.next_run_at_ms.has_value()) {
        return "Error: unable to compute next run for schedule.";
    }
    if (store_->Get(record.id).has_value()) {
        return "Error: schedule " + record.id + " already exists.";
    }
    store_->Save(record);

    const auto next = cron::FormatIsoUtc(*record.next_run_at_ms);
    if (const auto* interval = std::get_if<schedule::IntervalSchedule>(&record.schedule)) {
        return "Scheduled " + record.command + " (" + record.id + ") every " + FormatAmount(interval->interval) +
               " " + schedule::ToString(interval->unit) + ", next run: " + next;
    }
    if (const auto* random = std::get_if<schedule::RandomSchedule>(&record.schedule)) {
        return "Scheduled " + record.command + " (" + record.id + ") randomly every " +
               FormatAmount(random->min_interval) + "-" + FormatAmount(random->max_interval) + " " +
               schedule::ToString(random->unit) + ", next run: " + next;
    }
    return "Scheduled " + record.command + " (" + record.id + ") for " + next;
}

std::string ScheduleTool::List(const Params& params) {
    schedule::ScheduleStore::ListOptions options;
    const auto session_id = GetParamAlias(params, "session_id", "sessionId");
    if (!session_id.empty()) {
        options.session_id = session_id;
    }
    options.all = ParseBool(GetParam(params, "all"), false);

    auto records = store_->List(options);
    if (records.empty()) {
        return "No schedules found.";
    }
    std::stable_sort(records.begin(), records.end(), [](const ScheduleRecord& a, const ScheduleRecord& b) {
        return a.next_run_at_ms.value_or(0) < b.next_run_at_ms.value_or(0);
    });

    std::vector<std::string> rows;
    rows.reserve(records.size());
    for (const auto& record : records) {
        const auto next = record.next_run_at_ms.has_value() ? cron::FormatIsoUtc(*record.next_run_at_ms)
                                                            : std::string("n/a");
        rows.push_back("- " + record.id + " [" + schedule::ToString(record.status) + "] " + record.command +
                       DescribeSpec(record.schedule) + " (next: " + next + ")");
    }
    return utils::Join(rows, "\n");
}

std::string ScheduleTool::Get(const std::string& id) {
    const auto record = store_->Get(id);
    if (!record.has_value()) {
        return "Schedule " + id + " not found.";
    }
    return schedule::ToJson(*record).dump(2);
}

std::string ScheduleTool::Delete(const std::string& id) {
    const bool ok = store_->Delete(id);
    return ok ? "Deleted schedule " + id + "." : "Schedule " + id + " not found.";
}

std::string ScheduleTool::SetPaused(const std::string& id, bool paused) {
    std::optional<long long> next_run;
    if (!paused) {
        const auto current = store_->Get(id);
        if (!current.has_value()) {
            return "Schedule " + id + " not found.";
        }
        next_run = schedule::ComputeNextRun(*current, store_->Now());
        if (!next_run.has_value()) {
            return "Error: unable to compute next run for schedule " + id + ".";
        }
    }
    const auto now = store_->Now();
    const auto updated = store_->Update(id, [paused, next_run, now](const ScheduleRecord& live) {
        auto next = live;
        next.status = paused ? ScheduleStatus::kPaused : ScheduleStatus::kActive;
        next.updated_at_ms = now;
        if (!paused) {
            next.next_run_at_ms = next_run;
        }
        return next;
    });
    if (!updated.has_value()) {
        return "Schedule " + id + " not found.";
    }
    return std::string(paused ? "Paused" : "Resumed") + " schedule " + id + ".";
}

std::string ScheduleTool::Run(const std::string& id) {
    if (!poller_) {
        return "Error: run requires a scheduler.";
    }
    if (!store_->Get(id).has_value()) {
        return "Schedule " + id + " not found.";
    }
    switch (poller_->RunNow(id)) {
        case heartbeat::SchedulePoller::RunOutcome::kRan:
            break;
        case heartbeat::SchedulePoller::RunOutcome::kLocked:
            return "Error: schedule " + id + " is locked by another process.";
        case heartbeat::SchedulePoller::RunOutcome::kNotFound:
            return "Schedule " + id + " not found.";
        case heartbeat::SchedulePoller::RunOutcome::kOtherSession:
            return "Error: schedule " + id + " belongs to another session.";
        case heartbeat::SchedulePoller::RunOutcome::kNotDue:
            return "Error: schedule " + id + " is not due.";
    }
    const auto record = store_->Get(id);
    if (record.has_value() && record->last_result.has_value() && !record->last_result->ok) {
        return "Error: schedule " + id + " failed: " + record->last_result->error;
    }
    return "Ran schedule " + id + ".";
}

}  // namespace cadence::tools
