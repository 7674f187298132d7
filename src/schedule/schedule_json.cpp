#include "schedule/schedule_json.hpp"

#include <cmath>
#include <cstdint>
#include <limits>

namespace cadence::schedule {
namespace {

nlohmann::json NumberJson(double value) {
    if (std::isfinite(value) && std::floor(value) == value && std::fabs(value) < 9.0e15) {
        return nlohmann::json(static_cast<long long>(value));
    }
    return nlohmann::json(value);
}

std::string StringOr(const nlohmann::json& data, const char* key, const std::string& fallback = {}) {
    if (data.contains(key) && data[key].is_string()) {
        return data[key].get<std::string>();
    }
    return fallback;
}

std::optional<std::string> OptionalString(const nlohmann::json& data, const char* key) {
    if (data.contains(key) && data[key].is_string()) {
        return data[key].get<std::string>();
    }
    return std::nullopt;
}

std::optional<long long> OptionalMillis(const nlohmann::json& data, const char* key) {
    if (!data.contains(key)) {
        return std::nullopt;
    }
    return MillisFromJson(data[key]);
}

double NumberOr(const nlohmann::json& data, const char* key, double fallback) {
    if (data.contains(key) && data[key].is_number()) {
        return data[key].get<double>();
    }
    return fallback;
}

// Missing unit means minutes; an unknown unit makes the schedule unreadable.
std::optional<IntervalUnit> ReadUnit(const nlohmann::json& data) {
    if (!data.contains("unit") || data["unit"].is_null()) {
        return IntervalUnit::kMinutes;
    }
    if (!data["unit"].is_string()) {
        return std::nullopt;
    }
    return UnitFromString(data["unit"].get<std::string>());
}

std::optional<ScheduleSpec> SpecFromJson(const nlohmann::json& data) {
    if (!data.is_object()) {
        return std::nullopt;
    }
    const auto kind = StringOr(data, "kind");
    if (kind == "once") {
        OnceSchedule once;
        once.at = StringOr(data, "at");
        once.timezone = StringOr(data, "timezone");
        return ScheduleSpec(once);
    }
    if (kind == "cron") {
        CronSchedule cron;
        cron.cron = StringOr(data, "cron");
        cron.timezone = StringOr(data, "timezone");
        return ScheduleSpec(cron);
    }
    if (kind == "interval") {
        const auto unit = ReadUnit(data);
        if (!unit.has_value()) {
            return std::nullopt;
        }
        IntervalSchedule interval;
        interval.interval = NumberOr(data, "interval", 0);
        interval.unit = unit.value();
        return ScheduleSpec(interval);
    }
    if (kind == "random") {
        const auto unit = ReadUnit(data);
        if (!unit.has_value()) {
            return std::nullopt;
        }
        RandomSchedule random;
        random.min_interval = NumberOr(data, "minInterval", 0);
        random.max_interval = NumberOr(data, "maxInterval", 0);
        random.unit = unit.value();
        return ScheduleSpec(random);
    }
    return std::nullopt;
}

struct SpecJsonVisitor {
    nlohmann::json operator()(const OnceSchedule& once) const {
        nlohmann::json json = {{"kind", "once"}, {"at", once.at}};
        if (!once.timezone.empty()) {
            json["timezone"] = once.timezone;
        }
        return json;
    }
    nlohmann::json operator()(const CronSchedule& cron) const {
        nlohmann::json json = {{"kind", "cron"}, {"cron", cron.cron}};
        if (!cron.timezone.empty()) {
            json["timezone"] = cron.timezone;
        }
        return json;
    }
    nlohmann::json operator()(const IntervalSchedule& interval) const {
        return {
            {"kind", "interval"},
            {"interval", NumberJson(interval.interval)},
            {"unit", ToString(interval.unit)}
        };
    }
    nlohmann::json operator()(const RandomSchedule& random) const {
        return {
            {"kind", "random"},
            {"minInterval", NumberJson(random.min_interval)},
            {"maxInterval", NumberJson(random.max_interval)},
            {"unit", ToString(random.unit)}
        };
    }
};

}  // namespace

nlohmann::json ToJson(const ScheduleSpec& spec) {
    return std::visit(SpecJsonVisitor{}, spec);
}

nlohmann::json ToJson(const ScheduleRecord& record) {
    nlohmann::json json;
    json["id"] = record.id;
    json["createdAt"] = record.created_at_ms;
    json["updatedAt"] = record.updated_at_ms;
    json["createdBy"] = ToString(record.created_by);
    if (record.session_id.has_value()) {
        json["sessionId"] = *record.session_id;
    }
    json["actionType"] = ToString(record.action_type);
    json["command"] = record.command;
    if (record.message.has_value()) {
        json["message"] = *record.message;
    }
    if (record.description.has_value()) {
        json["description"] = *record.description;
    }
    json["status"] = ToString(record.status);
    json["schedule"] = ToJson(record.schedule);
    if (record.next_run_at_ms.has_value()) {
        json["nextRunAt"] = *record.next_run_at_ms;
    }
    if (record.last_run_at_ms.has_value()) {
        json["lastRunAt"] = *record.last_run_at_ms;
    }
    if (record.last_result.has_value()) {
        nlohmann::json result = {{"ok", record.last_result->ok}};
        if (!record.last_result->summary.empty()) {
            result["summary"] = record.last_result->summary;
        }
        if (!record.last_result->error.empty()) {
            result["error"] = record.last_result->error;
        }
        json["lastResult"] = result;
    }
    return json;
}

std::optional<ScheduleRecord> RecordFromJson(const nlohmann::json& data) {
    if (!data.is_object()) {
        return std::nullopt;
    }
    const auto id = StringOr(data, "id");
    if (id.empty()) {
        return std::nullopt;
    }
    if (!data.contains("schedule")) {
        return std::nullopt;
    }
    const auto spec = SpecFromJson(data["schedule"]);
    if (!spec.has_value()) {
        return std::nullopt;
    }
    const auto status = StatusFromString(StringOr(data, "status"));
    if (!status.has_value()) {
        return std::nullopt;
    }
    const auto created_by = CreatedByFromString(StringOr(data, "createdBy", "user"));
    const auto action_type = ActionTypeFromString(StringOr(data, "actionType", "command"));
    if (!created_by.has_value() || !action_type.has_value()) {
        return std::nullopt;
    }

    ScheduleRecord record;
    record.id = id;
    record.created_at_ms = OptionalMillis(data, "createdAt").value_or(0);
    record.updated_at_ms = OptionalMillis(data, "updatedAt").value_or(0);
    record.created_by = created_by.value();
    record.session_id = OptionalString(data, "sessionId");
    record.action_type = action_type.value();
    record.command = StringOr(data, "command");
    record.message = OptionalString(data, "message");
    record.description = OptionalString(data, "description");
    record.status = status.value();
    record.schedule = spec.value();
    record.next_run_at_ms = OptionalMillis(data, "nextRunAt");
    record.last_run_at_ms = OptionalMillis(data, "lastRunAt");
    if (data.contains("lastResult") && data["lastResult"].is_object()) {
        const auto& result = data["lastResult"];
        RunResult last;
        last.ok = result.contains("ok") && result["ok"].is_boolean() && result["ok"].get<bool>();
        last.summary = StringOr(result, "summary");
        last.error = StringOr(result, "error");
        record.last_result = last;
    }
    return record;
}

std::optional<long long> MillisFromJson(const nlohmann::json& value) {
    if (value.is_number_unsigned()) {
        const auto raw = value.get<std::uint64_t>();
        if (raw > static_cast<std::uint64_t>(std::numeric_limits<long long>::max())) {
            return std::nullopt;
        }
        return static_cast<long long>(raw);
    }
    if (value.is_number_integer()) {
        return value.get<long long>();
    }
    if (!value.is_number_float()) {
        return std::nullopt;
    }
    const auto number = value.get<double>();
    // 2^63 is exactly representable; everything at or above it overflows.
    constexpr double kLimit = 9223372036854775808.0;
    if (!std::isfinite(number) || number >= kLimit || number < -kLimit) {
        return std::nullopt;
    }
    return static_cast<long long>(number);
}

std::optional<ScheduleRecord> ParseRecord(const std::string& text) {
    const auto data = nlohmann::json::parse(text, nullptr, false);
    if (data.is_discarded()) {
        return std::nullopt;
    }
    return RecordFromJson(data);
}

}  // namespace cadence::schedule
