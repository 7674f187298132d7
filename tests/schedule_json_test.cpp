#include <gtest/gtest.h>

#include <cstdint>
#include <limits>

#include "schedule/schedule_json.hpp"

using namespace cadence::schedule;

TEST(ScheduleJsonTest, WritesCamelCaseAndOmitsAbsentFields) {
    ScheduleRecord record;
    record.id = "nightly";
    record.created_at_ms = 1000;
    record.updated_at_ms = 2000;
    record.command = "backup.sh";
    record.schedule = IntervalSchedule{10, IntervalUnit::kMinutes};
    record.next_run_at_ms = 602000;

    const auto json = ToJson(record);
    EXPECT_EQ(json["id"], "nightly");
    EXPECT_EQ(json["createdAt"], 1000);
    EXPECT_EQ(json["createdBy"], "user");
    EXPECT_EQ(json["actionType"], "command");
    EXPECT_EQ(json["status"], "active");
    EXPECT_EQ(json["nextRunAt"], 602000);
    EXPECT_EQ(json["schedule"]["kind"], "interval");
    EXPECT_TRUE(json["schedule"]["interval"].is_number_integer());
    EXPECT_EQ(json["schedule"]["unit"], "minutes");
    EXPECT_FALSE(json.contains("sessionId"));
    EXPECT_FALSE(json.contains("lastRunAt"));
    EXPECT_FALSE(json.contains("lastResult"));
}

TEST(ScheduleJsonTest, ReadsMinimalRecordWithDefaults) {
    const auto record = ParseRecord(R"({
        "id": "a1",
        "command": "echo",
        "status": "paused",
        "schedule": {"kind": "random", "minInterval": 1, "maxInterval": 2.5}
    })");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->created_by, CreatedBy::kUser);
    EXPECT_EQ(record->action_type, ActionType::kCommand);
    EXPECT_EQ(record->status, ScheduleStatus::kPaused);
    const auto* random = std::get_if<RandomSchedule>(&record->schedule);
    ASSERT_NE(random, nullptr);
    EXPECT_EQ(random->unit, IntervalUnit::kMinutes);
    EXPECT_DOUBLE_EQ(random->max_interval, 2.5);
    EXPECT_FALSE(record->next_run_at_ms.has_value());
}

TEST(ScheduleJsonTest, RejectsMalformedRecords) {
    EXPECT_FALSE(ParseRecord("{not json").has_value());
    EXPECT_FALSE(ParseRecord("[]").has_value());
    EXPECT_FALSE(ParseRecord(R"({"command":"x","status":"active","schedule":{"kind":"cron","cron":"* * * * *"}})")
                     .has_value());
    EXPECT_FALSE(ParseRecord(R"({"id":"x","status":"active","schedule":{"kind":"weekly"}})").has_value());
    EXPECT_FALSE(ParseRecord(R"({"id":"x","status":"sleeping","schedule":{"kind":"cron","cron":"* * * * *"}})")
                     .has_value());
    EXPECT_FALSE(ParseRecord(R"({"id":"x","status":"active","schedule":{"kind":"interval","interval":5,"unit":"days"}})")
                     .has_value());
}

TEST(ScheduleJsonTest, PreservesRunOutcome) {
    ScheduleRecord record;
    record.id = "r";
    record.command = "false";
    record.status = ScheduleStatus::kError;
    record.schedule = OnceSchedule{"2026-02-01T00:00:00Z", "UTC"};
    record.session_id = "s-1";
    record.last_run_at_ms = 42;
    record.last_result = RunResult{false, "", "exit code 1"};

    const auto parsed = ParseRecord(ToJson(record).dump());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, record);
}

TEST(ScheduleJsonTest, OutOfRangeTimestampsAreDropped) {
    const auto record = ParseRecord(R"({
        "id": "far",
        "command": "echo",
        "status": "active",
        "createdAt": -1e300,
        "nextRunAt": 1e300,
        "lastRunAt": 18446744073709551615,
        "schedule": {"kind": "interval", "interval": 5}
    })");
    ASSERT_TRUE(record.has_value());
    EXPECT_FALSE(record->next_run_at_ms.has_value());
    EXPECT_FALSE(record->last_run_at_ms.has_value());
    EXPECT_EQ(record->created_at_ms, 0);
}

TEST(ScheduleJsonTest, MillisFromJsonAcceptsOnlyRepresentableNumbers) {
    EXPECT_EQ(MillisFromJson(nlohmann::json(1769904000000LL)), 1769904000000LL);
    EXPECT_EQ(MillisFromJson(nlohmann::json(1500.9)), 1500);
    EXPECT_EQ(MillisFromJson(nlohmann::json(-2000)), -2000);
    EXPECT_FALSE(MillisFromJson(nlohmann::json(9.3e18)).has_value());
    EXPECT_FALSE(MillisFromJson(nlohmann::json(-9.3e18)).has_value());
    EXPECT_FALSE(MillisFromJson(nlohmann::json(std::numeric_limits<double>::infinity())).has_value());
    EXPECT_FALSE(MillisFromJson(nlohmann::json(std::uint64_t{1} << 63)).has_value());
    EXPECT_FALSE(MillisFromJson(nlohmann::json("1000")).has_value());
}
