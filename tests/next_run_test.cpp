#include <gtest/gtest.h>

#include "cron/time_zone.hpp"
#include "schedule/next_run.hpp"
#include "test_support.hpp"

using namespace cadence::schedule;
using cadence::testing::Iso;

namespace {

ScheduleRecord MakeRecord(ScheduleSpec spec) {
    ScheduleRecord record;
    record.id = "job-1";
    record.command = "echo hi";
    record.schedule = std::move(spec);
    return record;
}

}  // namespace

TEST(NextRunTest, IntervalAddsDelay) {
    const auto from = Iso("2026-02-01T00:00:00Z");
    EXPECT_EQ(ComputeNextRun(IntervalSchedule{15, IntervalUnit::kSeconds}, from), from + 15000);
    EXPECT_EQ(ComputeNextRun(IntervalSchedule{2, IntervalUnit::kMinutes}, from), from + 120000);
    EXPECT_EQ(ComputeNextRun(IntervalSchedule{1.5, IntervalUnit::kHours}, from), from + 5400000);
}

TEST(NextRunTest, NonPositiveIntervalHasNoNextRun) {
    EXPECT_FALSE(ComputeNextRun(IntervalSchedule{0, IntervalUnit::kMinutes}, 0).has_value());
    EXPECT_FALSE(ComputeNextRun(IntervalSchedule{-5, IntervalUnit::kMinutes}, 0).has_value());
}

TEST(NextRunTest, HugeIntervalHasNoNextRun) {
    EXPECT_FALSE(ComputeNextRun(IntervalSchedule{1e300, IntervalUnit::kHours}, 0).has_value());
    EXPECT_FALSE(ComputeNextRun(RandomSchedule{1, 1e300, IntervalUnit::kHours}, 0).has_value());
    EXPECT_EQ(ValidateSchedule(MakeRecord(IntervalSchedule{1e300, IntervalUnit::kHours})),
              std::string("every is too large."));
}

TEST(NextRunTest, RandomStaysWithinBounds) {
    const auto from = Iso("2026-02-01T00:00:00Z");
    const RandomSchedule random{5, 15, IntervalUnit::kMinutes};
    for (int i = 0; i < 200; ++i) {
        const auto next = ComputeNextRun(random, from);
        ASSERT_TRUE(next.has_value());
        EXPECT_GE(*next, from + 5 * 60 * 1000);
        EXPECT_LE(*next, from + 15 * 60 * 1000);
    }
}

TEST(NextRunTest, RandomWithEqualBoundsIsFixed) {
    EXPECT_EQ(ComputeNextRun(RandomSchedule{3, 3, IntervalUnit::kSeconds}, 1000), 4000);
}

TEST(NextRunTest, RandomWithInvertedBoundsHasNoNextRun) {
    EXPECT_FALSE(ComputeNextRun(RandomSchedule{10, 5, IntervalUnit::kMinutes}, 0).has_value());
    EXPECT_FALSE(ComputeNextRun(RandomSchedule{0, 5, IntervalUnit::kMinutes}, 0).has_value());
}

TEST(NextRunTest, OnceInFuture) {
    const auto from = Iso("2026-02-01T00:00:00Z");
    EXPECT_EQ(ComputeNextRun(OnceSchedule{"2026-02-01T01:00:00Z", ""}, from), Iso("2026-02-01T01:00:00Z"));
}

TEST(NextRunTest, OnceInPastOrNowHasNoNextRun) {
    const auto from = Iso("2026-02-01T00:00:00Z");
    EXPECT_FALSE(ComputeNextRun(OnceSchedule{"2026-01-31T23:59:00Z", ""}, from).has_value());
    EXPECT_FALSE(ComputeNextRun(OnceSchedule{"2026-02-01T00:00:00Z", ""}, from).has_value());
    EXPECT_FALSE(ComputeNextRun(OnceSchedule{"not a date", ""}, from).has_value());
    EXPECT_FALSE(ComputeNextRun(OnceSchedule{"", ""}, from).has_value());
}

TEST(NextRunTest, OnceUsesWallClockInZone) {
    const auto from = Iso("2026-02-01T00:00:00Z");
    EXPECT_EQ(ComputeNextRun(OnceSchedule{"2026-02-01T09:00:00", "UTC"}, from), Iso("2026-02-01T09:00:00Z"));
    if (cadence::cron::IsValidTimeZone("Asia/Tokyo")) {
        EXPECT_EQ(ComputeNextRun(OnceSchedule{"2026-02-01T18:00:00", "Asia/Tokyo"}, from),
                  Iso("2026-02-01T09:00:00Z"));
    }
}

TEST(NextRunTest, CronDelegatesToEvaluator) {
    const auto from = Iso("2026-02-01T00:00:00Z");
    EXPECT_EQ(ComputeNextRun(CronSchedule{"*/5 * * * *", "UTC"}, from), Iso("2026-02-01T00:05:00Z"));
    EXPECT_FALSE(ComputeNextRun(CronSchedule{"", "UTC"}, from).has_value());
    EXPECT_FALSE(ComputeNextRun(CronSchedule{"bad", "UTC"}, from).has_value());
}

TEST(NextRunTest, InvalidZoneIsIgnoredWhenComputing) {
    const auto from = Iso("2026-02-01T00:00:00Z");
    EXPECT_EQ(ComputeNextRun(CronSchedule{"*/5 * * * *", "Not/AZone"}, from), Iso("2026-02-01T00:05:00Z"));
}

TEST(NextRunTest, RecordOverloadUsesSchedule) {
    const auto record = MakeRecord(IntervalSchedule{30, IntervalUnit::kSeconds});
    EXPECT_EQ(ComputeNextRun(record, 1000), 31000);
}

TEST(ValidateScheduleTest, AcceptsWellFormedRecords) {
    EXPECT_FALSE(ValidateSchedule(MakeRecord(IntervalSchedule{1, IntervalUnit::kSeconds})).has_value());
    EXPECT_FALSE(ValidateSchedule(MakeRecord(CronSchedule{"0 9 * * 1-5", "UTC"})).has_value());
    EXPECT_FALSE(ValidateSchedule(MakeRecord(OnceSchedule{"2030-01-01T00:00:00Z", ""})).has_value());
    EXPECT_FALSE(ValidateSchedule(MakeRecord(RandomSchedule{1, 2, IntervalUnit::kHours})).has_value());
}

TEST(ValidateScheduleTest, ReportsProblems) {
    auto record = MakeRecord(IntervalSchedule{10, IntervalUnit::kMinutes});
    record.id = "bad id!";
    EXPECT_TRUE(ValidateSchedule(record).has_value());

    record = MakeRecord(IntervalSchedule{10, IntervalUnit::kMinutes});
    record.command = "  ";
    EXPECT_EQ(ValidateSchedule(record), std::string("command is required."));

    EXPECT_EQ(ValidateSchedule(MakeRecord(IntervalSchedule{0, IntervalUnit::kMinutes})),
              std::string("every must be a positive number."));
    EXPECT_EQ(ValidateSchedule(MakeRecord(IntervalSchedule{0.5, IntervalUnit::kSeconds})),
              std::string("minimum interval is 1 second."));
    EXPECT_TRUE(ValidateSchedule(MakeRecord(RandomSchedule{10, 5, IntervalUnit::kMinutes})).has_value());
    EXPECT_TRUE(ValidateSchedule(MakeRecord(RandomSchedule{0, 5, IntervalUnit::kMinutes})).has_value());
    EXPECT_TRUE(ValidateSchedule(MakeRecord(CronSchedule{"61 * * * *", ""})).has_value());
    EXPECT_TRUE(ValidateSchedule(MakeRecord(CronSchedule{"", ""})).has_value());
    EXPECT_TRUE(ValidateSchedule(MakeRecord(OnceSchedule{"", ""})).has_value());
    EXPECT_TRUE(ValidateSchedule(MakeRecord(CronSchedule{"* * * * *", "Not/AZone"})).has_value());
}
