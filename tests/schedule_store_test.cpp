#include <gtest/gtest.h>

#include <stdexcept>

#include "schedule/next_run.hpp"
#include "schedule/schedule_store.hpp"
#include "test_support.hpp"

using namespace cadence::schedule;
using cadence::testing::Iso;
using cadence::testing::ManualClock;
using cadence::testing::TempDir;
using cadence::testing::WriteFile;

namespace {

ScheduleRecord MakeRecord(const std::string& id, ScheduleSpec spec, long long now) {
    ScheduleRecord record;
    record.id = id;
    record.created_at_ms = now;
    record.updated_at_ms = now;
    record.command = "echo " + id;
    record.schedule = std::move(spec);
    record.next_run_at_ms = ComputeNextRun(record, now);
    return record;
}

}  // namespace

class ScheduleStoreTest : public ::testing::Test {
protected:
    ScheduleStoreTest() : clock_(Iso("2026-02-01T00:00:00Z")), store_(dir_.Path(), clock_.AsClock()) {}

    TempDir dir_;
    ManualClock clock_;
    ScheduleStore store_;
};

TEST_F(ScheduleStoreTest, SaveThenGetReturnsEqualRecord) {
    auto record = MakeRecord("alpha", CronSchedule{"*/5 * * * *", "UTC"}, clock_.Now());
    record.description = "every five";
    record.session_id = "s1";
    store_.Save(record);

    const auto loaded = store_.Get("alpha");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, record);
    EXPECT_TRUE(std::filesystem::exists(dir_.Path() / "schedules" / "alpha.json"));
}

TEST_F(ScheduleStoreTest, UnsafeIdIsRejectedWithoutWriting) {
    auto record = MakeRecord("ok", IntervalSchedule{1, IntervalUnit::kMinutes}, clock_.Now());
    record.id = "bad id!";
    EXPECT_THROW(store_.Save(record), std::invalid_argument);
    record.id = "../escape";
    EXPECT_THROW(store_.Save(record), std::invalid_argument);
    EXPECT_FALSE(std::filesystem::exists(dir_.Path() / "schedules"));
    EXPECT_FALSE(store_.Get("bad id!").has_value());
}

TEST_F(ScheduleStoreTest, ListSkipsMalformedFilesAndSortsById) {
    store_.Save(MakeRecord("b", IntervalSchedule{1, IntervalUnit::kMinutes}, clock_.Now()));
    store_.Save(MakeRecord("a", IntervalSchedule{1, IntervalUnit::kMinutes}, clock_.Now()));
    WriteFile(store_.SchedulesDir() / "broken.json", "{ nope");
    WriteFile(store_.SchedulesDir() / ".hidden.json", "{}");
    WriteFile(store_.SchedulesDir() / "notes.txt", "ignored");

    const auto records = store_.List();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].id, "a");
    EXPECT_EQ(records[1].id, "b");
}

TEST_F(ScheduleStoreTest, ListOnMissingRootIsEmpty) {
    ScheduleStore empty(dir_.Path() / "nowhere", clock_.AsClock());
    EXPECT_TRUE(empty.List().empty());
    EXPECT_TRUE(empty.GetDue(clock_.Now()).empty());
}

TEST_F(ScheduleStoreTest, ListFiltersBySession) {
    auto mine = MakeRecord("mine", IntervalSchedule{1, IntervalUnit::kMinutes}, clock_.Now());
    mine.session_id = "s1";
    auto theirs = MakeRecord("theirs", IntervalSchedule{1, IntervalUnit::kMinutes}, clock_.Now());
    theirs.session_id = "s2";
    auto global = MakeRecord("global", IntervalSchedule{1, IntervalUnit::kMinutes}, clock_.Now());
    store_.Save(mine);
    store_.Save(theirs);
    store_.Save(global);

    ScheduleStore::ListOptions options;
    options.session_id = "s1";
    const auto filtered = store_.List(options);
    ASSERT_EQ(filtered.size(), 2u);
    EXPECT_EQ(filtered[0].id, "global");
    EXPECT_EQ(filtered[1].id, "mine");

    options.all = true;
    EXPECT_EQ(store_.List(options).size(), 3u);
    EXPECT_EQ(store_.List().size(), 3u);
}

TEST_F(ScheduleStoreTest, DeleteAndUpdateOfMissingRecord) {
    EXPECT_FALSE(store_.Delete("ghost"));
    EXPECT_FALSE(store_.Delete("bad id!"));
    const auto updated = store_.Update("ghost", [](const ScheduleRecord& record) { return record; });
    EXPECT_FALSE(updated.has_value());
}

TEST_F(ScheduleStoreTest, DeleteRemovesRecord) {
    store_.Save(MakeRecord("gone", IntervalSchedule{1, IntervalUnit::kMinutes}, clock_.Now()));
    EXPECT_TRUE(store_.Delete("gone"));
    EXPECT_FALSE(store_.Get("gone").has_value());
    EXPECT_FALSE(store_.Delete("gone"));
}

TEST_F(ScheduleStoreTest, DeleteRemovesLockGuard) {
    store_.Save(MakeRecord("gone", IntervalSchedule{1, IntervalUnit::kMinutes}, clock_.Now()));
    EXPECT_TRUE(store_.AcquireLock("gone", "owner-a"));
    EXPECT_FALSE(store_.AcquireLock("gone", "owner-b"));
    store_.ReleaseLock("gone", "owner-a");
    const auto guard = store_.SchedulesDir() / "locks" / "gone.lock.guard";
    ASSERT_TRUE(std::filesystem::exists(guard));

    EXPECT_TRUE(store_.Delete("gone"));
    EXPECT_FALSE(std::filesystem::exists(guard));
    EXPECT_TRUE(store_.AcquireLock("gone", "owner-b"));
}

TEST_F(ScheduleStoreTest, UpdateKeepsId) {
    store_.Save(MakeRecord("keep", IntervalSchedule{1, IntervalUnit::kMinutes}, clock_.Now()));
    const auto updated = store_.Update("keep", [](const ScheduleRecord& record) {
        auto next = record;
        next.id = "renamed";
        next.status = ScheduleStatus::kPaused;
        return next;
    });
    ASSERT_TRUE(updated.has_value());
    EXPECT_EQ(updated->id, "keep");
    EXPECT_EQ(store_.Get("keep")->status, ScheduleStatus::kPaused);
    EXPECT_FALSE(store_.Get("renamed").has_value());
}

TEST_F(ScheduleStoreTest, GetDueReturnsOnlyActiveRecordsAtOrBeforeNow) {
    const auto now = clock_.Now();
    auto due = MakeRecord("due", IntervalSchedule{1, IntervalUnit::kMinutes}, now);
    due.next_run_at_ms = now;
    auto future = MakeRecord("future", IntervalSchedule{1, IntervalUnit::kMinutes}, now);
    auto paused = MakeRecord("paused", IntervalSchedule{1, IntervalUnit::kMinutes}, now);
    paused.next_run_at_ms = now - 1000;
    paused.status = ScheduleStatus::kPaused;
    auto done = MakeRecord("done", OnceSchedule{"2026-02-01T00:10:00Z", ""}, now);
    done.status = ScheduleStatus::kCompleted;
    done.next_run_at_ms.reset();
    store_.Save(due);
    store_.Save(future);
    store_.Save(paused);
    store_.Save(done);

    const auto result = store_.GetDue(now);
    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result[0].id, "due");
}

TEST_F(ScheduleStoreTest, FarFutureFloatTimestampIsNeverDue) {
    WriteFile(store_.SchedulesDir() / "far.json", R"({
        "id": "far",
        "command": "echo",
        "status": "active",
        "nextRunAt": 1e300,
        "schedule": {"kind": "interval", "interval": 5}
    })");
    ASSERT_TRUE(store_.Get("far").has_value());
    EXPECT_TRUE(store_.GetDue(clock_.Now()).empty());
}

TEST_F(ScheduleStoreTest, CronScheduleBecomesDueAfterFiveMinutes) {
    store_.Save(MakeRecord("five", CronSchedule{"*/5 * * * *", "UTC"}, clock_.Now()));
    EXPECT_EQ(store_.Get("five")->next_run_at_ms, Iso("2026-02-01T00:05:00Z"));

    clock_.Set(Iso("2026-02-01T00:04:59Z"));
    EXPECT_TRUE(store_.GetDue(clock_.Now()).empty());

    clock_.Set(Iso("2026-02-01T00:05:00Z"));
    const auto due = store_.GetDue(clock_.Now());
    ASSERT_EQ(due.size(), 1u);
    EXPECT_EQ(due[0].id, "five");
}

TEST_F(ScheduleStoreTest, ForwardsLockOperations) {
    EXPECT_TRUE(store_.AcquireLock("job", "owner-a"));
    EXPECT_FALSE(store_.AcquireLock("job", "owner-b"));
    EXPECT_TRUE(store_.RefreshLock("job", "owner-a"));
    store_.ReleaseLock("job", "owner-a");
    EXPECT_TRUE(store_.AcquireLock("job", "owner-b"));
    EXPECT_TRUE(std::filesystem::exists(store_.SchedulesDir() / "locks" / "job.lock.json"));
}
