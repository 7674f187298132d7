#include <gtest/gtest.h>

#include <cstdlib>

#include "config/config_loader.hpp"
#include "test_support.hpp"

using cadence::config::LoadConfig;
using cadence::testing::TempDir;
using cadence::testing::WriteFile;

namespace {

// Unsets the variable on scope exit.
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) { ::setenv(name, value, 1); }
    ~ScopedEnv() { ::unsetenv(name_); }

private:
    const char* name_;
};

}  // namespace

TEST(ConfigLoaderTest, DefaultsWhenFileMissing) {
    TempDir dir;
    const auto config = LoadConfig(dir.Path() / "missing.json");
    EXPECT_TRUE(config.scheduler.enabled);
    EXPECT_EQ(config.scheduler.root, ".cadence");
    EXPECT_EQ(config.scheduler.tick_interval_ms, 30000);
    EXPECT_EQ(config.scheduler.lock_ttl_ms, 600000);
    EXPECT_TRUE(config.scheduler.owner_id.empty());
    EXPECT_FALSE(config.scheduler.claim_global);
    EXPECT_EQ(config.logging.level, "info");
}

TEST(ConfigLoaderTest, ReadsJsonFile) {
    TempDir dir;
    const auto path = dir.Path() / "config.json";
    WriteFile(path, R"({
        "scheduler": {
            "root": "/var/lib/cadence",
            "enabled": false,
            "tickIntervalMs": 5000,
            "lockTtlMs": 120000,
            "ownerId": "node-a",
            "sessionId": "s1",
            "claimGlobal": true,
            "commandTimeoutS": 20
        },
        "logging": {"level": "debug"}
    })");

    const auto config = LoadConfig(path);
    EXPECT_EQ(config.scheduler.root, "/var/lib/cadence");
    EXPECT_FALSE(config.scheduler.enabled);
    EXPECT_EQ(config.scheduler.tick_interval_ms, 5000);
    EXPECT_EQ(config.scheduler.lock_ttl_ms, 120000);
    EXPECT_EQ(config.scheduler.owner_id, "node-a");
    EXPECT_EQ(config.scheduler.session_id, "s1");
    EXPECT_TRUE(config.scheduler.claim_global);
    EXPECT_EQ(config.scheduler.command_timeout_s, 20);
    EXPECT_EQ(config.logging.level, "debug");
}

TEST(ConfigLoaderTest, IgnoresUnparsableFile) {
    TempDir dir;
    const auto path = dir.Path() / "config.json";
    WriteFile(path, "{ broken");
    const auto config = LoadConfig(path);
    EXPECT_EQ(config.scheduler.tick_interval_ms, 30000);
}

TEST(ConfigLoaderTest, EnvironmentOverridesFile) {
    TempDir dir;
    const auto path = dir.Path() / "config.json";
    WriteFile(path, R"({"scheduler": {"root": "/from/file", "tickIntervalMs": 5000}})");

    ScopedEnv root("CADENCE_SCHEDULER__ROOT", "/from/env");
    ScopedEnv tick("CADENCE_SCHEDULER__TICK_INTERVAL_MS", "not-a-number");
    ScopedEnv claim("CADENCE_SCHEDULER__CLAIM_GLOBAL", "yes");
    ScopedEnv level("CADENCE_LOGGING__LEVEL", "warn");

    const auto config = LoadConfig(path);
    EXPECT_EQ(config.scheduler.root, "/from/env");
    EXPECT_EQ(config.scheduler.tick_interval_ms, 5000);
    EXPECT_TRUE(config.scheduler.claim_global);
    EXPECT_EQ(config.logging.level, "warn");
}
