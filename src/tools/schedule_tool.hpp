#pragma once

#include <string>
#include <unordered_map>

#include "heartbeat/schedule_poller.hpp"
#include "schedule/schedule_store.hpp"
#include "tools/tool.hpp"

namespace cadence::tools {

// create / list / get / delete / pause / resume / run over a ScheduleStore.
// Results are human-readable text (JSON for get); failures start with "Error:".
class ScheduleTool : public Tool {
public:
    explicit ScheduleTool(schedule::ScheduleStore* store, heartbeat::SchedulePoller* poller = nullptr);

    std::string Name() const override { return "schedule"; }
    std::string Description() const override {
        return "Create and manage scheduled commands (once, cron, interval or random interval).";
    }
    std::string ParametersJson() const override;
    std::string Execute(const std::unordered_map<std::string, std::string>& params) override;

private:
    using Params = std::unordered_map<std::string, std::string>;

    std::string Create(const Params& params);
    std::string List(const Params& params);
    std::string Get(const std::string& id);
    std::string Delete(const std::string& id);
    std::string SetPaused(const std::string& id, bool paused);
    std::string Run(const std::string& id);

    schedule::ScheduleStore* store_ = nullptr;
    heartbeat::SchedulePoller* poller_ = nullptr;
};

}  // namespace cadence::tools
