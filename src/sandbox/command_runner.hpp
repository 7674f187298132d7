#pragma once

#include <chrono>
#include <filesystem>
#include <string>

namespace cadence::sandbox {

struct ExecResult {
    int exit_code = -1;
    bool timed_out = false;
    std::string output;
    std::string error;
};

// Runs command through /bin/sh -c in working_dir. On timeout the child gets
// SIGTERM, then SIGKILL after a short grace period; exit_code is then 124.
class CommandRunner {
public:
    static ExecResult Run(const std::string& command,
                          const std::filesystem::path& working_dir,
                          std::chrono::seconds timeout);
};

}  // namespace cadence::sandbox
