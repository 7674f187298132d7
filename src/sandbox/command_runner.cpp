#include "sandbox/command_runner.hpp"

#include <boost/process.hpp>
#include <atomic>
#include <fstream>
#include <sstream>
#include <thread>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace cadence::sandbox {
namespace bp = boost::process;
namespace {

std::atomic<unsigned long> g_capture_counter{0};

// Polls waitpid until the child exits or the deadline passes.
bool WaitUntil(pid_t pid, std::chrono::steady_clock::time_point deadline, int& status,
               std::chrono::milliseconds poll) {
    while (std::chrono::steady_clock::now() < deadline) {
        const auto waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            return true;
        }
        if (waited < 0) {
            return false;
        }
        std::this_thread::sleep_for(poll);
    }
    return false;
}

std::string ReadCapture(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        return {};
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

}  // namespace

ExecResult CommandRunner::Run(const std::string& command,
                              const std::filesystem::path& working_dir,
                              std::chrono::seconds timeout) {
    ExecResult result{};
    std::ostringstream stamp;
    stamp << ::getpid() << "_" << g_capture_counter.fetch_add(1);
    const auto temp_dir = std::filesystem::temp_directory_path();
    const auto stdout_path = temp_dir / ("cadence_stdout_" + stamp.str() + ".log");
    const auto stderr_path = temp_dir / ("cadence_stderr_" + stamp.str() + ".log");

    try {
        bp::child child_process(
            "/bin/sh",
            "-c",
            command,
            bp::start_dir = working_dir.string(),
            bp::std_out > stdout_path.string(),
            bp::std_err > stderr_path.string());

        const pid_t pid = child_process.id();
        int status = 0;
        bool finished = WaitUntil(pid, std::chrono::steady_clock::now() + timeout, status,
                                  std::chrono::milliseconds(200));
        if (!finished) {
            result.timed_out = true;
            ::kill(pid, SIGTERM);
            finished = WaitUntil(pid, std::chrono::steady_clock::now() + std::chrono::seconds(2), status,
                                 std::chrono::milliseconds(100));
            if (!finished) {
                ::kill(pid, SIGKILL);
                ::waitpid(pid, &status, 0);
            }
        }
        child_process.detach();

        if (result.timed_out) {
            result.exit_code = 124;
        } else if (WIFEXITED(status)) {
            result.exit_code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            result.exit_code = 128 + WTERMSIG(status);
        }
    } catch (const bp::process_error& ex) {
        result.exit_code = -1;
        result.error = std::string("exec failed: ") + ex.what();
    }

    result.output = ReadCapture(stdout_path);
    if (result.error.empty()) {
        result.error = ReadCapture(stderr_path);
    }

    std::error_code ec;
    std::filesystem::remove(stdout_path, ec);
    std::filesystem::remove(stderr_path, ec);
    return result;
}

}  // namespace cadence::sandbox
