#include "test_support.hpp"

#include <fstream>
#include <random>
#include <stdexcept>
#include <unistd.h>

#include "cron/time_zone.hpp"

namespace cadence::testing {

TempDir::TempDir() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    const auto base = std::filesystem::temp_directory_path();
    for (int attempt = 0; attempt < 16; ++attempt) {
        auto candidate = base / ("cadence-test-" + std::to_string(::getpid()) + "-" + std::to_string(gen()));
        if (std::filesystem::create_directory(candidate)) {
            path_ = candidate;
            return;
        }
    }
    throw std::runtime_error("unable to create temp directory");
}

TempDir::~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
}

long long Iso(const std::string& value) {
    const auto parsed = cron::ParseScheduledTime(value, "");
    if (!parsed.has_value()) {
        throw std::invalid_argument("bad timestamp in test: " + value);
    }
    return parsed.value();
}

void WriteFile(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream output(path, std::ios::trunc);
    output << content;
}

}  // namespace cadence::testing
