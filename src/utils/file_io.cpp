#include "utils/file_io.hpp"

#include <atomic>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <unistd.h>

namespace cadence::utils {
namespace {

std::atomic<unsigned long> g_temp_counter{0};

std::filesystem::path TempPathFor(const std::filesystem::path& path) {
    std::ostringstream name;
    name << "." << path.filename().string() << ".tmp-" << ::getpid() << "-" << g_temp_counter.fetch_add(1);
    return path.parent_path() / name.str();
}

}  // namespace

void AtomicWriteFile(const std::filesystem::path& path, const std::string& content) {
    const auto temp_path = TempPathFor(path);
    {
        std::ofstream output(temp_path, std::ios::binary | std::ios::trunc);
        if (!output.is_open()) {
            throw std::runtime_error("failed to open " + temp_path.string() + " for writing");
        }
        output << content;
        output.flush();
        if (!output.good()) {
            output.close();
            std::error_code ignored;
            std::filesystem::remove(temp_path, ignored);
            throw std::runtime_error("failed to write " + temp_path.string());
        }
    }
    std::error_code ec;
    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp_path, ignored);
        throw std::runtime_error("failed to replace " + path.string() + ": " + ec.message());
    }
}

std::optional<std::string> ReadTextFile(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    if (input.bad()) {
        return std::nullopt;
    }
    return buffer.str();
}

}  // namespace cadence::utils
