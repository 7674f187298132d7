#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace cadence::utils {

// Writes content to a sibling temp file and renames it over path, so readers
// see either the old file or the new one. Throws std::runtime_error on failure.
void AtomicWriteFile(const std::filesystem::path& path, const std::string& content);

std::optional<std::string> ReadTextFile(const std::filesystem::path& path);

}  // namespace cadence::utils
