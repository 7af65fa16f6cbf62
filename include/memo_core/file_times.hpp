#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace memo_core::file_times {

enum class TimestampSource { BirthTime, LastModified };

struct CreationTime {
  std::chrono::system_clock::time_point time;
  TimestampSource source;
};

// Filesystem birth time, when the platform and filesystem report one
std::optional<std::chrono::system_clock::time_point> birth_time(const std::filesystem::path& path);

std::chrono::system_clock::time_point last_modified(const std::filesystem::path& path);

/**
 * @brief Best available creation timestamp: birth time if reported, else last-modified time.
 * @throws std::filesystem::filesystem_error if the file cannot be stat'ed at all.
 */
CreationTime creation_time(const std::filesystem::path& path);

// Formats in the local time zone with a strftime pattern
std::string format_local(std::chrono::system_clock::time_point tp, const char* pattern);

/**
 * @brief Parses a strict YYYY-MM-DD date into local midnight of that day.
 * @return std::nullopt if the text is not a real calendar date in that exact format.
 */
std::optional<std::chrono::system_clock::time_point> parse_iso_date(const std::string& text);

}  // namespace memo_core::file_times
