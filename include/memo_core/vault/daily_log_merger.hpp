#pragma once

#include <chrono>
#include <filesystem>
#include <string>

#include "memo_core/ingestion_context.hpp"

namespace memo_core {

/**
 * @brief Adds note links to the per-day log in the diary folder (YYYY-MM-DD.md).
 *
 * Every call reads the whole log, edits it in memory and rewrites it through a temporary
 * sibling file. There is no link dedup here: calling merge() twice for one note lists it twice.
 */
class DailyLogMerger {
 public:
  static constexpr const char* SECTION_HEADING = "## Voice Memos";

  explicit DailyLogMerger(const IngestionContext& context);
  virtual ~DailyLogMerger() = default;

  /**
   * @brief Links `note_path` from the log of the day containing `created_at`.
   * @return Path of the daily log that was written.
   * @throws PersistenceError if the log cannot be read or rewritten.
   */
  virtual std::filesystem::path merge(std::chrono::system_clock::time_point created_at,
                                      const std::filesystem::path& note_path);

  std::filesystem::path log_path_for(std::chrono::system_clock::time_point created_at) const;

  // "- [[notes/memos/20240501_093000_Title]]" for a note inside the vault
  std::string link_line(const std::filesystem::path& note_path) const;

  // Pure text transforms, exposed for tests
  static std::string new_log(const std::string& date, const std::string& link);
  static std::string append_link(const std::string& existing, const std::string& link);

 private:
  const IngestionContext& context_;
};

}  // namespace memo_core
