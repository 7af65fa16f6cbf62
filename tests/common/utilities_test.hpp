#pragma once

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "memo_core/ingestion_context.hpp"

namespace memo_tests {

/**
 * Utility class providing common functionality for all tests
 */
class TestUtilities {
 public:
  // Parent of every scratch directory this test process creates
  static std::filesystem::path temp_root();

  // Fresh, empty directory under temp_root()
  static std::filesystem::path create_temp_dir(const std::string& prefix = "test");
  static void cleanup_temp_dir(const std::filesystem::path& dir);

  static void write_file(const std::filesystem::path& path, const std::string& content);
  static std::string read_file(const std::filesystem::path& path);

  // Regular files directly inside `dir`, sorted by name
  static std::vector<std::filesystem::path> list_files(const std::filesystem::path& dir);

  // Local wall-clock time, as the vault formats it
  static std::chrono::system_clock::time_point local_time(
      int year, int month, int day, int hour = 0, int minute = 0, int second = 0);
};

/**
 * Base test fixture with a scratch vault, a voice memo folder and a pinned clock.
 *
 * Creation times come from `creation_times_` keyed by memo filename, falling back to
 * `default_created_`, so dates never depend on the filesystem.
 */
class VaultTestBase : public ::testing::Test {
 protected:
  void SetUp() override;
  void TearDown() override;

  std::filesystem::path write_memo(
      const std::string& filename,
      const std::string& content,
      std::optional<std::chrono::system_clock::time_point> created = std::nullopt);

  std::filesystem::path root_;
  std::filesystem::path vault_;
  std::filesystem::path memos_;

  std::chrono::system_clock::time_point now_;
  std::chrono::system_clock::time_point default_created_;
  std::map<std::string, std::chrono::system_clock::time_point> creation_times_;

  memo_core::IngestionContext context_;
};

}  // namespace memo_tests
