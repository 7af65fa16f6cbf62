#include "utilities_test.hpp"

#include <algorithm>
#include <atomic>
#include <ctime>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <unistd.h>

namespace memo_tests {

std::filesystem::path TestUtilities::temp_root() {
  // One root per test process, so parallel ctest runs never clean up each other's vaults
  return std::filesystem::temp_directory_path() / "memo_vault_tests" /
         ("pid_" + std::to_string(::getpid()));
}

std::filesystem::path TestUtilities::create_temp_dir(const std::string& prefix) {
  static std::atomic<int> counter{0};
  auto temp_root = TestUtilities::temp_root();
  std::filesystem::create_directories(temp_root);

  // Generate unique name using timestamp and a per-process counter
  auto now = std::chrono::system_clock::now();
  auto timestamp =
      std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count();

  auto dir = temp_root / (prefix + "_" + std::to_string(timestamp) + "_" +
                          std::to_string(counter++));
  std::filesystem::create_directories(dir);
  return dir;
}

void TestUtilities::cleanup_temp_dir(const std::filesystem::path& dir) {
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);

  // Also cleanup the parent directory if it's empty
  auto parent_dir = dir.parent_path();
  if (std::filesystem::exists(parent_dir, ec) && std::filesystem::is_empty(parent_dir, ec)) {
    std::filesystem::remove(parent_dir, ec);
  }
}

void TestUtilities::write_file(const std::filesystem::path& path, const std::string& content) {
  std::filesystem::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary);
  if (!out.is_open()) {
    throw std::runtime_error("Failed to create test file: " + path.string());
  }
  out << content;
}

std::string TestUtilities::read_file(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    throw std::runtime_error("Failed to open test file: " + path.string());
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

std::vector<std::filesystem::path> TestUtilities::list_files(const std::filesystem::path& dir) {
  std::vector<std::filesystem::path> files;
  if (!std::filesystem::exists(dir)) {
    return files;
  }
  for (const auto& entry : std::filesystem::directory_iterator(dir)) {
    if (entry.is_regular_file()) {
      files.push_back(entry.path());
    }
  }
  std::sort(files.begin(), files.end());
  return files;
}

std::chrono::system_clock::time_point TestUtilities::local_time(
    int year, int month, int day, int hour, int minute, int second) {
  std::tm tm_struct = {};
  tm_struct.tm_year = year - 1900;
  tm_struct.tm_mon = month - 1;
  tm_struct.tm_mday = day;
  tm_struct.tm_hour = hour;
  tm_struct.tm_min = minute;
  tm_struct.tm_sec = second;
  tm_struct.tm_isdst = -1;
  return std::chrono::system_clock::from_time_t(std::mktime(&tm_struct));
}

void VaultTestBase::SetUp() {
  root_ = TestUtilities::create_temp_dir("vault");
  vault_ = root_ / "vault";
  memos_ = root_ / "memos";
  std::filesystem::create_directories(vault_);
  std::filesystem::create_directories(memos_);

  now_ = TestUtilities::local_time(2024, 6, 1, 12, 0, 0);
  default_created_ = TestUtilities::local_time(2024, 5, 1, 9, 30, 0);

  context_.layout.vault_root = vault_;
  context_.layout.voice_memos_path = memos_;
  context_.audio_extension = ".m4a";
  context_.now = [this] { return now_; };
  context_.creation_time = [this](const std::filesystem::path& p) {
    auto it = creation_times_.find(p.filename().string());
    return it != creation_times_.end() ? it->second : default_created_;
  };
}

void VaultTestBase::TearDown() {
  TestUtilities::cleanup_temp_dir(root_);
}

std::filesystem::path VaultTestBase::write_memo(
    const std::string& filename,
    const std::string& content,
    std::optional<std::chrono::system_clock::time_point> created) {
  auto path = memos_ / filename;
  TestUtilities::write_file(path, content);
  if (created.has_value()) {
    creation_times_[filename] = *created;
  }
  return path;
}

}  // namespace memo_tests
