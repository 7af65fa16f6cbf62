#include "memo_core/file_times.hpp"

#include <fcntl.h>
#include <sys/stat.h>

#include <ctime>
#include <iomanip>
#include <regex>
#include <sstream>

namespace memo_core::file_times {

namespace {

std::chrono::system_clock::time_point to_sys_time(std::filesystem::file_time_type ftime) {
  return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
      ftime - std::filesystem::file_time_type::clock::now() + std::chrono::system_clock::now());
}

std::chrono::system_clock::time_point from_timespec(long long seconds, long long nanos) {
  return std::chrono::system_clock::time_point(
      std::chrono::duration_cast<std::chrono::system_clock::duration>(
          std::chrono::seconds(seconds) + std::chrono::nanoseconds(nanos)));
}

}  // namespace

std::optional<std::chrono::system_clock::time_point> birth_time(const std::filesystem::path& path) {
#if defined(__linux__) && defined(STATX_BTIME)
  struct statx stx {};
  if (statx(AT_FDCWD, path.c_str(), 0, STATX_BTIME, &stx) != 0) {
    return std::nullopt;
  }
  // Filesystems without birth time support leave the bit cleared
  if ((stx.stx_mask & STATX_BTIME) == 0) {
    return std::nullopt;
  }
  return from_timespec(stx.stx_btime.tv_sec, stx.stx_btime.tv_nsec);
#elif defined(__APPLE__)
  struct stat st {};
  if (stat(path.c_str(), &st) != 0) {
    return std::nullopt;
  }
  return from_timespec(st.st_birthtimespec.tv_sec, st.st_birthtimespec.tv_nsec);
#else
  (void)path;
  return std::nullopt;
#endif
}

std::chrono::system_clock::time_point last_modified(const std::filesystem::path& path) {
  return to_sys_time(std::filesystem::last_write_time(path));
}

CreationTime creation_time(const std::filesystem::path& path) {
  if (auto born = birth_time(path)) {
    return {*born, TimestampSource::BirthTime};
  }
  return {last_modified(path), TimestampSource::LastModified};
}

std::string format_local(std::chrono::system_clock::time_point tp, const char* pattern) {
  const auto time = std::chrono::system_clock::to_time_t(tp);
  std::tm local_time{};
  localtime_r(&time, &local_time);
  std::stringstream ss;
  ss << std::put_time(&local_time, pattern);
  return ss.str();
}

std::optional<std::chrono::system_clock::time_point> parse_iso_date(const std::string& text) {
  static const std::regex iso_date(R"(^\d{4}-\d{2}-\d{2}$)");
  if (!std::regex_match(text, iso_date)) {
    return std::nullopt;
  }

  std::tm tm_struct = {};
  std::stringstream ss(text);
  ss >> std::get_time(&tm_struct, "%Y-%m-%d");
  if (ss.fail()) {
    return std::nullopt;
  }
  const int year = tm_struct.tm_year;
  const int month = tm_struct.tm_mon;
  const int day = tm_struct.tm_mday;
  tm_struct.tm_isdst = -1;

  std::time_t local_midnight = std::mktime(&tm_struct);
  if (local_midnight == static_cast<std::time_t>(-1)) {
    return std::nullopt;
  }
  // mktime normalizes 2024-02-30 into March; reject anything it had to move
  if (tm_struct.tm_year != year || tm_struct.tm_mon != month || tm_struct.tm_mday != day) {
    return std::nullopt;
  }
  return std::chrono::system_clock::from_time_t(local_midnight);
}

}  // namespace memo_core::file_times
