#include "memo_core/vault/daily_log_merger.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <vector>

#include "memo_core/errors.hpp"
#include "memo_core/file_times.hpp"

namespace memo_core {

namespace {

std::string rtrim(const std::string& s) {
  const auto end = s.find_last_not_of(" \t\r");
  return end == std::string::npos ? "" : s.substr(0, end + 1);
}

bool is_blank(const std::string& line) {
  return rtrim(line).empty();
}

// A level 1 or 2 heading ends the links section
bool ends_section(const std::string& line) {
  return line.rfind("# ", 0) == 0 || line.rfind("## ", 0) == 0;
}

std::vector<std::string> split_lines(const std::string& text) {
  std::vector<std::string> lines;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    lines.push_back(line);
  }
  return lines;
}

std::string read_all(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    throw PersistenceError("Failed to open daily log: " + path.string());
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    throw PersistenceError("Failed to read daily log: " + path.string());
  }
  return buffer.str();
}

void replace_file(const std::filesystem::path& path, const std::string& content) {
  std::filesystem::path temp_path = path;
  temp_path += ".tmp";
  {
    std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      throw PersistenceError("Failed to open temp file: " + temp_path.string());
    }
    out << content;
    out.flush();
    if (out.fail()) {
      out.close();
      std::error_code cleanup_ec;
      std::filesystem::remove(temp_path, cleanup_ec);
      throw PersistenceError("Write failed for daily log: " + temp_path.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(temp_path, path, ec);
  if (ec) {
    std::error_code cleanup_ec;
    std::filesystem::remove(temp_path, cleanup_ec);
    throw PersistenceError("Failed to replace daily log " + path.string() + ": " + ec.message());
  }
}

}  // namespace

DailyLogMerger::DailyLogMerger(const IngestionContext& context) : context_(context) {}

std::filesystem::path DailyLogMerger::log_path_for(
    std::chrono::system_clock::time_point created_at) const {
  return context_.layout.diary_path() / (file_times::format_local(created_at, "%Y-%m-%d") + ".md");
}

std::string DailyLogMerger::link_line(const std::filesystem::path& note_path) const {
  std::filesystem::path without_extension = note_path;
  without_extension.replace_extension();
  return "- [[" + context_.layout.vault_relative(without_extension) + "]]";
}

std::string DailyLogMerger::new_log(const std::string& date, const std::string& link) {
  return "# " + date + "\n\n" + SECTION_HEADING + "\n" + link + "\n";
}

std::string DailyLogMerger::append_link(const std::string& existing, const std::string& link) {
  std::vector<std::string> lines = split_lines(existing);

  std::size_t heading = lines.size();
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (rtrim(lines[i]) == SECTION_HEADING) {
      heading = i;
      break;
    }
  }

  if (heading == lines.size()) {
    if (!lines.empty()) {
      lines.emplace_back("");
    }
    lines.emplace_back(SECTION_HEADING);
    lines.push_back(link);
  } else {
    // Insert after the last non-blank line of the section
    std::size_t insert_at = heading + 1;
    for (std::size_t i = heading + 1; i < lines.size() && !ends_section(lines[i]); ++i) {
      if (!is_blank(lines[i])) {
        insert_at = i + 1;
      }
    }
    lines.insert(lines.begin() + static_cast<std::ptrdiff_t>(insert_at), link);
  }

  std::string merged;
  for (const auto& line : lines) {
    merged += line;
    merged += '\n';
  }
  return merged;
}

std::filesystem::path DailyLogMerger::merge(std::chrono::system_clock::time_point created_at,
                                            const std::filesystem::path& note_path) {
  const std::filesystem::path log_path = log_path_for(created_at);
  const std::string link = link_line(note_path);

  std::error_code ec;
  std::filesystem::create_directories(log_path.parent_path(), ec);
  if (ec) {
    throw PersistenceError("Failed to create diary folder " + log_path.parent_path().string() +
                           ": " + ec.message());
  }

  const bool log_exists = std::filesystem::exists(log_path, ec);
  if (ec) {
    throw PersistenceError("Failed to check daily log " + log_path.string() + ": " +
                           ec.message());
  }

  std::string content;
  if (log_exists) {
    std::cout << "[DailyLog] Updating daily note: " << log_path.filename().string() << "..."
              << std::endl;
    content = append_link(read_all(log_path), link);
  } else {
    std::cout << "[DailyLog] Creating daily note: " << log_path.filename().string() << "..."
              << std::endl;
    content = new_log(file_times::format_local(created_at, "%Y-%m-%d"), link);
  }

  replace_file(log_path, content);
  return log_path;
}

}  // namespace memo_core
