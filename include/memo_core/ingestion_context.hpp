#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

#include "memo_core/file_times.hpp"

namespace memo_core {

// Where everything lives. Folder members are relative to vault_root.
struct VaultLayout {
  std::filesystem::path vault_root;
  std::filesystem::path attachments_folder = "attachments";
  std::filesystem::path diary_folder = "diary";
  std::filesystem::path notes_folder = "notes/memos";
  std::filesystem::path voice_memos_path;

  std::filesystem::path attachments_path() const {
    return vault_root / attachments_folder;
  }
  std::filesystem::path diary_path() const {
    return vault_root / diary_folder;
  }
  std::filesystem::path notes_path() const {
    return vault_root / notes_folder;
  }

  // Forward-slash path of `p` relative to the vault root, as used inside [[links]]
  std::string vault_relative(const std::filesystem::path& p) const {
    return std::filesystem::relative(p, vault_root).generic_string();
  }
};

using Clock = std::function<std::chrono::system_clock::time_point()>;
using CreationTimeProvider =
    std::function<std::chrono::system_clock::time_point(const std::filesystem::path&)>;

/**
 * @brief Everything one ingestion run needs to know, built once and passed by reference.
 *
 * The clock and creation-time provider default to the real system; tests swap them to pin
 * filenames and dates.
 */
struct IngestionContext {
  VaultLayout layout;
  std::string audio_extension = ".m4a";
  // Memos created before local midnight of this day are ignored
  std::optional<std::chrono::system_clock::time_point> process_after;

  Clock now = [] { return std::chrono::system_clock::now(); };
  CreationTimeProvider creation_time = [](const std::filesystem::path& p) {
    return file_times::creation_time(p).time;
  };
};

}  // namespace memo_core
