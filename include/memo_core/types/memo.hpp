#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

#include "memo_core/errors.hpp"

namespace memo_core {

// Lowercase hex digest of a file's full byte content
using Fingerprint = std::string;

struct MemoFile {
  std::filesystem::path path;
  std::chrono::system_clock::time_point created_at;
  // Filled in by the selector so the pipeline never hashes a memo twice
  std::optional<Fingerprint> fingerprint;
};

struct SummaryResult {
  std::string title;
  std::string filename_summary;
  std::string summary;
};

// Per-memo state machine. Linked, Skipped and Failed are terminal.
enum class MemoStage { Selected, Transcribing, Summarizing, Persisting, Linked, Skipped, Failed };

std::string to_string(MemoStage stage);

struct MemoOutcome {
  std::filesystem::path memo_path;
  MemoStage status;
  // Stage that was running when the memo failed
  MemoStage failed_stage;
  std::optional<ErrorKind> error_kind;
  std::string error_message;
  std::filesystem::path note_path;
  std::filesystem::path audio_path;

  static MemoOutcome linked_response(const std::filesystem::path& memo,
                                     const std::filesystem::path& note,
                                     const std::filesystem::path& audio) {
    return {memo, MemoStage::Linked, MemoStage::Linked, std::nullopt, "", note, audio};
  }

  static MemoOutcome skipped_response(const std::filesystem::path& memo,
                                      const std::string& reason) {
    return {memo, MemoStage::Skipped, MemoStage::Skipped, std::nullopt, reason, {}, {}};
  }

  static MemoOutcome failure_response(const std::filesystem::path& memo,
                                      MemoStage stage,
                                      ErrorKind kind,
                                      const std::string& error) {
    return {memo, MemoStage::Failed, stage, kind, error, {}, {}};
  }

  bool succeeded() const {
    return status == MemoStage::Linked;
  }
};

}  // namespace memo_core
