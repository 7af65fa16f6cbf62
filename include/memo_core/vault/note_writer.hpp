#pragma once

#include <chrono>
#include <filesystem>
#include <string>

#include "memo_core/ingestion_context.hpp"
#include "memo_core/types/memo.hpp"

namespace memo_core {

/**
 * @brief Writes the two per-memo artifacts: the audio copy and the Markdown note.
 *
 * Neither artifact ever replaces an existing file. When a name is taken a numeric suffix
 * (_1, _2, ...) is added before the extension.
 */
class NoteWriter {
 public:
  explicit NoteWriter(const IngestionContext& context);
  virtual ~NoteWriter() = default;

  /**
   * @brief Copies the memo into the attachment store as
   *        {ingestion timestamp}_{sanitized filename_summary}{ext}.
   * @return Absolute path of the stored copy.
   * @throws PersistenceError if the copy cannot be made.
   */
  virtual std::filesystem::path store_audio(const MemoFile& memo,
                                            const std::string& filename_summary);

  /**
   * @brief Writes {creation timestamp}_{sanitized title}.md into the notes folder.
   * @return Absolute path of the note.
   * @throws PersistenceError if the note cannot be written.
   */
  virtual std::filesystem::path write_note(const MemoFile& memo,
                                           const SummaryResult& summary,
                                           const std::string& transcript,
                                           const std::filesystem::path& stored_audio);

  static std::string render_note(const std::string& title,
                                 const std::string& summary,
                                 const std::string& transcript,
                                 const std::string& audio_reference,
                                 std::chrono::system_clock::time_point created_at);

  // First of dir/stem+ext, dir/stem_1+ext, ... that does not exist yet
  static std::filesystem::path unique_path(const std::filesystem::path& dir,
                                           const std::string& stem,
                                           const std::string& extension);

 private:
  const IngestionContext& context_;
};

}  // namespace memo_core
