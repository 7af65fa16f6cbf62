#include "memo_core/vault/note_writer.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>

#include "memo_core/errors.hpp"
#include "memo_core/file_times.hpp"
#include "memo_core/vault/filename_sanitizer.hpp"

namespace memo_core {

namespace {
constexpr const char* FILENAME_TIMESTAMP = "%Y%m%d_%H%M%S";
}

NoteWriter::NoteWriter(const IngestionContext& context) : context_(context) {}

std::filesystem::path NoteWriter::unique_path(const std::filesystem::path& dir,
                                              const std::string& stem,
                                              const std::string& extension) {
  std::filesystem::path candidate = dir / (stem + extension);
  int suffix = 1;
  std::error_code ec;
  while (std::filesystem::exists(candidate, ec)) {
    candidate = dir / (stem + "_" + std::to_string(suffix++) + extension);
  }
  return candidate;
}

std::filesystem::path NoteWriter::store_audio(const MemoFile& memo,
                                              const std::string& filename_summary) {
  const std::string stem = file_times::format_local(context_.now(), FILENAME_TIMESTAMP) + "_" +
                           sanitize_filename(filename_summary);
  const std::filesystem::path destination =
      unique_path(context_.layout.attachments_path(), stem, memo.path.extension().string());

  std::cout << "[NoteWriter] Copying audio file to " << destination.filename().string() << "..."
            << std::endl;

  std::error_code ec;
  std::filesystem::copy_file(memo.path, destination, std::filesystem::copy_options::none, ec);
  if (ec) {
    // A copy that failed partway leaves a truncated file; an existing one is not ours to remove
    if (ec != std::errc::file_exists) {
      std::error_code cleanup_ec;
      std::filesystem::remove(destination, cleanup_ec);
    }
    throw PersistenceError("Failed to copy " + memo.path.string() + " to " +
                           destination.string() + ": " + ec.message());
  }

  // Keep the original modification time on the copy
  auto source_mtime = std::filesystem::last_write_time(memo.path, ec);
  if (!ec) {
    std::filesystem::last_write_time(destination, source_mtime, ec);
  }
  if (ec) {
    std::cerr << "Warning: Could not preserve modification time on "
              << destination.filename().string() << ": " << ec.message() << std::endl;
  }
  return destination;
}

std::string NoteWriter::render_note(const std::string& title,
                                    const std::string& summary,
                                    const std::string& transcript,
                                    const std::string& audio_reference,
                                    std::chrono::system_clock::time_point created_at) {
  std::ostringstream note;
  note << "# " << title << "\n"
       << "\n"
       << "**Date:** " << file_times::format_local(created_at, "%Y-%m-%d %H:%M:%S") << "\n"
       << "**Audio:** [[" << audio_reference << "]]\n"
       << "\n"
       << "## Summary\n"
       << summary << "\n"
       << "\n"
       << "## Transcription\n"
       << transcript << "\n"
       << "\n"
       << "---\n"
       << "*Generated automatically from voice memo*\n";
  return note.str();
}

std::filesystem::path NoteWriter::write_note(const MemoFile& memo,
                                             const SummaryResult& summary,
                                             const std::string& transcript,
                                             const std::filesystem::path& stored_audio) {
  const std::string stem = file_times::format_local(memo.created_at, FILENAME_TIMESTAMP) + "_" +
                           sanitize_filename(summary.title);
  const std::filesystem::path note_path = unique_path(context_.layout.notes_path(), stem, ".md");

  const std::string content =
      render_note(summary.title, summary.summary, transcript,
                  context_.layout.vault_relative(stored_audio), memo.created_at);

  std::cout << "[NoteWriter] Creating note: " << note_path.filename().string() << "..."
            << std::endl;

  {
    std::ofstream out(note_path, std::ios::binary);
    if (!out.is_open()) {
      throw PersistenceError("Failed to open note for writing: " + note_path.string());
    }
    out << content;
    out.flush();
    if (!out.fail()) {
      return note_path;
    }
  }

  std::error_code ec;
  std::filesystem::remove(note_path, ec);
  throw PersistenceError("Failed to write note: " + note_path.string());
}

}  // namespace memo_core
