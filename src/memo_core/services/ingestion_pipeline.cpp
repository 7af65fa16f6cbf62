#include "memo_core/services/ingestion_pipeline.hpp"

#include <cctype>
#include <fstream>
#include <iostream>
#include <sstream>

#include "memo_core/errors.hpp"

namespace memo_core {

IngestionPipeline::IngestionPipeline(const IngestionContext& context,
                                     std::shared_ptr<ContentHasher> hasher,
                                     std::shared_ptr<TranscriptionClient> transcription_client,
                                     std::shared_ptr<SummaryClient> summary_client,
                                     std::shared_ptr<NoteWriter> note_writer,
                                     std::shared_ptr<DailyLogMerger> daily_log_merger)
    : context_(context),
      hasher_(std::move(hasher)),
      transcription_client_(std::move(transcription_client)),
      summary_client_(std::move(summary_client)),
      note_writer_(std::move(note_writer)),
      daily_log_merger_(std::move(daily_log_merger)),
      selector_(context_, *hasher_) {}

void IngestionPipeline::prepare() {
  const VaultLayout& layout = context_.layout;
  for (const auto& dir : {layout.attachments_path(), layout.notes_path(), layout.diary_path()}) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
      throw PersistenceError("Failed to create folder " + dir.string() + ": " + ec.message());
    }
  }
}

ProcessedSet IngestionPipeline::load_processed_set() const {
  return ProcessedSet::build(context_.layout.attachments_path(), context_.audio_extension,
                             *hasher_);
}

std::vector<MemoFile> IngestionPipeline::pending(const ProcessedSet& processed) {
  return selector_.select(processed);
}

RunReport IngestionPipeline::run(ProcessedSet& processed) {
  RunReport report;
  std::vector<MemoFile> memos = selector_.select(processed);
  report.selection = selector_.last_stats();

  if (memos.empty()) {
    std::cout << "[Pipeline] No new memos to process." << std::endl;
    return report;
  }
  std::cout << "[Pipeline] Found " << memos.size() << " unprocessed memo(s)" << std::endl;

  for (const auto& memo : memos) {
    MemoOutcome outcome = process_memo(memo, processed);
    switch (outcome.status) {
      case MemoStage::Linked:
        report.linked++;
        break;
      case MemoStage::Skipped:
        report.skipped++;
        break;
      default:
        report.failed++;
        break;
    }
    report.outcomes.push_back(std::move(outcome));
  }
  return report;
}

MemoOutcome IngestionPipeline::process_memo(const MemoFile& memo, ProcessedSet& processed) {
  const std::string name = memo.path.filename().string();
  std::cout << "[Pipeline] Processing: " << name << std::endl;
  notify(memo, MemoStage::Selected);

  MemoStage stage = MemoStage::Selected;
  std::vector<std::filesystem::path> created;

  auto fail = [&](ErrorKind kind, const std::string& message) {
    std::cerr << "[Pipeline] Error processing " << name << " while " << to_string(stage) << " ("
              << to_string(kind) << "): " << message << std::endl;
    rollback(created);
    notify(memo, MemoStage::Failed);
    return MemoOutcome::failure_response(memo.path, stage, kind, message);
  };

  try {
    Fingerprint fingerprint =
        memo.fingerprint.has_value() ? *memo.fingerprint : hasher_->fingerprint(memo.path);

    // A second copy of a recording already linked earlier in this run
    if (processed.contains(fingerprint)) {
      std::cout << "[Pipeline] Same content already processed, skipping " << name << std::endl;
      notify(memo, MemoStage::Skipped);
      return MemoOutcome::skipped_response(memo.path, "Already processed");
    }

    stage = MemoStage::Transcribing;
    notify(memo, stage);
    std::cout << "[Pipeline] Transcribing " << name << "..." << std::endl;
    const std::string transcript =
        transcription_client_->transcribe(read_memo_bytes(memo.path), name);

    if (is_blank(transcript)) {
      std::cout << "[Pipeline] Empty transcription, skipping " << name << std::endl;
      notify(memo, MemoStage::Skipped);
      return MemoOutcome::skipped_response(memo.path, "Empty transcription");
    }

    stage = MemoStage::Summarizing;
    notify(memo, stage);
    std::cout << "[Pipeline] Generating summary and title..." << std::endl;
    const SummaryResult summary = summary_client_->summarize(transcript);

    stage = MemoStage::Persisting;
    notify(memo, stage);
    const std::filesystem::path audio_path =
        note_writer_->store_audio(memo, summary.filename_summary);
    created.push_back(audio_path);
    const std::filesystem::path note_path =
        note_writer_->write_note(memo, summary, transcript, audio_path);
    created.push_back(note_path);

    daily_log_merger_->merge(memo.created_at, note_path);

    processed.add(fingerprint);
    notify(memo, MemoStage::Linked);
    std::cout << "[Pipeline] Successfully processed " << name << std::endl;
    return MemoOutcome::linked_response(memo.path, note_path, audio_path);

  } catch (const MemoError& e) {
    return fail(e.kind(), e.what());
  } catch (const std::filesystem::filesystem_error& e) {
    return fail(ErrorKind::Persistence, e.what());
  } catch (const std::exception& e) {
    return fail(ErrorKind::Unexpected, e.what());
  }
}

void IngestionPipeline::notify(const MemoFile& memo, MemoStage stage) const {
  if (observer_) {
    observer_(memo, stage);
  }
}

std::string IngestionPipeline::read_memo_bytes(const std::filesystem::path& path) {
  std::ifstream file_stream(path, std::ios::binary);
  if (!file_stream.is_open()) {
    throw PersistenceError("Could not open memo: " + path.string());
  }
  std::stringstream buffer;
  buffer << file_stream.rdbuf();
  if (file_stream.bad()) {
    throw PersistenceError("Could not read memo: " + path.string());
  }
  return buffer.str();
}

bool IngestionPipeline::is_blank(const std::string& text) {
  for (unsigned char c : text) {
    if (!std::isspace(c)) {
      return false;
    }
  }
  return true;
}

void IngestionPipeline::rollback(const std::vector<std::filesystem::path>& created) {
  for (auto it = created.rbegin(); it != created.rend(); ++it) {
    std::error_code ec;
    std::filesystem::remove(*it, ec);
    if (ec) {
      std::cerr << "Warning: Could not roll back " << it->string() << ": " << ec.message()
                << std::endl;
    } else {
      std::cout << "[Pipeline] Rolled back " << it->filename().string() << std::endl;
    }
  }
}

}  // namespace memo_core
