#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <vector>

#include "memo_core/hashing/content_hasher.hpp"
#include "memo_core/ingestion_context.hpp"
#include "memo_core/llm/summary_client.hpp"
#include "memo_core/llm/transcription_client.hpp"
#include "memo_core/memo_selector.hpp"
#include "memo_core/processed_set.hpp"
#include "memo_core/types/memo.hpp"
#include "memo_core/vault/daily_log_merger.hpp"
#include "memo_core/vault/note_writer.hpp"

namespace memo_core {

struct RunReport {
  std::vector<MemoOutcome> outcomes;
  SelectionStats selection;
  std::size_t linked = 0;
  std::size_t skipped = 0;
  std::size_t failed = 0;

  bool has_failures() const {
    return failed > 0;
  }
};

// Called on every state change of a memo, for progress display
using StageObserver = std::function<void(const MemoFile& memo, MemoStage stage)>;

/**
 * @brief Runs transcribe -> summarize -> persist -> link for each new memo, one at a time.
 *
 * A memo's fingerprint joins the ProcessedSet only once its daily-log link is written. Any
 * failure is confined to the memo it happened on: files created for that memo are removed
 * again and the run moves on to the next one.
 */
class IngestionPipeline {
 public:
  IngestionPipeline(const IngestionContext& context,
                    std::shared_ptr<ContentHasher> hasher,
                    std::shared_ptr<TranscriptionClient> transcription_client,
                    std::shared_ptr<SummaryClient> summary_client,
                    std::shared_ptr<NoteWriter> note_writer,
                    std::shared_ptr<DailyLogMerger> daily_log_merger);

  virtual ~IngestionPipeline() = default;

  // Creates the attachment, notes and diary folders. Throws PersistenceError on failure.
  void prepare();

  ProcessedSet load_processed_set() const;

  // The memos a run would process, without processing them
  std::vector<MemoFile> pending(const ProcessedSet& processed);

  RunReport run(ProcessedSet& processed);

  MemoOutcome process_memo(const MemoFile& memo, ProcessedSet& processed);

  void set_stage_observer(StageObserver observer) {
    observer_ = std::move(observer);
  }

  const SelectionStats& last_selection() const {
    return selector_.last_stats();
  }

 private:
  void notify(const MemoFile& memo, MemoStage stage) const;
  static std::string read_memo_bytes(const std::filesystem::path& path);
  static bool is_blank(const std::string& text);
  static void rollback(const std::vector<std::filesystem::path>& created);

  const IngestionContext& context_;
  std::shared_ptr<ContentHasher> hasher_;
  std::shared_ptr<TranscriptionClient> transcription_client_;
  std::shared_ptr<SummaryClient> summary_client_;
  std::shared_ptr<NoteWriter> note_writer_;
  std::shared_ptr<DailyLogMerger> daily_log_merger_;
  MemoSelector selector_;
  StageObserver observer_;
};

}  // namespace memo_core
