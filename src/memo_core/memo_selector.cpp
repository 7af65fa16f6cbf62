#include "memo_core/memo_selector.hpp"

#include <iostream>

namespace memo_core {

MemoSelector::MemoSelector(const IngestionContext& context, const ContentHasher& hasher)
    : context_(context), hasher_(hasher) {}

bool MemoSelector::before_date_floor(const MemoFile& memo) const {
  return context_.process_after.has_value() && memo.created_at < *context_.process_after;
}

std::vector<MemoFile> MemoSelector::select(const ProcessedSet& processed) {
  stats_ = SelectionStats{};
  std::vector<MemoFile> selected;

  const std::filesystem::path& source_dir = context_.layout.voice_memos_path;
  std::error_code ec;
  std::filesystem::directory_iterator it(source_dir, ec);
  if (ec) {
    throw PersistenceError("Failed to list voice memos in " + source_dir.string() + ": " +
                           ec.message());
  }

  for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
    const auto& entry = *it;
    if (!has_audio_extension(entry, context_.audio_extension)) {
      continue;
    }
    stats_.scanned++;

    MemoFile memo;
    memo.path = entry.path();
    try {
      memo.created_at = context_.creation_time(memo.path);
    } catch (const std::exception& e) {
      std::cerr << "Warning: Could not stat " << memo.path.filename().string() << ": " << e.what()
                << std::endl;
      stats_.unreadable++;
      continue;
    }

    if (before_date_floor(memo)) {
      stats_.before_date_floor++;
      continue;
    }

    try {
      memo.fingerprint = hasher_.fingerprint(memo.path);
    } catch (const std::exception& e) {
      std::cerr << "Warning: Could not hash " << memo.path.filename().string() << ": " << e.what()
                << std::endl;
      stats_.unreadable++;
      continue;
    }

    if (processed.contains(*memo.fingerprint)) {
      stats_.already_processed++;
      continue;
    }
    selected.push_back(std::move(memo));
  }
  if (ec) {
    throw PersistenceError("Failed while listing voice memos in " + source_dir.string() + ": " +
                           ec.message());
  }

  std::cout << "[Selector] Scanned " << stats_.scanned << " memo(s): " << selected.size()
            << " new, " << stats_.already_processed << " already processed, "
            << stats_.before_date_floor << " before date floor, " << stats_.unreadable
            << " unreadable" << std::endl;
  return selected;
}

}  // namespace memo_core
