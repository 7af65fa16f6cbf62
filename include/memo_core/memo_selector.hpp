#pragma once

#include <cstddef>
#include <filesystem>
#include <vector>

#include "memo_core/hashing/content_hasher.hpp"
#include "memo_core/ingestion_context.hpp"
#include "memo_core/processed_set.hpp"
#include "memo_core/types/memo.hpp"

namespace memo_core {

struct SelectionStats {
  std::size_t scanned = 0;
  std::size_t before_date_floor = 0;
  std::size_t already_processed = 0;
  std::size_t unreadable = 0;
};

/**
 * @brief Builds the work list for a run from the voice memo directory.
 *
 * Order follows directory enumeration, which the filesystem does not define. The date floor
 * is checked before hashing so files outside the window are never read.
 */
class MemoSelector {
 public:
  MemoSelector(const IngestionContext& context, const ContentHasher& hasher);

  std::vector<MemoFile> select(const ProcessedSet& processed);

  const SelectionStats& last_stats() const {
    return stats_;
  }

 private:
  bool before_date_floor(const MemoFile& memo) const;

  const IngestionContext& context_;
  const ContentHasher& hasher_;
  SelectionStats stats_;
};

}  // namespace memo_core
