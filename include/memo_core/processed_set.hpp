#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <unordered_set>

#include "memo_core/hashing/content_hasher.hpp"
#include "memo_core/types/memo.hpp"

namespace memo_core {

/**
 * @brief Fingerprints of every audio file already sitting in the attachment store.
 *
 * Rebuilt from disk at the start of each run and grown in memory as memos finish. It is
 * never written anywhere: the stored audio files are the durable record.
 */
class ProcessedSet {
 public:
  ProcessedSet() = default;

  /**
   * @brief Hashes every `extension` file directly inside `attachments_dir`.
   *
   * Files that fail to hash are logged and left out, so the set can only under-report.
   * A missing directory gives an empty set.
   */
  static ProcessedSet build(const std::filesystem::path& attachments_dir,
                            const std::string& extension,
                            const ContentHasher& hasher);

  bool contains(const Fingerprint& fingerprint) const;
  void add(const Fingerprint& fingerprint);
  std::size_t size() const;

  // Number of store files that could not be hashed during build()
  std::size_t skipped_during_build() const {
    return skipped_;
  }

 private:
  std::unordered_set<Fingerprint> fingerprints_;
  std::size_t skipped_ = 0;
};

// True for a regular file whose extension equals `extension` exactly
bool has_audio_extension(const std::filesystem::directory_entry& entry,
                         const std::string& extension);

}  // namespace memo_core
