#pragma once

#include <filesystem>
#include <string>

#include "memo_core/types/memo.hpp"

namespace memo_core {

/**
 * @brief Computes the dedup fingerprint of a file from its full byte content.
 *
 * The digest is MD5 through the OpenSSL EVP interface. It identifies content for
 * deduplication only and carries no integrity guarantee.
 */
class ContentHasher {
 public:
  ContentHasher() = default;
  virtual ~ContentHasher() = default;

  /**
   * @brief Streams the file and returns its hex digest.
   * @throws HashingError if the file cannot be opened or read.
   */
  virtual Fingerprint fingerprint(const std::filesystem::path& file_path) const;

  // Digest of an in-memory buffer
  Fingerprint fingerprint_bytes(const std::string& content) const;

 private:
  static constexpr std::size_t READ_BUFFER_SIZE = 64 * 1024;
};

}  // namespace memo_core
