#include "memo_core/processed_set.hpp"

#include <iostream>

namespace memo_core {

bool has_audio_extension(const std::filesystem::directory_entry& entry,
                         const std::string& extension) {
  std::error_code ec;
  if (!entry.is_regular_file(ec)) {
    return false;
  }
  return entry.path().extension().string() == extension;
}

ProcessedSet ProcessedSet::build(const std::filesystem::path& attachments_dir,
                                 const std::string& extension,
                                 const ContentHasher& hasher) {
  ProcessedSet set;

  std::error_code ec;
  if (!std::filesystem::is_directory(attachments_dir, ec)) {
    std::cout << "[ProcessedSet] Attachment store " << attachments_dir.string()
              << " does not exist yet, starting empty" << std::endl;
    return set;
  }

  std::filesystem::directory_iterator it(attachments_dir, ec);
  if (ec) {
    throw PersistenceError("Failed to list attachment store " + attachments_dir.string() + ": " +
                           ec.message());
  }
  while (it != std::filesystem::directory_iterator()) {
    const auto& entry = *it;
    if (has_audio_extension(entry, extension)) {
      try {
        set.add(hasher.fingerprint(entry.path()));
      } catch (const std::exception& e) {
        std::cerr << "Warning: Could not hash " << entry.path().filename().string() << ": "
                  << e.what() << std::endl;
        set.skipped_++;
      }
    }
    it.increment(ec);
    if (ec) {
      throw PersistenceError("Failed to list attachment store " + attachments_dir.string() +
                             ": " + ec.message());
    }
  }

  std::cout << "[ProcessedSet] Found " << set.size()
            << " existing audio files in attachments folder" << std::endl;
  return set;
}

bool ProcessedSet::contains(const Fingerprint& fingerprint) const {
  return fingerprints_.count(fingerprint) > 0;
}

void ProcessedSet::add(const Fingerprint& fingerprint) {
  fingerprints_.insert(fingerprint);
}

std::size_t ProcessedSet::size() const {
  return fingerprints_.size();
}

}  // namespace memo_core
