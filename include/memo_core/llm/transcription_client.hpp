#pragma once

#include <string>

namespace memo_core {

class TranscriptionClient {
 public:
  virtual ~TranscriptionClient() = default;

  /**
   * @brief Converts raw audio bytes into transcript text.
   * @param audio_bytes Full content of the audio file.
   * @param filename Name sent alongside the upload so the service can infer the container format.
   * @return The transcript, possibly empty when nothing was spoken.
   * @throws ServiceError on transport failure or an error response.
   */
  virtual std::string transcribe(const std::string& audio_bytes, const std::string& filename) = 0;
};

}  // namespace memo_core
