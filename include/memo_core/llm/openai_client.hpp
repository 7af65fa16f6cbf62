#pragma once

#include <curl/curl.h>

#include <nlohmann/json.hpp>
#include <string>

#include "memo_core/llm/summary_client.hpp"
#include "memo_core/llm/transcription_client.hpp"

namespace memo_core {

struct OpenAIConfig {
  std::string api_key;
  std::string base_url = "https://api.openai.com/v1";
  std::string transcription_model = "whisper-1";
  std::string summary_model = "gpt-4o-mini";
  // 0 leaves requests unbounded
  long request_timeout_seconds = 0;
};

/**
 * @brief Adapter for an OpenAI-compatible HTTP API, serving both transcription and summary.
 *
 * Owns a single libcurl easy handle, so an instance must not be shared between threads.
 */
class OpenAIClient : public TranscriptionClient, public SummaryClient {
 public:
  explicit OpenAIClient(OpenAIConfig config);
  ~OpenAIClient() override;

  // Disable copy constructor and assignment
  OpenAIClient(const OpenAIClient &) = delete;
  OpenAIClient &operator=(const OpenAIClient &) = delete;

  OpenAIClient(OpenAIClient &&) noexcept;
  OpenAIClient &operator=(OpenAIClient &&) noexcept;

  std::string transcribe(const std::string &audio_bytes, const std::string &filename) override;
  SummaryResult summarize(const std::string &transcript) override;

  // Request body for the chat completion used by summarize()
  nlohmann::json build_summary_request(const std::string &transcript) const;

  // Pulls the JSON object out of a chat completion and checks the three required fields
  static SummaryResult parse_summary_response(const nlohmann::json &response);

  // Best-effort extraction of `error.message` from an error body, else the raw body
  static std::string describe_error_body(const std::string &body);

  static const char *SYSTEM_PROMPT;

 private:
  OpenAIConfig config_;
  CURL *curl_handle_;

  void setup_curl_handle();
  void apply_common_options(const std::string &url, std::string &response_buffer);
  long perform(const std::string &what);
  std::string build_url(const std::string &endpoint) const;
  static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
};

}  // namespace memo_core
