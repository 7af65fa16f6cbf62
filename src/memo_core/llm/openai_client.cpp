#include "memo_core/llm/openai_client.hpp"

#include <memory>

#include "memo_core/errors.hpp"

namespace memo_core {

const char *OpenAIClient::SYSTEM_PROMPT =
    "You are a helpful assistant that creates concise summaries and titles for voice memos.";

namespace {

using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;
using MimeForm = std::unique_ptr<curl_mime, decltype(&curl_mime_free)>;

std::string summary_user_prompt(const std::string &transcript) {
  return "Based on this transcription, provide:\n"
         "1. A one-line summary (max 50 characters, suitable for a filename)\n"
         "2. A longer summary (2-3 sentences)\n"
         "3. A title for the note\n"
         "\n"
         "Transcription:\n" +
         transcript +
         "\n\nPlease respond in JSON format with keys: \"filename_summary\", \"summary\", "
         "\"title\".";
}

std::string required_string(const nlohmann::json &object, const char *key) {
  if (!object.contains(key) || !object[key].is_string()) {
    throw ServiceError(std::string("Summary response is missing string field '") + key + "'");
  }
  return object[key].get<std::string>();
}

}  // namespace

OpenAIClient::OpenAIClient(OpenAIConfig config)
    : config_(std::move(config)), curl_handle_(nullptr) {
  setup_curl_handle();
}

OpenAIClient::~OpenAIClient() {
  if (curl_handle_) {
    curl_easy_cleanup(curl_handle_);
  }
}

OpenAIClient::OpenAIClient(OpenAIClient &&other) noexcept
    : config_(std::move(other.config_)), curl_handle_(other.curl_handle_) {
  other.curl_handle_ = nullptr;
}

OpenAIClient &OpenAIClient::operator=(OpenAIClient &&other) noexcept {
  if (this != &other) {
    if (curl_handle_) {
      curl_easy_cleanup(curl_handle_);
    }
    config_ = std::move(other.config_);
    curl_handle_ = other.curl_handle_;
    other.curl_handle_ = nullptr;
  }
  return *this;
}

void OpenAIClient::setup_curl_handle() {
  curl_handle_ = curl_easy_init();
  if (!curl_handle_) {
    throw ServiceError("Failed to initialize CURL");
  }
}

size_t OpenAIClient::write_callback(void *contents, size_t size, size_t nmemb,
                                    std::string *userp) {
  userp->append(static_cast<char *>(contents), size * nmemb);
  return size * nmemb;
}

std::string OpenAIClient::build_url(const std::string &endpoint) const {
  std::string base = config_.base_url;
  while (!base.empty() && base.back() == '/') {
    base.pop_back();
  }
  return base + endpoint;
}

void OpenAIClient::apply_common_options(const std::string &url, std::string &response_buffer) {
  curl_easy_reset(curl_handle_);
  curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response_buffer);
  if (config_.request_timeout_seconds > 0) {
    curl_easy_setopt(curl_handle_, CURLOPT_TIMEOUT, config_.request_timeout_seconds);
  }
}

long OpenAIClient::perform(const std::string &what) {
  CURLcode res = curl_easy_perform(curl_handle_);
  if (res != CURLE_OK) {
    throw ServiceError(what + " request failed: " + std::string(curl_easy_strerror(res)));
  }
  long http_code = 0;
  curl_easy_getinfo(curl_handle_, CURLINFO_RESPONSE_CODE, &http_code);
  return http_code;
}

std::string OpenAIClient::transcribe(const std::string &audio_bytes, const std::string &filename) {
  if (!curl_handle_) {
    throw ServiceError("CURL handle not initialized");
  }

  std::string response_buffer;
  apply_common_options(build_url("/audio/transcriptions"), response_buffer);

  MimeForm form(curl_mime_init(curl_handle_), &curl_mime_free);
  if (!form) {
    throw ServiceError("Failed to create multipart form for transcription");
  }
  curl_mimepart *file_part = curl_mime_addpart(form.get());
  curl_mime_name(file_part, "file");
  curl_mime_data(file_part, audio_bytes.data(), audio_bytes.size());
  curl_mime_filename(file_part, filename.c_str());

  curl_mimepart *model_part = curl_mime_addpart(form.get());
  curl_mime_name(model_part, "model");
  curl_mime_data(model_part, config_.transcription_model.c_str(), CURL_ZERO_TERMINATED);

  curl_mimepart *format_part = curl_mime_addpart(form.get());
  curl_mime_name(format_part, "response_format");
  curl_mime_data(format_part, "text", CURL_ZERO_TERMINATED);

  const std::string auth = "Authorization: Bearer " + config_.api_key;
  HeaderList headers(curl_slist_append(nullptr, auth.c_str()), &curl_slist_free_all);
  curl_easy_setopt(curl_handle_, CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl_handle_, CURLOPT_MIMEPOST, form.get());

  long http_code = perform("Transcription");
  if (http_code != 200) {
    throw ServiceError("Transcription failed with status code " + std::to_string(http_code) +
                       ": " + describe_error_body(response_buffer));
  }
  return response_buffer;
}

nlohmann::json OpenAIClient::build_summary_request(const std::string &transcript) const {
  return {
      {"model", config_.summary_model},
      {"messages",
       nlohmann::json::array({
           {{"role", "system"}, {"content", SYSTEM_PROMPT}},
           {{"role", "user"}, {"content", summary_user_prompt(transcript)}},
       })},
      {"response_format", {{"type", "json_object"}}},
  };
}

SummaryResult OpenAIClient::summarize(const std::string &transcript) {
  if (!curl_handle_) {
    throw ServiceError("CURL handle not initialized");
  }

  const std::string request_json = build_summary_request(transcript).dump();
  std::string response_buffer;
  apply_common_options(build_url("/chat/completions"), response_buffer);

  const std::string auth = "Authorization: Bearer " + config_.api_key;
  HeaderList headers(curl_slist_append(nullptr, "Content-Type: application/json"),
                     &curl_slist_free_all);
  headers.reset(curl_slist_append(headers.release(), auth.c_str()));
  curl_easy_setopt(curl_handle_, CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDS, request_json.c_str());

  long http_code = perform("Summary");
  if (http_code != 200) {
    throw ServiceError("Summary failed with status code " + std::to_string(http_code) + ": " +
                       describe_error_body(response_buffer));
  }

  nlohmann::json response = nlohmann::json::parse(response_buffer, nullptr, false);
  if (response.is_discarded()) {
    throw ServiceError("Summary response is not valid JSON");
  }
  return parse_summary_response(response);
}

SummaryResult OpenAIClient::parse_summary_response(const nlohmann::json &response) {
  if (!response.contains("choices") || !response["choices"].is_array() ||
      response["choices"].empty()) {
    throw ServiceError("Summary response has no choices");
  }
  const auto &choice = response["choices"][0];
  if (!choice.is_object() || !choice.contains("message") || !choice["message"].is_object()) {
    throw ServiceError("Summary response choice has no message");
  }
  const auto &message = choice["message"];
  if (!message.contains("content") || !message["content"].is_string()) {
    throw ServiceError("No content in API response");
  }

  nlohmann::json content =
      nlohmann::json::parse(message["content"].get<std::string>(), nullptr, false);
  if (content.is_discarded() || !content.is_object()) {
    throw ServiceError("Summary content is not a JSON object");
  }

  SummaryResult result;
  result.title = required_string(content, "title");
  result.filename_summary = required_string(content, "filename_summary");
  result.summary = required_string(content, "summary");
  return result;
}

std::string OpenAIClient::describe_error_body(const std::string &body) {
  nlohmann::json parsed = nlohmann::json::parse(body, nullptr, false);
  if (!parsed.is_discarded() && parsed.is_object() && parsed.contains("error")) {
    const auto &error = parsed["error"];
    if (error.is_object() && error.contains("message") && error["message"].is_string()) {
      return error["message"].get<std::string>();
    }
    if (error.is_string()) {
      return error.get<std::string>();
    }
  }
  return body;
}

}  // namespace memo_core
