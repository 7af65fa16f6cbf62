#pragma once

#include <functional>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "memo_core/ingestion_context.hpp"
#include "memo_core/llm/openai_client.hpp"

namespace memo_cli {

// Looks up one environment variable; std::nullopt when unset
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

std::optional<std::string> process_environment(const std::string& name);

class Config {
 public:
  std::string openai_api_key;
  std::string openai_base_url;
  std::string transcription_model;
  std::string summary_model;
  long request_timeout_seconds = 0;

  std::string vault_path;
  std::string attachments_folder;
  std::string diary_folder;
  std::string notes_folder;
  std::string voice_memos_path;
  std::string audio_extension;

  // YYYY-MM-DD, empty when no date floor is configured
  std::string process_after_date;

  static constexpr const char* DEFAULT_CONFIG_FILE = "memovaultrc.json";

  // Load configuration from a JSON file at the given path. Does not validate.
  static Config from_file(const std::string& filename);

  // Construct configuration from a JSON object, applying defaults. Does not validate.
  static Config from_json(const nlohmann::json& json_config);

  /**
   * @brief Optional JSON file, then environment overrides, then validation.
   *
   * A missing file at `filename` is only an error when `file_required` is set.
   * @throws memo_core::ConfigurationError for any unusable setting.
   */
  static Config load(const std::string& filename, bool file_required, const EnvLookup& env);

  // Overwrites every key that has its environment variable set
  void apply_environment(const EnvLookup& env);

  // @throws memo_core::ConfigurationError naming the first bad setting
  void validate() const;

  memo_core::OpenAIConfig openai_config() const;
  memo_core::VaultLayout vault_layout() const;
  // Only meaningful after validate()
  memo_core::IngestionContext ingestion_context() const;

  // One line per supported setting, for the help text and configuration error hints
  static std::string settings_help();
};

}  // namespace memo_cli
