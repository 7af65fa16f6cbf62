#include "memo_cli/config.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

#include "memo_core/errors.hpp"
#include "memo_core/file_times.hpp"

namespace memo_cli {

using memo_core::ConfigurationError;

namespace {

struct Setting {
  const char* json_key;
  const char* env_var;
  const char* description;
};

const Setting SETTINGS[] = {
    {"openai_api_key", "OPENAI_API_KEY", "API key for the transcription and summary service"},
    {"openai_base_url", "OPENAI_BASE_URL", "(optional) default https://api.openai.com/v1"},
    {"transcription_model", "MEMO_TRANSCRIPTION_MODEL", "(optional) default whisper-1"},
    {"summary_model", "MEMO_SUMMARY_MODEL", "(optional) default gpt-4o-mini"},
    {"request_timeout_seconds", "MEMO_REQUEST_TIMEOUT_SECONDS", "(optional) 0 means no timeout"},
    {"vault_path", "OBSIDIAN_VAULT_PATH", "existing vault root directory"},
    {"attachments_folder", "OBSIDIAN_ATTACHMENTS_FOLDER", "(optional) default attachments"},
    {"diary_folder", "OBSIDIAN_DIARY_FOLDER", "(optional) default diary"},
    {"notes_folder", "OBSIDIAN_NOTES_FOLDER", "(optional) default notes/memos"},
    {"voice_memos_path", "VOICE_MEMOS_PATH", "existing directory holding the recordings"},
    {"audio_extension", "MEMO_AUDIO_EXTENSION", "(optional) default .m4a"},
    {"process_after_date", "PROCESS_FILES_AFTER_DATE", "(optional, format: YYYY-MM-DD)"},
};

void require_relative_folder(const std::string& key, const std::string& value) {
  if (value.empty()) {
    throw ConfigurationError(key + " cannot be empty");
  }
  if (std::filesystem::path(value).is_absolute()) {
    throw ConfigurationError(key + " must be relative to the vault: " + value);
  }
}

void require_directory(const std::string& key, const std::string& value) {
  if (value.empty()) {
    throw ConfigurationError(key + " is not set");
  }
  std::error_code ec;
  if (!std::filesystem::is_directory(value, ec)) {
    throw ConfigurationError(key + " '" + value + "' does not exist");
  }
}

}  // namespace

std::optional<std::string> process_environment(const std::string& name) {
  const char* value = std::getenv(name.c_str());
  if (value == nullptr) {
    return std::nullopt;
  }
  return std::string(value);
}

Config Config::from_file(const std::string& filename) {
  std::ifstream file_stream(filename);
  if (!file_stream.is_open()) {
    throw ConfigurationError("Failed to open config file: " + filename);
  }

  nlohmann::json json_config;
  try {
    file_stream >> json_config;
  } catch (const std::exception& e) {
    throw ConfigurationError(std::string("Failed to parse JSON in config file '") + filename +
                             "': " + e.what());
  }
  if (!json_config.is_object()) {
    throw ConfigurationError("Config file '" + filename + "' must contain a JSON object");
  }

  return from_json(json_config);
}

Config Config::from_json(const nlohmann::json& json_config) {
  Config config;

  try {
    config.openai_api_key = json_config.value("openai_api_key", std::string(""));
    config.openai_base_url =
        json_config.value("openai_base_url", std::string("https://api.openai.com/v1"));
    config.transcription_model = json_config.value("transcription_model", std::string("whisper-1"));
    config.summary_model = json_config.value("summary_model", std::string("gpt-4o-mini"));
    config.request_timeout_seconds = json_config.value("request_timeout_seconds", 0L);

    config.vault_path = json_config.value("vault_path", std::string(""));
    config.attachments_folder = json_config.value("attachments_folder", std::string("attachments"));
    config.diary_folder = json_config.value("diary_folder", std::string("diary"));
    config.notes_folder = json_config.value("notes_folder", std::string("notes/memos"));
    config.voice_memos_path = json_config.value("voice_memos_path", std::string(""));
    config.audio_extension = json_config.value("audio_extension", std::string(".m4a"));
    config.process_after_date = json_config.value("process_after_date", std::string(""));
  } catch (const nlohmann::json::exception& e) {
    throw ConfigurationError(std::string("Invalid value in configuration: ") + e.what());
  }

  return config;
}

void Config::apply_environment(const EnvLookup& env) {
  auto override_string = [&](const char* name, std::string& field) {
    if (auto value = env(name)) {
      field = *value;
    }
  };

  override_string("OPENAI_API_KEY", openai_api_key);
  override_string("OPENAI_BASE_URL", openai_base_url);
  override_string("MEMO_TRANSCRIPTION_MODEL", transcription_model);
  override_string("MEMO_SUMMARY_MODEL", summary_model);
  override_string("OBSIDIAN_VAULT_PATH", vault_path);
  override_string("OBSIDIAN_ATTACHMENTS_FOLDER", attachments_folder);
  override_string("OBSIDIAN_DIARY_FOLDER", diary_folder);
  override_string("OBSIDIAN_NOTES_FOLDER", notes_folder);
  override_string("VOICE_MEMOS_PATH", voice_memos_path);
  override_string("MEMO_AUDIO_EXTENSION", audio_extension);
  override_string("PROCESS_FILES_AFTER_DATE", process_after_date);

  if (auto timeout = env("MEMO_REQUEST_TIMEOUT_SECONDS")) {
    try {
      std::size_t consumed = 0;
      request_timeout_seconds = std::stol(*timeout, &consumed);
      if (consumed != timeout->size()) {
        throw std::invalid_argument("trailing characters");
      }
    } catch (const std::exception&) {
      throw ConfigurationError("MEMO_REQUEST_TIMEOUT_SECONDS '" + *timeout +
                               "' is not a whole number of seconds");
    }
  }
}

Config Config::load(const std::string& filename, bool file_required, const EnvLookup& env) {
  Config config;
  std::error_code ec;
  if (std::filesystem::exists(filename, ec)) {
    config = from_file(filename);
  } else if (file_required) {
    throw ConfigurationError("Config file not found: " + filename);
  } else {
    config = from_json(nlohmann::json::object());
  }

  config.apply_environment(env);
  config.validate();
  return config;
}

void Config::validate() const {
  if (openai_api_key.empty()) {
    throw ConfigurationError("OPENAI_API_KEY environment variable is not set");
  }
  if (openai_base_url.empty()) {
    throw ConfigurationError("openai_base_url cannot be empty");
  }
  if (transcription_model.empty()) {
    throw ConfigurationError("transcription_model cannot be empty");
  }
  if (summary_model.empty()) {
    throw ConfigurationError("summary_model cannot be empty");
  }
  if (request_timeout_seconds < 0) {
    throw ConfigurationError("request_timeout_seconds cannot be negative");
  }
  require_directory("OBSIDIAN_VAULT_PATH", vault_path);
  require_directory("VOICE_MEMOS_PATH", voice_memos_path);
  require_relative_folder("attachments_folder", attachments_folder);
  require_relative_folder("diary_folder", diary_folder);
  require_relative_folder("notes_folder", notes_folder);
  if (audio_extension.size() < 2 || audio_extension[0] != '.') {
    throw ConfigurationError("audio_extension must look like '.m4a', got '" + audio_extension +
                             "'");
  }
  if (!process_after_date.empty() &&
      !memo_core::file_times::parse_iso_date(process_after_date).has_value()) {
    throw ConfigurationError("PROCESS_FILES_AFTER_DATE '" + process_after_date +
                             "' must be in YYYY-MM-DD format");
  }
}

memo_core::OpenAIConfig Config::openai_config() const {
  memo_core::OpenAIConfig openai;
  openai.api_key = openai_api_key;
  openai.base_url = openai_base_url;
  openai.transcription_model = transcription_model;
  openai.summary_model = summary_model;
  openai.request_timeout_seconds = request_timeout_seconds;
  return openai;
}

memo_core::VaultLayout Config::vault_layout() const {
  memo_core::VaultLayout layout;
  layout.vault_root = vault_path;
  layout.attachments_folder = attachments_folder;
  layout.diary_folder = diary_folder;
  layout.notes_folder = notes_folder;
  layout.voice_memos_path = voice_memos_path;
  return layout;
}

memo_core::IngestionContext Config::ingestion_context() const {
  memo_core::IngestionContext context;
  context.layout = vault_layout();
  context.audio_extension = audio_extension;
  if (!process_after_date.empty()) {
    context.process_after = memo_core::file_times::parse_iso_date(process_after_date);
  }
  return context;
}

std::string Config::settings_help() {
  std::ostringstream out;
  for (const auto& setting : SETTINGS) {
    out << "  - " << setting.env_var << " / \"" << setting.json_key << "\" "
        << setting.description << "\n";
  }
  return out.str();
}

}  // namespace memo_cli
