#include <gtest/gtest.h>

#include <map>
#include <string>

#include "common/utilities_test.hpp"
#include "memo_cli/config.hpp"
#include "memo_core/errors.hpp"

namespace memo_tests {

using namespace memo_cli;
using memo_core::ConfigurationError;

class ConfigTest : public ::testing::Test {
 protected:
  void SetUp() override {
    temp_dir_ = TestUtilities::create_temp_dir("config");
    vault_ = temp_dir_ / "vault";
    memos_ = temp_dir_ / "memos";
    std::filesystem::create_directories(vault_);
    std::filesystem::create_directories(memos_);

    env_vars_ = {
        {"OPENAI_API_KEY", "sk-test"},
        {"OBSIDIAN_VAULT_PATH", vault_.string()},
        {"VOICE_MEMOS_PATH", memos_.string()},
    };
  }

  void TearDown() override {
    TestUtilities::cleanup_temp_dir(temp_dir_);
  }

  EnvLookup env() const {
    auto vars = env_vars_;
    return [vars](const std::string& name) -> std::optional<std::string> {
      auto it = vars.find(name);
      if (it == vars.end()) {
        return std::nullopt;
      }
      return it->second;
    };
  }

  Config load_from_env() const {
    return Config::load((temp_dir_ / "absent.json").string(), false, env());
  }

  // Loads and returns the ConfigurationError message, or "" when loading succeeds
  std::string load_error() const {
    try {
      load_from_env();
    } catch (const ConfigurationError& e) {
      return e.what();
    }
    return "";
  }

  std::filesystem::path temp_dir_;
  std::filesystem::path vault_;
  std::filesystem::path memos_;
  std::map<std::string, std::string> env_vars_;
};

TEST_F(ConfigTest, FromJsonAppliesDefaults) {
  Config config = Config::from_json(nlohmann::json::object());

  EXPECT_EQ(config.openai_api_key, "");
  EXPECT_EQ(config.openai_base_url, "https://api.openai.com/v1");
  EXPECT_EQ(config.transcription_model, "whisper-1");
  EXPECT_EQ(config.summary_model, "gpt-4o-mini");
  EXPECT_EQ(config.request_timeout_seconds, 0);
  EXPECT_EQ(config.attachments_folder, "attachments");
  EXPECT_EQ(config.diary_folder, "diary");
  EXPECT_EQ(config.notes_folder, "notes/memos");
  EXPECT_EQ(config.audio_extension, ".m4a");
  EXPECT_EQ(config.process_after_date, "");
}

TEST_F(ConfigTest, FromJsonReadsEveryKey) {
  nlohmann::json json_config = {
      {"openai_api_key", "sk-file"},
      {"openai_base_url", "http://localhost:8080/v1"},
      {"transcription_model", "whisper-large"},
      {"summary_model", "local-llm"},
      {"request_timeout_seconds", 30},
      {"vault_path", "/vault"},
      {"attachments_folder", "audio"},
      {"diary_folder", "journal"},
      {"notes_folder", "memos"},
      {"voice_memos_path", "/recordings"},
      {"audio_extension", ".wav"},
      {"process_after_date", "2024-02-01"},
  };

  Config config = Config::from_json(json_config);

  EXPECT_EQ(config.openai_api_key, "sk-file");
  EXPECT_EQ(config.openai_base_url, "http://localhost:8080/v1");
  EXPECT_EQ(config.transcription_model, "whisper-large");
  EXPECT_EQ(config.summary_model, "local-llm");
  EXPECT_EQ(config.request_timeout_seconds, 30);
  EXPECT_EQ(config.vault_path, "/vault");
  EXPECT_EQ(config.attachments_folder, "audio");
  EXPECT_EQ(config.diary_folder, "journal");
  EXPECT_EQ(config.notes_folder, "memos");
  EXPECT_EQ(config.voice_memos_path, "/recordings");
  EXPECT_EQ(config.audio_extension, ".wav");
  EXPECT_EQ(config.process_after_date, "2024-02-01");
}

TEST_F(ConfigTest, FromJsonWrongTypeIsConfigurationError) {
  EXPECT_THROW(Config::from_json({{"vault_path", 12}}), ConfigurationError);
  EXPECT_THROW(Config::from_json({{"request_timeout_seconds", "soon"}}), ConfigurationError);
}

TEST_F(ConfigTest, FromFileParsesJson) {
  auto path = temp_dir_ / "memovaultrc.json";
  TestUtilities::write_file(path, R"({"openai_api_key": "sk-file", "diary_folder": "journal"})");

  Config config = Config::from_file(path.string());

  EXPECT_EQ(config.openai_api_key, "sk-file");
  EXPECT_EQ(config.diary_folder, "journal");
  EXPECT_EQ(config.notes_folder, "notes/memos");
}

TEST_F(ConfigTest, FromFileRejectsBadInput) {
  auto broken = temp_dir_ / "broken.json";
  TestUtilities::write_file(broken, "{ not json");
  auto array = temp_dir_ / "array.json";
  TestUtilities::write_file(array, "[1, 2, 3]");

  EXPECT_THROW(Config::from_file(broken.string()), ConfigurationError);
  EXPECT_THROW(Config::from_file(array.string()), ConfigurationError);
  EXPECT_THROW(Config::from_file((temp_dir_ / "missing.json").string()), ConfigurationError);
}

TEST_F(ConfigTest, LoadFromEnvironmentOnly) {
  Config config = load_from_env();

  EXPECT_EQ(config.openai_api_key, "sk-test");
  EXPECT_EQ(config.vault_path, vault_.string());
  EXPECT_EQ(config.voice_memos_path, memos_.string());
}

TEST_F(ConfigTest, EnvironmentOverridesFile) {
  auto path = temp_dir_ / "memovaultrc.json";
  TestUtilities::write_file(path, R"({"openai_api_key": "sk-file", "diary_folder": "journal",
                                       "summary_model": "file-model"})");
  env_vars_["OBSIDIAN_DIARY_FOLDER"] = "daily";
  env_vars_["MEMO_REQUEST_TIMEOUT_SECONDS"] = "45";

  Config config = Config::load(path.string(), true, env());

  EXPECT_EQ(config.openai_api_key, "sk-test");
  EXPECT_EQ(config.diary_folder, "daily");
  EXPECT_EQ(config.summary_model, "file-model");
  EXPECT_EQ(config.request_timeout_seconds, 45);
}

TEST_F(ConfigTest, RequiredFileMustExist) {
  EXPECT_THROW(Config::load((temp_dir_ / "absent.json").string(), true, env()),
               ConfigurationError);
}

TEST_F(ConfigTest, MissingApiKeyIsReported) {
  env_vars_.erase("OPENAI_API_KEY");
  EXPECT_EQ(load_error(), "OPENAI_API_KEY environment variable is not set");
}

TEST_F(ConfigTest, MissingDirectoriesAreReported) {
  env_vars_["OBSIDIAN_VAULT_PATH"] = (temp_dir_ / "no_vault").string();
  EXPECT_NE(load_error().find("OBSIDIAN_VAULT_PATH"), std::string::npos);

  env_vars_["OBSIDIAN_VAULT_PATH"] = vault_.string();
  env_vars_.erase("VOICE_MEMOS_PATH");
  EXPECT_NE(load_error().find("VOICE_MEMOS_PATH"), std::string::npos);
}

TEST_F(ConfigTest, BadDateFloorIsReported) {
  env_vars_["PROCESS_FILES_AFTER_DATE"] = "2024-02-30";
  EXPECT_NE(load_error().find("YYYY-MM-DD"), std::string::npos);

  env_vars_["PROCESS_FILES_AFTER_DATE"] = "01/02/2024";
  EXPECT_NE(load_error().find("YYYY-MM-DD"), std::string::npos);
}

TEST_F(ConfigTest, BadTimeoutIsReported) {
  env_vars_["MEMO_REQUEST_TIMEOUT_SECONDS"] = "10s";
  EXPECT_NE(load_error().find("MEMO_REQUEST_TIMEOUT_SECONDS"), std::string::npos);

  env_vars_["MEMO_REQUEST_TIMEOUT_SECONDS"] = "-1";
  EXPECT_NE(load_error().find("cannot be negative"), std::string::npos);
}

TEST_F(ConfigTest, FoldersMustBeRelative) {
  env_vars_["OBSIDIAN_NOTES_FOLDER"] = "/absolute/notes";
  EXPECT_NE(load_error().find("notes_folder"), std::string::npos);

  env_vars_["OBSIDIAN_NOTES_FOLDER"] = "";
  EXPECT_NE(load_error().find("notes_folder"), std::string::npos);
}

TEST_F(ConfigTest, AudioExtensionMustStartWithDot) {
  env_vars_["MEMO_AUDIO_EXTENSION"] = "m4a";
  EXPECT_NE(load_error().find("audio_extension"), std::string::npos);
}

TEST_F(ConfigTest, IngestionContextCarriesLayoutAndDateFloor) {
  env_vars_["PROCESS_FILES_AFTER_DATE"] = "2024-02-01";
  env_vars_["OBSIDIAN_ATTACHMENTS_FOLDER"] = "audio";
  env_vars_["MEMO_AUDIO_EXTENSION"] = ".wav";

  memo_core::IngestionContext context = load_from_env().ingestion_context();

  EXPECT_EQ(context.layout.vault_root, vault_);
  EXPECT_EQ(context.layout.attachments_path(), vault_ / "audio");
  EXPECT_EQ(context.layout.notes_path(), vault_ / "notes/memos");
  EXPECT_EQ(context.layout.voice_memos_path, memos_);
  EXPECT_EQ(context.audio_extension, ".wav");
  ASSERT_TRUE(context.process_after.has_value());
  EXPECT_EQ(*context.process_after, TestUtilities::local_time(2024, 2, 1));
}

TEST_F(ConfigTest, OpenAIConfigCopiesServiceSettings) {
  env_vars_["OPENAI_BASE_URL"] = "http://localhost:9000/v1";
  env_vars_["MEMO_SUMMARY_MODEL"] = "small";

  memo_core::OpenAIConfig openai = load_from_env().openai_config();

  EXPECT_EQ(openai.api_key, "sk-test");
  EXPECT_EQ(openai.base_url, "http://localhost:9000/v1");
  EXPECT_EQ(openai.transcription_model, "whisper-1");
  EXPECT_EQ(openai.summary_model, "small");
}

TEST_F(ConfigTest, SettingsHelpListsEveryVariable) {
  std::string help = Config::settings_help();
  for (const char* name :
       {"OPENAI_API_KEY", "OBSIDIAN_VAULT_PATH", "OBSIDIAN_ATTACHMENTS_FOLDER",
        "OBSIDIAN_DIARY_FOLDER", "OBSIDIAN_NOTES_FOLDER", "VOICE_MEMOS_PATH",
        "PROCESS_FILES_AFTER_DATE", "MEMO_REQUEST_TIMEOUT_SECONDS"}) {
    EXPECT_NE(help.find(name), std::string::npos) << name;
  }
}

}  // namespace memo_tests
