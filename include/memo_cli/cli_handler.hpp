#pragma once

#include <functional>
#include <memory>
#include <string>

#include "memo_cli/config.hpp"
#include "memo_core/llm/summary_client.hpp"
#include "memo_core/llm/transcription_client.hpp"
#include "memo_core/services/ingestion_pipeline.hpp"

namespace memo_cli
{

  enum class Command
  {
    Run,
    Pending,
    Help
  };

  struct CliOptions
  {
    Command command = Command::Run;
    std::string config_path = Config::DEFAULT_CONFIG_FILE;
    bool config_path_given = false;
    std::string after_date;  // overrides process_after_date when set
  };

  // Exit codes returned by execute_command()
  constexpr int EXIT_OK = 0;
  constexpr int EXIT_ERROR = 1;
  constexpr int EXIT_MEMO_FAILURES = 2;

  class CliError : public std::exception
  {
  public:
    explicit CliError(const std::string &message) : message_(message) {}

    const char *what() const noexcept override
    {
      return message_.c_str();
    }

  private:
    std::string message_;
  };

  struct ServiceClients
  {
    std::shared_ptr<memo_core::TranscriptionClient> transcription;
    std::shared_ptr<memo_core::SummaryClient> summary;
  };

  using ClientFactory = std::function<ServiceClients(const memo_core::OpenAIConfig &)>;

  // Both roles served by one OpenAIClient
  ServiceClients make_openai_clients(const memo_core::OpenAIConfig &config);

  class CliHandler
  {
  public:
    explicit CliHandler(EnvLookup env = process_environment,
                        ClientFactory client_factory = make_openai_clients);

    // Parse command line arguments
    CliOptions parse_arguments(int argc, char *argv[]);

    /**
     * @brief Runs the chosen command.
     * @return EXIT_OK, or EXIT_MEMO_FAILURES when at least one memo failed.
     * @throws memo_core::ConfigurationError before any memo is touched if the settings are unusable.
     */
    int execute_command(const CliOptions &options);

    static void print_help();

  private:
    EnvLookup env_;
    ClientFactory client_factory_;

    Config load_config(const CliOptions &options) const;

    // Command handlers
    int handle_run_command(const CliOptions &options);
    int handle_pending_command(const CliOptions &options);

    void print_stage(const memo_core::MemoFile &memo, memo_core::MemoStage stage) const;
    void print_report(const memo_core::RunReport &report) const;
  };

}
