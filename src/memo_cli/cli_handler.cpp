#include "memo_cli/cli_handler.hpp"

#include <iostream>
#include <string>

#include "memo_core/errors.hpp"
#include "memo_core/file_times.hpp"
#include "memo_core/hashing/content_hasher.hpp"
#include "memo_core/llm/openai_client.hpp"
#include "memo_core/memo_selector.hpp"
#include "memo_core/processed_set.hpp"
#include "memo_core/vault/daily_log_merger.hpp"
#include "memo_core/vault/note_writer.hpp"

namespace memo_cli {

namespace {
const std::string BANNER(50, '=');
}

ServiceClients make_openai_clients(const memo_core::OpenAIConfig& config) {
  auto client = std::make_shared<memo_core::OpenAIClient>(config);
  return {client, client};
}

CliHandler::CliHandler(EnvLookup env, ClientFactory client_factory)
    : env_(std::move(env)), client_factory_(std::move(client_factory)) {}

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) {
  CliOptions options;

  int i = 1;
  if (argc > 1 && argv[1][0] != '-') {
    std::string command = argv[1];
    if (command == "run" || command == "r") {
      options.command = Command::Run;
    } else if (command == "pending" || command == "p") {
      options.command = Command::Pending;
    } else if (command == "help" || command == "h") {
      options.command = Command::Help;
    } else {
      throw CliError("Unknown command: " + command);
    }
    i = 2;
  }

  for (; i < argc; ++i) {
    std::string flag = argv[i];
    if (flag == "--help" || flag == "-h") {
      options.command = Command::Help;
      continue;
    }
    if (i + 1 >= argc) {
      throw CliError("Missing value for " + flag);
    }
    std::string value = argv[++i];

    if (flag == "--config" || flag == "-c") {
      options.config_path = value;
      options.config_path_given = true;
    } else if (flag == "--after" || flag == "-a") {
      if (!memo_core::file_times::parse_iso_date(value).has_value()) {
        throw CliError("--after expects a date in YYYY-MM-DD format, got: " + value);
      }
      options.after_date = value;
    } else {
      throw CliError("Unknown option: " + flag);
    }
  }

  return options;
}

int CliHandler::execute_command(const CliOptions& options) {
  switch (options.command) {
    case Command::Run:
      return handle_run_command(options);
    case Command::Pending:
      return handle_pending_command(options);
    case Command::Help:
    default:
      print_help();
      return EXIT_OK;
  }
}

Config CliHandler::load_config(const CliOptions& options) const {
  EnvLookup env = env_;
  if (!options.after_date.empty()) {
    const std::string after = options.after_date;
    env = [base = env_, after](const std::string& name) -> std::optional<std::string> {
      if (name == "PROCESS_FILES_AFTER_DATE") {
        return after;
      }
      return base(name);
    };
  }

  Config config = Config::load(options.config_path, options.config_path_given, env);
  if (!config.process_after_date.empty()) {
    std::cout << "Processing files created after: " << config.process_after_date << std::endl;
  }
  return config;
}

int CliHandler::handle_run_command(const CliOptions& options) {
  const Config config = load_config(options);
  const memo_core::IngestionContext context = config.ingestion_context();
  ServiceClients clients = client_factory_(config.openai_config());

  memo_core::IngestionPipeline pipeline(context, std::make_shared<memo_core::ContentHasher>(),
                                        clients.transcription, clients.summary,
                                        std::make_shared<memo_core::NoteWriter>(context),
                                        std::make_shared<memo_core::DailyLogMerger>(context));
  pipeline.set_stage_observer(
      [this](const memo_core::MemoFile& memo, memo_core::MemoStage stage) {
        print_stage(memo, stage);
      });

  pipeline.prepare();
  memo_core::ProcessedSet processed = pipeline.load_processed_set();
  memo_core::RunReport report = pipeline.run(processed);

  print_report(report);
  return report.has_failures() ? EXIT_MEMO_FAILURES : EXIT_OK;
}

int CliHandler::handle_pending_command(const CliOptions& options) {
  const Config config = load_config(options);
  const memo_core::IngestionContext context = config.ingestion_context();
  memo_core::ContentHasher hasher;

  memo_core::ProcessedSet processed = memo_core::ProcessedSet::build(
      context.layout.attachments_path(), context.audio_extension, hasher);
  memo_core::MemoSelector selector(context, hasher);
  std::vector<memo_core::MemoFile> memos = selector.select(processed);

  if (memos.empty()) {
    std::cout << "No new memos to process." << std::endl;
    return EXIT_OK;
  }

  std::cout << "\n=== Pending Memos (" << memos.size() << ") ===" << std::endl;
  for (const auto& memo : memos) {
    std::cout << "  " << memo.path.filename().string() << "  (created "
              << memo_core::file_times::format_local(memo.created_at, "%Y-%m-%d %H:%M:%S") << ")"
              << std::endl;
  }
  return EXIT_OK;
}

void CliHandler::print_stage(const memo_core::MemoFile& memo, memo_core::MemoStage stage) const {
  if (stage == memo_core::MemoStage::Selected) {
    std::cout << "\n" << BANNER << "\nProcessing: " << memo.path.filename().string() << "\n"
              << BANNER << std::endl;
  } else if (stage == memo_core::MemoStage::Linked) {
    std::cout << "✓ Successfully processed " << memo.path.filename().string() << std::endl;
  } else if (stage == memo_core::MemoStage::Failed) {
    std::cout << "✗ Error processing " << memo.path.filename().string() << std::endl;
  }
}

void CliHandler::print_report(const memo_core::RunReport& report) const {
  if (report.outcomes.empty()) {
    return;
  }

  std::cout << "\n" << BANNER << "\nProcessing complete! Processed " << report.outcomes.size()
            << " memo(s): " << report.linked << " linked, " << report.skipped << " skipped, "
            << report.failed << " failed\n"
            << BANNER << std::endl;

  for (const auto& outcome : report.outcomes) {
    if (outcome.status != memo_core::MemoStage::Failed) {
      continue;
    }
    std::cout << "  ✗ " << outcome.memo_path.filename().string() << " ["
              << memo_core::to_string(outcome.error_kind.value_or(memo_core::ErrorKind::Unexpected))
              << " during " << memo_core::to_string(outcome.failed_stage)
              << "]: " << outcome.error_message << std::endl;
  }
}

void CliHandler::print_help() {
  std::cout << "Usage: memo_vault [command] [options]\n"
            << "\n"
            << "Commands:\n"
            << "  run, r        Transcribe, summarize and file every new voice memo (default)\n"
            << "  pending, p    List the memos the next run would process\n"
            << "  help, h       Show this help\n"
            << "\n"
            << "Options:\n"
            << "  -c, --config <path>   JSON config file (default " << Config::DEFAULT_CONFIG_FILE
            << ", optional)\n"
            << "  -a, --after <date>    Only consider memos created on or after YYYY-MM-DD\n"
            << "\n"
            << "Settings (environment variable / config key):\n"
            << Config::settings_help() << std::flush;
}

}  // namespace memo_cli
