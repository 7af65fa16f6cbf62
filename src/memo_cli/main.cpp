#include <cstdlib>
#include <iostream>

#include "memo_cli/cli_handler.hpp"
#include "memo_cli/config.hpp"
#include "memo_core/errors.hpp"

int main(int argc, char *argv[])
{
  try
  {
    memo_cli::CliHandler handler;

    // Parse command line arguments
    memo_cli::CliOptions options = handler.parse_arguments(argc, argv);

    // Execute the command
    return handler.execute_command(options);
  }
  catch (const memo_core::ConfigurationError &e)
  {
    std::cerr << "Configuration error: " << e.what() << std::endl;
    std::cerr << "\nPlease ensure the following settings are provided:\n"
              << memo_cli::Config::settings_help() << std::endl;
  }
  catch (const memo_cli::CliError &e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    std::cerr << "Run 'memo_vault help' for usage." << std::endl;
  }
  catch (const memo_core::MemoError &e)
  {
    std::cerr << "Error (" << memo_core::to_string(e.kind()) << "): " << e.what() << std::endl;
  }
  catch (const std::exception &e)
  {
    std::cerr << "Unexpected error: " << e.what() << std::endl;
  }

  return memo_cli::EXIT_ERROR;
}
