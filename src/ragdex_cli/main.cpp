#include <iostream>

#include "ragdex_cli/cli_handler.hpp"

int main(int argc, char *argv[]) {
  try {
    ragdex_cli::CliHandler handler(std::cin, std::cout);

    // Parse command line arguments
    ragdex_cli::CliOptions options = handler.parse_arguments(argc, argv);

    // Execute the command
    handler.execute_command(options);
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
