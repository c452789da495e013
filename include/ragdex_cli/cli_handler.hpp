#pragma once

#include <iosfwd>
#include <string>

namespace ragdex_cli {

enum class Command {
  Run,    // resolve-or-build the index, then serve queries
  Build,  // resolve-or-build only
  Help
};

struct CliOptions {
  Command command = Command::Run;
  std::string config_path;
  int top_k = 3;
};

class CliError : public std::exception {
 public:
  explicit CliError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class CliHandler {
 public:
  static constexpr const char *DEFAULT_CONFIG_PATH = "ragdexrc.json";
  static constexpr const char *CONFIG_ENV_VAR = "RAGDEX_CONFIG";

  CliHandler(std::istream &in, std::ostream &out);

  // Disable copy constructor and assignment
  CliHandler(const CliHandler &) = delete;
  CliHandler &operator=(const CliHandler &) = delete;

  // Parse command line arguments
  CliOptions parse_arguments(int argc, char *argv[]) const;

  // Execute command
  void execute_command(const CliOptions &options);

 private:
  std::istream &in_;
  std::ostream &out_;

  void handle_run_command(const CliOptions &options);
  void handle_build_command(const CliOptions &options);
  void print_help();
};

}  // namespace ragdex_cli
