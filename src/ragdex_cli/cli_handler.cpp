#include "ragdex_cli/cli_handler.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>

#include "ragdex_core/config.hpp"
#include "ragdex_core/extractors/content_extractor_factory.hpp"
#include "ragdex_core/index/index_storage.hpp"
#include "ragdex_core/llm/llamafile_client.hpp"
#include "ragdex_core/net/http_client.hpp"
#include "ragdex_core/services/index_build_service.hpp"
#include "ragdex_core/services/query_engine.hpp"

namespace ragdex_cli {

namespace {

int parse_top_k(const std::string &value) {
  int top_k = 0;
  try {
    size_t consumed = 0;
    top_k = std::stoi(value, &consumed);
    if (consumed != value.size()) {
      throw CliError("Invalid value for --k-search-results: " + value);
    }
  } catch (const std::logic_error &) {
    throw CliError("Invalid value for --k-search-results: " + value);
  }
  if (top_k <= 0) {
    throw CliError("--k-search-results must be greater than 0");
  }
  return top_k;
}

void print_build_report(std::ostream &out, const ragdex_core::BuildReport &report) {
  if (!report.built()) {
    out << "Reusing existing index" << std::endl;
    return;
  }
  out << "Index built (" << ragdex_core::to_string(report.decision) << "): "
      << report.entry_count << " entries" << std::endl;
  if (!report.skipped_sources.empty()) {
    out << "Skipped " << report.skipped_sources.size() << " source(s):" << std::endl;
    for (const auto &failure : report.skipped_sources) {
      out << "  - " << failure.origin << ": " << failure.reason << std::endl;
    }
  }
}

}  // namespace

CliHandler::CliHandler(std::istream &in, std::ostream &out) : in_(in), out_(out) {}

CliOptions CliHandler::parse_arguments(int argc, char *argv[]) const {
  CliOptions options;
  const char *env_config = std::getenv(CONFIG_ENV_VAR);
  options.config_path = env_config ? env_config : DEFAULT_CONFIG_PATH;

  int i = 1;
  if (argc > 1 && argv[1][0] != '-') {
    std::string command = argv[1];
    if (command == "run" || command == "r") {
      options.command = Command::Run;
    } else if (command == "build" || command == "b") {
      options.command = Command::Build;
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
    } else if (flag == "--k-search-results" || flag == "-k") {
      if (options.command == Command::Build) {
        throw CliError("--k-search-results is only valid for the run command");
      }
      options.top_k = parse_top_k(value);
    } else {
      throw CliError("Unknown option: " + flag);
    }
  }

  return options;
}

void CliHandler::execute_command(const CliOptions &options) {
  switch (options.command) {
    case Command::Run:
      handle_run_command(options);
      break;
    case Command::Build:
      handle_build_command(options);
      break;
    case Command::Help:
      print_help();
      break;
  }
}

void CliHandler::handle_run_command(const CliOptions &options) {
  ragdex_core::Config config = ragdex_core::Config::from_file(options.config_path);

  auto http_client = std::make_shared<ragdex_core::HttpClient>();
  auto model_client = std::make_shared<ragdex_core::LlamafileClient>(config, http_client);
  auto extractor_factory = std::make_shared<const ragdex_core::ContentExtractorFactory>();

  // Phase 1: reuse or build the persisted index
  ragdex_core::IndexBuildService build_service(config, http_client, model_client,
                                               extractor_factory);
  print_build_report(out_, build_service.resolve_or_build());

  // Phase 2: serve queries against the persisted index
  ragdex_core::IndexStorage storage(config.index_save_dir);
  ragdex_core::VectorIndex index = storage.load();
  ragdex_core::QueryEngine engine(index, model_client, out_);
  engine.run(in_, static_cast<size_t>(options.top_k));
}

void CliHandler::handle_build_command(const CliOptions &options) {
  ragdex_core::Config config = ragdex_core::Config::from_file(options.config_path);

  auto http_client = std::make_shared<ragdex_core::HttpClient>();
  auto model_client = std::make_shared<ragdex_core::LlamafileClient>(config, http_client);
  auto extractor_factory = std::make_shared<const ragdex_core::ContentExtractorFactory>();

  ragdex_core::IndexBuildService build_service(config, http_client, model_client,
                                               extractor_factory);
  print_build_report(out_, build_service.resolve_or_build());
}

void CliHandler::print_help() {
  out_ << "Usage: ragdex [command] [options]\n"
       << "\n"
       << "Commands:\n"
       << "  run, r      Build the index if needed, then answer queries (default)\n"
       << "  build, b    Build the index if needed, then exit\n"
       << "  help, h     Show this help\n"
       << "\n"
       << "Options:\n"
       << "  -c, --config <path>              Config file (default: $" << CONFIG_ENV_VAR
       << " or " << DEFAULT_CONFIG_PATH << ")\n"
       << "  -k, --k-search-results <n>       Search results added to the prompt (default: 3)\n"
       << "  -h, --help                       Show this help\n";
  out_ << std::flush;
}

}  // namespace ragdex_cli
