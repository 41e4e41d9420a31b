#include "cli/cli.hpp"
#include "config/config.hpp"
#include "logger/logger.hpp"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

struct ProgramOptions {
  std::string root;
  std::string config_file;
  std::string log_level;
  std::string log_file;
  std::vector<std::string> command;
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " [options] <command> [arguments]\n"
        << "Options:\n"
        << "  -r, --root <dir>         Store root directory\n"
        << "  -c, --config <file>      JSON configuration file\n"
        << "  -l, --log-level <level>  trace, debug, info, warning, error or fatal\n"
        << "      --log-file <file>    Also write the log to <file>\n";
  blobshard::cli::CLI::print_commands(std::cerr);
  std::cerr << "Example: " << program_name << " --root ./data put photo.jpg\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  ProgramOptions options;

  int i = 1;
  for (; i < argc; ++i) {
    const std::string flag(argv[i]);
    if (flag.empty() || flag[0] != '-' || flag == "-") {
      break;
    }
    if (flag == "--help") {
      print_usage(argv[0]);
      return options;
    }
    if (i + 1 >= argc) {
      std::cerr << "Error: Missing value for " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }

    const std::string value(argv[++i]);
    if (flag == "-r" || flag == "--root") {
      options.root = value;
    } else if (flag == "-c" || flag == "--config") {
      options.config_file = value;
    } else if (flag == "-l" || flag == "--log-level") {
      options.log_level = value;
    } else if (flag == "--log-file") {
      options.log_file = value;
    } else {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }
  }

  options.command.assign(argv + i, argv + argc);
  if (options.command.empty()) {
    std::cerr << "Error: A command is required\n";
    print_usage(argv[0]);
    return options;
  }

  options.valid = true;
  return options;
}

std::optional<blobshard::config::Config> load_config(const ProgramOptions& options) {
  try {
    blobshard::config::Config config;
    // Errors only until the configured level is known
    config.log.level = boost::log::trivial::error;
    blobshard::logging::init_logging(config.log);

    if (!options.config_file.empty()) {
      config = blobshard::config::Config::load_file(options.config_file);
    }
    if (!options.root.empty()) {
      config.store.root_dir = options.root;
    }
    if (!options.log_level.empty()) {
      config.log.level = blobshard::logging::parse_severity(options.log_level);
    }
    if (!options.log_file.empty()) {
      config.log.file = options.log_file;
    }
    config.validate();
    return config;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return std::nullopt;
  }
}

int main(int argc, char* argv[]) {
  const auto options = parse_command_line(argc, argv);
  if (!options.valid) {
    return 2;
  }

  const auto config = load_config(options);
  if (!config) {
    return 2;
  }

  try {
    blobshard::logging::init_logging(config->log);
    blobshard::cli::CLI cli(*config, std::cout, std::cerr);
    return cli.run(options.command);
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to start blobshard: " << e.what() << '\n';
    return 1;
  }
}
