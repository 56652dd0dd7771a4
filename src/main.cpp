#include "cli/cli.hpp"
#include "config/config.hpp"
#include "logger/logger.hpp"
#include "store/file_object_store.hpp"
#include <iostream>
#include <string>
#include <unordered_set>

struct ProgramOptions {
  std::string store_dir;
  std::string config_file;
  std::string log_file;
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " -d <store-dir> [-c <config.yaml>] [-l <log-file>]\n"
        << "Arguments:\n"
        << "  -d, --dir       Directory holding the object store (required unless set in config)\n"
        << "  -c, --config    YAML configuration file\n"
        << "  -l, --log       Log file, overrides the config\n"
        << "Example: " << program_name << " -d ./vault -c gistvault.yaml\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  const std::unordered_set<std::string> flags = {
    "-d", "--dir", "-c", "--config", "-l", "--log"
  };

  ProgramOptions options;

  if (argc % 2 == 0) {
    std::cerr << "Error: Every flag needs a value\n";
    print_usage(argv[0]);
    return options;
  }

  for (int i = 1; i < argc - 1; i += 2) {
    const std::string flag(argv[i]);
    const std::string value(argv[i + 1]);

    if (flags.count(flag) == 0) {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }

    if (flag == "-d" || flag == "--dir") {
      options.store_dir = value;
    } else if (flag == "-c" || flag == "--config") {
      options.config_file = value;
    } else {
      options.log_file = value;
    }
  }

  if (options.store_dir.empty() && options.config_file.empty()) {
    std::cerr << "Error: A store directory or a config file is required\n";
    print_usage(argv[0]);
    return options;
  }

  options.valid = true;
  return options;
}

bool run_shell(const ProgramOptions& options) {
  try {
    gistvault::config::AppConfig config;
    if (!options.config_file.empty()) {
      config = gistvault::config::load_config(options.config_file);
    }
    if (!options.store_dir.empty()) {
      config.storage_path = options.store_dir;
    }
    if (!options.log_file.empty()) {
      config.logging.log_file = options.log_file;
    }

    gistvault::logging::init_logging(config.logging);

    gistvault::store::FileObjectStore objects(config.storage_path);
    gistvault::store::GistStore store(objects, config.store);
    gistvault::container::ContainerCodec codec(config.store.limits);
    gistvault::cli::CLI cli(store, codec);

    cli.run();
    gistvault::logging::shutdown_logging();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to start gistvault: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  if (const auto options = parse_command_line(argc, argv); !options.valid) {
    return 1;
  } else if (!run_shell(options)) {
    return 1;
  }
  return 0;
}
