#include <unistd.h>
#include <fstream>
#include <iostream>
#include <sstream>
#include <filesystem>

#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <datajail/execution.h>
#include <datajail/logger.h>
#include <datajail/paths.h>
#include <datajail/utils.h>
#include "config.h"

namespace {

enum class Command { RUN, HEALTH, BUILD_IMAGE };

struct Args {
  Command command;
  SandboxConfig config;
  fs::path code_file;
  std::map<std::string, std::string> bindings;
};

bool ParseBinding(const std::string& str, std::map<std::string, std::string>& bindings) {
  size_t pos = str.find('=');
  if (pos == std::string::npos || pos == 0 || pos + 1 == str.size()) return false;
  bindings[str.substr(0, pos)] = str.substr(pos + 1);
  return true;
}

Args ParseArgs(int argc, char** argv) {
  int verbosity = 0;
  Args args;
  argparse::ArgumentParser parser(argc ? argv[0] : "datajail");
  parser.add_argument("-c", "--config")
    .required().default_value(std::string("/etc/datajail.conf"))
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("-b", "--backend")
    .help("Sandbox backend: auto, container or process");
  parser.add_argument("-t", "--timeout")
    .scan<'d', long>()
    .help("Wall clock limit in seconds");

  argparse::ArgumentParser run_cmd("run");
  run_cmd.add_description("Execute a script and print the outcome as JSON");
  run_cmd.add_argument("code_file")
    .help("Path of the script to execute");
  run_cmd.add_argument("-d", "--data")
    .append()
    .help("Dataset binding NAME=PATH, PATH relative to the uploads root");

  argparse::ArgumentParser health_cmd("health");
  health_cmd.add_description("Run a trivial script on the active backend");

  argparse::ArgumentParser build_cmd("build-image");
  build_cmd.add_description("Build the sandbox image of the container backend");

  parser.add_subparser(run_cmd);
  parser.add_subparser(health_cmd);
  parser.add_subparser(build_cmd);

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(1);
  }

  switch (verbosity) {
    case 0: spdlog::set_level(spdlog::level::warn); break;
    case 1: spdlog::set_level(spdlog::level::info); break;
    default: spdlog::set_level(spdlog::level::debug); break;
  }
  fs::path config_file = parser.get<std::string>("--config");
  if (fs::exists(config_file) || parser.is_used("--config")) {
    if (!ParseConfig(config_file, args.config)) {
      spdlog::error("Failed to parse configuration file {}", std::string(config_file));
      exit(1);
    }
  }
  if (auto val = parser.present("--backend")) {
    args.config.backend = val.value();
  }
  if (auto val = parser.present<long>("--timeout")) {
    if (val.value() <= 0) {
      spdlog::error("Invalid timeout {}; must be positive", val.value());
      exit(1);
    }
    args.config.limits.timeout_seconds = val.value();
  }

  if (parser.is_subcommand_used("run")) {
    args.command = Command::RUN;
    args.code_file = run_cmd.get<std::string>("code_file");
    if (auto data = run_cmd.present<std::vector<std::string>>("--data")) {
      for (auto& i : data.value()) {
        if (!ParseBinding(i, args.bindings)) {
          spdlog::error("Invalid dataset binding {}; expected NAME=PATH", i);
          exit(1);
        }
      }
    }
  } else if (parser.is_subcommand_used("health")) {
    args.command = Command::HEALTH;
  } else if (parser.is_subcommand_used("build-image")) {
    args.command = Command::BUILD_IMAGE;
  } else {
    std::cerr << parser;
    exit(1);
  }
  return args;
}

} // namespace

int main(int argc, char** argv) {
  spdlog::set_pattern("[%t] %+");
  InitLogger();
  Args args = ParseArgs(argc, argv);

  if (args.command == Command::BUILD_IMAGE) {
    return BuildSandboxImage(args.config) ? 0 : 1;
  }
  Executor executor(args.config);
  if (executor.GetBackendType() == BackendType::PROCESS && geteuid() != 0) {
    spdlog::error("The restricted process backend must be run as root.");
    return 1;
  }

  if (args.command == Command::HEALTH) {
    HealthStatus status = executor.HealthCheck();
    std::cout << status.ToJson().dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
    return status.healthy ? 0 : 1;
  }

  std::ifstream fin(args.code_file);
  if (!fin) {
    spdlog::error("Cannot read {}", args.code_file.c_str());
    return 1;
  }
  std::stringstream code;
  code << fin.rdbuf();
  ExecutionOutcome outcome = executor.Execute(ExecutionRequest(code.str(), args.bindings));
  if (!outcome.succeeded) spdlog::info("{}: {}", FailureKindToDesc(outcome.failure_kind), outcome.message);
  std::cout << outcome.ToJson().dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
  return outcome.succeeded ? 0 : 1;
}
