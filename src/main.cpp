#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <filesystem>

#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <fluxflow/config.h>
#include <fluxflow/engine.h>
#include <fluxflow/logger.h>
#include <fluxflow/remote.h>
#include <fluxflow/orchestrator.h>
#include "server/api_server.h"

namespace {

const char kDefaultConfig[] = "/etc/fluxflow.conf";

bool ParseConfig(const fs::path& conf_path, bool required, Config& config) {
  std::ifstream fin(conf_path);
  if (!fin) {
    if (required) return false;
    spdlog::info("{} not found, using built-in defaults", conf_path.c_str());
    return true;
  }
  return LoadConfig(fin, config);
}

void ParseArgs(int argc, char** argv, Config& config) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "fluxflow");
  parser.add_argument("-c", "--config")
    .help("Path of configuration file (default: /etc/fluxflow.conf)");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("-p", "--parallel")
    .scan<'d', int>()
    .help("Number of worker threads");
  parser.add_argument("--host")
    .help("Address to listen on");
  parser.add_argument("--port")
    .scan<'d', int>()
    .help("Port to listen on");

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
  auto config_file = parser.present<std::string>("--config");
  fs::path config_path = config_file ? config_file.value() : kDefaultConfig;
  if (!ParseConfig(config_path, config_file.has_value(), config)) {
    spdlog::error("Failed to parse configuration file {}", config_path.c_str());
    exit(1);
  }
  LoadEnvironment(config);
  if (auto val = parser.present<int>("--parallel")) {
    config.parallel = val.value();
  }
  if (auto val = parser.present<std::string>("--host")) {
    config.host = val.value();
  }
  if (auto val = parser.present<int>("--port")) {
    config.port = val.value();
  }
  if (config.parallel <= 0 || config.port <= 0 || config.port > 65535) {
    spdlog::error("Invalid parallel or port");
    exit(1);
  }
}

} // namespace

int main(int argc, char** argv) {
  spdlog::set_pattern("[%t] %+");
  InitLogger();
  signal(SIGPIPE, SIG_IGN);

  Config config;
  ParseArgs(argc, argv, config);
  if (!config.primary.HasCredentials()) {
    spdlog::warn("{} credentials not set, /run-code uses {} only",
        config.primary.name, config.secondary.name);
  }

  LocalEngine engine(config);
  JDoodleClient primary(config.primary, config.max_output_size);
  PistonClient secondary(config.secondary, config.max_output_size);
  FallbackOrchestrator orchestrator(config, primary, secondary);
  ApiServer server(config, engine, orchestrator);
  return server.Listen() ? 0 : 1;
}
