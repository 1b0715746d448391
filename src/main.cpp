#include <csignal>
#include <cstdlib>
#include <iostream>

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <coderun/executor.h>
#include "config.h"
#include "server.h"

namespace {

ServerConfig config;

void ParseArgs(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "coderun-server");
  parser.add_argument("-c", "--config")
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("--host")
    .help("Address to listen on");
  parser.add_argument("-p", "--port")
    .scan<'d', int>()
    .help("Port to listen on");
  parser.add_argument("-t", "--timeout")
    .scan<'d', int>()
    .help("Wall-clock limit of one execution in seconds");
  parser.add_argument("-m", "--memory")
    .scan<'d', long>()
    .help("Memory limit of one execution in MiB");
  parser.add_argument("--image")
    .help("Container image providing the interpreter");

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
  if (auto config_file = parser.present("--config")) {
    if (!ParseConfig(config_file.value(), config)) {
      spdlog::error("Failed to parse configuration file {}", config_file.value());
      exit(1);
    }
  }
  if (auto val = parser.present("--host")) config.host = val.value();
  if (auto val = parser.present<int>("--port")) config.port = val.value();
  if (auto val = parser.present<int>("--timeout")) config.sandbox.timeout = std::chrono::seconds(val.value());
  if (auto val = parser.present<long>("--memory")) config.sandbox.memory_limit_mib = val.value();
  if (auto val = parser.present("--image")) config.sandbox.image = val.value();
  if (!ValidateConfig(config)) exit(1);
}

} // namespace

int main(int argc, char** argv) {
  spdlog::set_pattern("[%t] %+");
  ParseArgs(argc, argv);
  // a client closing its connection early must not kill the server
  signal(SIGPIPE, SIG_IGN);

  DockerExecutor executor(config.sandbox);
  if (!executor.RuntimeAvailable()) {
    spdlog::warn("{} not found; every execution will fail until it is installed",
                 config.sandbox.docker_binary);
  }
  httplib::Server svr;
  svr.new_task_queue = [threads = config.threads] { return new httplib::ThreadPool(threads); };
  RegisterRoutes(svr, executor, config);

  spdlog::info("Listening on {}:{} image={} memory={}MiB timeout={}s network={}",
      config.host, config.port, config.sandbox.image, config.sandbox.memory_limit_mib,
      config.sandbox.timeout.count(), config.sandbox.network_mode);
  if (!svr.listen(config.host, config.port)) {
    spdlog::error("Failed to listen on {}:{}", config.host, config.port);
    return 1;
  }
}
