#ifndef INCLUDE_CODERUN_CONFIG_H_
#define INCLUDE_CODERUN_CONFIG_H_

#include <chrono>
#include <string>
#include <filesystem>

namespace fs = std::filesystem;

struct SandboxConfig {
  std::string docker_binary = "docker"; // searched in PATH unless it contains '/'
  std::string image = "python:3.11-slim";
  std::string interpreter = "python";
  long memory_limit_mib = 128;
  long pids_limit = 64; // 0 for no limit
  std::string network_mode = "none";
  std::chrono::seconds timeout{10};
  std::chrono::seconds kill_grace{2}; // bound of `docker kill` after a timeout
  // per stream captured from the container; the rest is discarded
  long max_output_bytes = 1024 * 1024;
  // inside the container
  std::string guest_dir = "/app";
  std::string script_name = "script.py";
  // on the host; empty for the system temp directory
  fs::path staging_root;
  std::string container_prefix = "coderun";
};

#endif  // INCLUDE_CODERUN_CONFIG_H_
