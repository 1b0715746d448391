#include "config.h"

#include <fstream>

#include <tortellini.hh>
#include <spdlog/spdlog.h>

namespace {

void OverrideString(std::string& val, const std::string& from_file) {
  if (from_file.size()) val = from_file;
}

} // namespace

bool ParseConfig(const fs::path& conf_path, ServerConfig& config) {
  std::ifstream fin(conf_path);
  if (!fin) {
    spdlog::error("Cannot open configuration file {}", conf_path.c_str());
    return false;
  }
  return ParseConfig(fin, config);
}

bool ParseConfig(std::istream& in, ServerConfig& config) {
  tortellini::ini ini;
  in >> ini;

  OverrideString(config.host, ini["server"]["host"] | "");
  config.port = ini["server"]["port"] | config.port;
  config.max_code_size = ini["server"]["max_code_size"] | config.max_code_size;
  std::string static_dir = ini["server"]["static_dir"] | "";
  if (static_dir.size()) config.static_dir = static_dir;
  config.threads = ini["server"]["threads"] | config.threads;

  SandboxConfig& sandbox = config.sandbox;
  OverrideString(sandbox.docker_binary, ini["sandbox"]["docker_binary"] | "");
  OverrideString(sandbox.image, ini["sandbox"]["image"] | "");
  OverrideString(sandbox.interpreter, ini["sandbox"]["interpreter"] | "");
  sandbox.memory_limit_mib = ini["sandbox"]["memory_limit_mib"] | sandbox.memory_limit_mib;
  sandbox.pids_limit = ini["sandbox"]["pids_limit"] | sandbox.pids_limit;
  OverrideString(sandbox.network_mode, ini["sandbox"]["network_mode"] | "");
  sandbox.timeout = std::chrono::seconds(ini["sandbox"]["timeout"] | (long)sandbox.timeout.count());
  sandbox.kill_grace = std::chrono::seconds(ini["sandbox"]["kill_grace"] | (long)sandbox.kill_grace.count());
  sandbox.max_output_bytes = ini["sandbox"]["max_output_bytes"] | sandbox.max_output_bytes;
  OverrideString(sandbox.guest_dir, ini["sandbox"]["guest_dir"] | "");
  OverrideString(sandbox.script_name, ini["sandbox"]["script_name"] | "");
  std::string staging_root = ini["sandbox"]["staging_root"] | "";
  if (staging_root.size()) sandbox.staging_root = staging_root;
  OverrideString(sandbox.container_prefix, ini["sandbox"]["container_prefix"] | "");
  return ValidateConfig(config);
}

bool ValidateConfig(const ServerConfig& config) {
  auto Fail = [](const char* key, auto val) {
    spdlog::error("Invalid configuration value {}={}", key, val);
    return false;
  };
  if (config.port <= 0 || config.port > 65535) return Fail("port", config.port);
  if (config.max_code_size <= 0) return Fail("max_code_size", config.max_code_size);
  if (config.threads <= 0) return Fail("threads", config.threads);
  const SandboxConfig& sandbox = config.sandbox;
  if (sandbox.memory_limit_mib <= 0) return Fail("memory_limit_mib", sandbox.memory_limit_mib);
  if (sandbox.pids_limit < 0) return Fail("pids_limit", sandbox.pids_limit);
  if (sandbox.timeout.count() <= 0) return Fail("timeout", sandbox.timeout.count());
  if (sandbox.kill_grace.count() <= 0) return Fail("kill_grace", sandbox.kill_grace.count());
  if (sandbox.max_output_bytes <= 0) return Fail("max_output_bytes", sandbox.max_output_bytes);
  if (sandbox.guest_dir.empty() || sandbox.guest_dir[0] != '/') {
    return Fail("guest_dir", sandbox.guest_dir);
  }
  if (sandbox.script_name.find('/') != std::string::npos) {
    return Fail("script_name", sandbox.script_name);
  }
  return true;
}
