#ifndef CONFIG_H_
#define CONFIG_H_

#include <string>
#include <istream>
#include <filesystem>

#include <coderun/config.h>

namespace fs = std::filesystem;

struct ServerConfig {
  std::string host = "0.0.0.0";
  int port = 5000;
  long max_code_size = 5000; // characters
  fs::path static_dir = "static";
  int threads = 8;
  SandboxConfig sandbox;
};

// Keys missing from the file keep their current values.
// Returns false if the file cannot be read or a value is out of range.
bool ParseConfig(const fs::path&, ServerConfig&);
bool ParseConfig(std::istream&, ServerConfig&);
bool ValidateConfig(const ServerConfig&);

#endif  // CONFIG_H_
