#include "utils.h"

#include <cstdlib>
#include <fstream>
#include <iterator>
#include <stdexcept>

TempDir::TempDir() {
  char path_tmp[256] = "/tmp/coderun_test_XXXXXX";
  if (!mkdtemp(path_tmp)) throw std::runtime_error("Failed to create");
  path_ = path_tmp;
}

TempDir::~TempDir() {
  std::error_code ec;
  fs::remove_all(path_, ec);
}

fs::path WriteScript(const fs::path& dir, const std::string& name, const std::string& content) {
  fs::path path = dir / name;
  {
    std::ofstream fout(path);
    fout << content;
  }
  fs::permissions(path, fs::perms::owner_all);
  return path;
}

fs::path WriteFakeDocker(const fs::path& dir) {
  return WriteScript(dir, "docker", R"SH(#!/bin/sh
if [ "$1" = kill ]; then
  echo "$2" >> "$(dirname "$0")/killed"
  exit 0
fi
mount=""
for a in "$@"; do
  case "$a" in
    *:ro) mount="$a" ;;
  esac
done
host="${mount%%:*}"
rest="${mount#*:}"
guest="${rest%:ro}"
eval "interp=\${$(($# - 1))}"
eval "script=\${$#}"
exec "$interp" "$host${script#$guest}"
)SH");
}

SandboxConfig FakeSandboxConfig(const fs::path& bin, const fs::path& staging) {
  SandboxConfig config;
  config.docker_binary = WriteFakeDocker(bin).string();
  config.interpreter = "/bin/sh";
  config.script_name = "script.sh";
  config.staging_root = staging;
  config.timeout = std::chrono::seconds(5);
  config.kill_grace = std::chrono::seconds(1);
  return config;
}

size_t CountEntries(const fs::path& dir) {
  return std::distance(fs::directory_iterator(dir), fs::directory_iterator());
}
