#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <string>
#include <filesystem>

#include <gtest/gtest.h>
#include <coderun/config.h>

namespace fs = std::filesystem;

class TempDir {
  fs::path path_;
 public:
  TempDir();
  ~TempDir();
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;
  const fs::path& Path() const { return path_; }
};

fs::path WriteScript(const fs::path& dir, const std::string& name, const std::string& content);

// A stand-in for the docker CLI. `docker run ...` runs the last two arguments
// (interpreter and script) on the host, translating the guest path through the
// read-only -v mount; `docker kill NAME` appends NAME to <dir>/killed.
fs::path WriteFakeDocker(const fs::path& dir);

// Fake docker in `bin`, staging in `staging`, interpreter /bin/sh.
SandboxConfig FakeSandboxConfig(const fs::path& bin, const fs::path& staging);

size_t CountEntries(const fs::path& dir);

#endif // TEST_UTILS_H_
