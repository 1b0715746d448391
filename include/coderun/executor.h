#ifndef INCLUDE_CODERUN_EXECUTOR_H_
#define INCLUDE_CODERUN_EXECUTOR_H_

#include <string>
#include <vector>
#include <utility>

#include "config.h"
#include "result.h"

class StagedArtifact;

class Executor {
 public:
  virtual ~Executor() = default;
  // must not throw; every failure is reported through the result
  virtual ExecutionResult Run(const std::string& source) = 0;
};

// Runs each submission in a disposable, memory-capped, network-less container
// that only sees the staged script, mounted read-only.
class DockerExecutor : public Executor {
  const SandboxConfig config_;

  // the full `docker run` command line for a staged artifact
  std::vector<std::string> Command_(const StagedArtifact&) const;
  std::string ContainerName_(const StagedArtifact&) const;
  ExecutionResult RunStaged_(const StagedArtifact&);
  void KillContainer_(const std::string& name);
 public:
  explicit DockerExecutor(SandboxConfig config) : config_(std::move(config)) {}

  const SandboxConfig& Config() const { return config_; }
  bool RuntimeAvailable() const;

  ExecutionResult Run(const std::string& source) override;
};

#endif  // INCLUDE_CODERUN_EXECUTOR_H_
