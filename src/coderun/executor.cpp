#include <coderun/executor.h>

#include <exception>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <coderun/sanitize.h>
#include "utils.h"
#include "process.h"
#include "staging.h"

namespace {

fs::path StagingRoot(const SandboxConfig& config) {
  if (!config.staging_root.empty()) return config.staging_root;
  return fs::temp_directory_path();
}

ExecutionResult LogResult(ExecutionResult&& res) {
  spdlog::info("Execution finished: kind={} exit_code={} output_size={}",
      ResultKindName(res.kind), res.exit_code, res.output.size());
  return std::move(res);
}

} // namespace

bool DockerExecutor::RuntimeAvailable() const {
  return !FindExecutable(config_.docker_binary).empty();
}

std::string DockerExecutor::ContainerName_(const StagedArtifact& artifact) const {
  return config_.container_prefix + '-' + artifact.Id();
}

std::vector<std::string> DockerExecutor::Command_(const StagedArtifact& artifact) const {
  std::string memory = std::to_string(config_.memory_limit_mib) + 'm';
  std::vector<std::string> cmd = {
    config_.docker_binary, "run", "--rm",
    "--name", ContainerName_(artifact),
    "--memory=" + memory,
    "--memory-swap=" + memory, // same as --memory: no swap
  };
  if (config_.pids_limit > 0) cmd.push_back("--pids-limit=" + std::to_string(config_.pids_limit));
  cmd.insert(cmd.end(), {
    "--network", config_.network_mode,
    "-v", artifact.Dir().string() + ':' + config_.guest_dir + ":ro",
    config_.image,
    config_.interpreter, (fs::path(config_.guest_dir) / config_.script_name).string(),
  });
  return cmd;
}

void DockerExecutor::KillContainer_(const std::string& name) {
  spdlog::debug("Killing container {}", name);
  try {
    ProcessResult res = RunProcess({config_.docker_binary, "kill", name}, config_.kill_grace);
    if (res.timed_out) {
      spdlog::warn("docker kill {} timed out", name);
    } else if (res.status != 0) {
      // the container may be gone already
      spdlog::debug("docker kill {} exited with {}: {}", name, res.status, Trim(res.err));
    }
  } catch (const std::exception& e) {
    spdlog::warn("Failed killing container {}: {}", name, e.what());
  }
}

ExecutionResult DockerExecutor::RunStaged_(const StagedArtifact& artifact) {
  ProcessResult res;
  try {
    res = RunProcess(Command_(artifact), config_.timeout, config_.max_output_bytes);
  } catch (const std::exception&) {
    // the client may have started a container before failing
    KillContainer_(ContainerName_(artifact));
    throw;
  }
  if (res.timed_out) {
    KillContainer_(ContainerName_(artifact));
    return {fmt::format("Execution timed out after {} seconds.", config_.timeout.count()),
            kExitTimeout, ResultKind::TIMEOUT};
  }
  spdlog::debug("Container exited: status={} stdout_size={} stderr_size={}",
      res.status, res.out.size(), res.err.size());
  return ClassifyOutcome(res.out, res.err, res.status);
}

ExecutionResult DockerExecutor::Run(const std::string& source) {
  if (!RuntimeAvailable()) {
    spdlog::warn("Container runtime {} not found", config_.docker_binary);
    return LogResult({kMessageUnavailable, kExitInfraFailure, ResultKind::INFRA_UNAVAILABLE});
  }
  try {
    StagedArtifact artifact(StagingRoot(config_), config_.script_name, source);
    return LogResult(RunStaged_(artifact));
  } catch (const std::exception& e) {
    spdlog::warn("Execution error: {}", e.what());
    return LogResult({fmt::format("Internal error: {}", e.what()), kExitInfraFailure,
                      ResultKind::INFRA_ERROR});
  }
}
