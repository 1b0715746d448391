#ifndef CODERUN_PROCESS_H_
#define CODERUN_PROCESS_H_

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

struct ProcessResult {
  int status; // exit code, or 128 + signal number if killed by a signal
  bool timed_out;
  bool truncated; // out or err reached the output limit
  std::string out, err;
};

constexpr size_t kNoOutputLimit = 0;

// Run argv without a shell in its own process group, stdin from /dev/null,
// capturing stdout and stderr separately, each up to max_output bytes (the rest
// is read and discarded). When the deadline expires before the process has exited
// and its output has been drained, the whole process group is killed and the
// result is marked timed_out.
// Throws std::system_error if the process cannot be started (including exec failure)
// or cannot be waited for; the process group is killed in that case.
ProcessResult RunProcess(const std::vector<std::string>& argv, std::chrono::milliseconds timeout,
                         size_t max_output = kNoOutputLimit);

#endif  // CODERUN_PROCESS_H_
