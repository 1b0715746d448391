#ifndef INCLUDE_CODERUN_RESULT_H_
#define INCLUDE_CODERUN_RESULT_H_

#include <string>

// exit codes reserved for failures outside the guest program
constexpr int kExitInfraFailure = -1;
constexpr int kExitTimeout = -2;

#define ENUM_RESULT_KIND_ \
  X(SUCCESS) \
  X(GUEST_FAILURE) \
  X(RESOURCE_KILLED) \
  X(TIMEOUT) \
  X(INFRA_UNAVAILABLE) /* runtime not installed */ \
  X(INFRA_ERROR)
enum class ResultKind {
#define X(name) name,
  ENUM_RESULT_KIND_
#undef X
};

struct ExecutionResult {
  std::string output;
  // >= 0: exit status of the guest; otherwise kExitInfraFailure or kExitTimeout
  int exit_code;
  ResultKind kind;
};

// logging
const char* ResultKindName(ResultKind);

#endif  // INCLUDE_CODERUN_RESULT_H_
