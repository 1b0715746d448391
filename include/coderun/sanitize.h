#ifndef INCLUDE_CODERUN_SANITIZE_H_
#define INCLUDE_CODERUN_SANITIZE_H_

#include <string>

#include "result.h"

extern const char kMessageOutOfMemory[];
extern const char kMessageUnavailable[];

std::string Trim(const std::string&);

// Turn the raw outcome of a finished (not timed out) container into a result.
// stderr is only reported when the guest failed.
ExecutionResult ClassifyOutcome(const std::string& out, const std::string& err, int status);

// Keep only the last line of a message carrying a Python traceback.
std::string ShortenTraceback(const std::string&);

#endif  // INCLUDE_CODERUN_SANITIZE_H_
