#ifndef CODERUN_UTILS_H_
#define CODERUN_UTILS_H_

#include <string>
#include <filesystem>

#include <coderun/result.h>

namespace fs = std::filesystem;

#define IGNORE_RETURN(x) { auto _ __attribute__((unused)) = x; }

// close every descriptor >= minfd; async-signal-safe
int CloseFrom(int minfd);

bool RemoveAll(const fs::path&);

// PATH lookup like `which`; a name containing '/' is checked as is.
// Returns an empty path if nothing executable is found.
fs::path FindExecutable(const std::string& name);

#endif  // CODERUN_UTILS_H_
