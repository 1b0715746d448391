#include <coderun/sanitize.h>

#include <algorithm>
#include <cctype>

const char kMessageOutOfMemory[] =
    "Execution failed: container was killed due to excessive memory usage.";
const char kMessageUnavailable[] = "Docker is not installed or not available in PATH.";

namespace {

constexpr char kWhitespace[] = " \t\n\r\v\f";
constexpr char kTracebackMarker[] = "Traceback";
// docker run reports 128 + SIGKILL for a container killed by the OOM killer
constexpr int kStatusKilled = 137;

std::string ToLower(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return str;
}

bool LooksKilled(const std::string& combined, int status) {
  if (status == kStatusKilled) return true;
  std::string low = ToLower(combined);
  return low.find("killed") != std::string::npos ||
         low.find("out of memory") != std::string::npos;
}

} // namespace

std::string Trim(const std::string& str) {
  size_t first = str.find_first_not_of(kWhitespace);
  if (first == std::string::npos) return "";
  size_t last = str.find_last_not_of(kWhitespace);
  return str.substr(first, last - first + 1);
}

ExecutionResult ClassifyOutcome(const std::string& out, const std::string& err, int status) {
  if (status == 0) return {Trim(out), 0, ResultKind::SUCCESS};
  std::string combined = Trim(out + '\n' + err);
  if (LooksKilled(combined, status)) {
    return {kMessageOutOfMemory, status, ResultKind::RESOURCE_KILLED};
  }
  return {std::move(combined), status, ResultKind::GUEST_FAILURE};
}

std::string ShortenTraceback(const std::string& msg) {
  if (msg.find(kTracebackMarker) == std::string::npos) return msg;
  // drop the line break ending the message, if any, so that the last line is non-empty
  size_t end = msg.size();
  if (end && msg[end - 1] == '\n') --end;
  if (end && msg[end - 1] == '\r') --end;
  size_t begin = msg.find_last_of("\r\n", end ? end - 1 : 0);
  begin = begin == std::string::npos ? 0 : begin + 1;
  return msg.substr(begin, end - begin);
}
