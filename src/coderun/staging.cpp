#include "staging.h"

#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <vector>
#include <system_error>

#include <spdlog/spdlog.h>
#include "utils.h"

namespace {

constexpr char kDirPrefix[] = "coderun-";
constexpr char kWhitespace[] = " \t";

std::vector<std::string> SplitLines(const std::string& text) {
  std::vector<std::string> lines;
  size_t begin = 0;
  while (begin < text.size()) {
    size_t end = text.find('\n', begin);
    if (end == std::string::npos) end = text.size() - 1;
    lines.push_back(text.substr(begin, end - begin + 1)); // keep '\n'
    begin = end + 1;
  }
  return lines;
}

std::string LeadingWhitespace(const std::string& line) {
  return line.substr(0, line.find_first_not_of(kWhitespace));
}

// '\r' is content, so CRLF lines keep their line ends and count towards the margin
bool IsBlank(const std::string& line) {
  return line.find_first_not_of(" \t\n") == std::string::npos;
}

void WriteAll(int fd, const std::string& data, const fs::path& path) {
  size_t done = 0;
  while (done < data.size()) {
    ssize_t n = write(fd, data.data() + done, data.size() - done);
    if (n < 0) {
      if (errno == EINTR) continue;
      throw std::system_error(errno, std::generic_category(), "write " + path.string());
    }
    done += n;
  }
}

} // namespace

std::string Dedent(const std::string& text) {
  std::vector<std::string> lines = SplitLines(text);
  bool has_margin = false;
  std::string margin;
  for (auto& line : lines) {
    if (IsBlank(line)) continue;
    std::string indent = LeadingWhitespace(line);
    if (!has_margin) {
      margin = indent;
      has_margin = true;
      continue;
    }
    size_t common = 0;
    while (common < margin.size() && common < indent.size() && margin[common] == indent[common]) {
      common++;
    }
    margin.resize(common);
  }
  std::string ret;
  ret.reserve(text.size());
  for (auto& line : lines) {
    if (IsBlank(line)) {
      if (line.back() == '\n') ret += '\n';
    } else {
      ret.append(line, margin.size());
    }
  }
  return ret;
}

StagedArtifact::StagedArtifact(
    const fs::path& root, const std::string& name, const std::string& source) {
  std::string templ = (root / (std::string(kDirPrefix) + "XXXXXX")).string();
  if (!mkdtemp(templ.data())) {
    throw std::system_error(errno, std::generic_category(), "mkdtemp " + templ);
  }
  dir_ = templ;
  id_ = templ.substr(templ.size() - 6);
  file_ = dir_ / name;
  try {
    // the container user is not the owner; grant read and traverse to everyone
    fs::permissions(dir_, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                    fs::perms::others_read | fs::perms::others_exec);
    int fd = open(file_.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd < 0) throw std::system_error(errno, std::generic_category(), "open " + file_.string());
    try {
      WriteAll(fd, Dedent(source), file_);
    } catch (...) {
      close(fd);
      throw;
    }
    if (close(fd) < 0) throw std::system_error(errno, std::generic_category(), "close " + file_.string());
    // umask may have masked the mode given to open
    fs::permissions(file_, fs::perms::owner_read | fs::perms::owner_write |
                    fs::perms::group_read | fs::perms::others_read);
  } catch (...) {
    RemoveAll(dir_);
    throw;
  }
  spdlog::debug("Staged {} bytes at {}", source.size(), file_.c_str());
}

StagedArtifact::~StagedArtifact() {
  RemoveAll(dir_);
}
