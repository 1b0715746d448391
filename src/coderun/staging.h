#ifndef CODERUN_STAGING_H_
#define CODERUN_STAGING_H_

#include <string>
#include <filesystem>

namespace fs = std::filesystem;

// Remove the common leading whitespace of all non-blank lines.
// Lines of only spaces and tabs are emptied and do not count towards the margin;
// any other character, '\r' included, makes a line count.
std::string Dedent(const std::string&);

// A per-invocation directory holding exactly one script file.
// The directory is removed when the object goes out of scope, on every path.
class StagedArtifact {
  fs::path dir_, file_;
  std::string id_;
 public:
  // throws std::system_error if the directory or the file cannot be created
  StagedArtifact(const fs::path& root, const std::string& name, const std::string& source);
  ~StagedArtifact();
  StagedArtifact(const StagedArtifact&) = delete;
  StagedArtifact& operator=(const StagedArtifact&) = delete;

  const fs::path& Dir() const { return dir_; }
  const fs::path& File() const { return file_; }
  // unique among live artifacts
  const std::string& Id() const { return id_; }
};

#endif  // CODERUN_STAGING_H_
