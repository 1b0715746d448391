#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include "staging.h"
#include "utils.h"

namespace {

std::string ReadFile(const fs::path& path) {
  std::ifstream fin(path);
  std::stringstream ss;
  ss << fin.rdbuf();
  return ss.str();
}

} // namespace

TEST(Dedent, CommonIndent) {
  EXPECT_EQ(Dedent("    if x:\n        y()\n    z()\n"), "if x:\n    y()\nz()\n");
}

TEST(Dedent, NoIndent) {
  EXPECT_EQ(Dedent("print(1)\n  print(2)"), "print(1)\n  print(2)");
}

TEST(Dedent, BlankLinesIgnored) {
  EXPECT_EQ(Dedent("  a\n\n      \n  b"), "a\n\n\nb");
}

TEST(Dedent, TabsAndSpacesDiffer) {
  EXPECT_EQ(Dedent("\ta\n    b\n"), "\ta\n    b\n");
  EXPECT_EQ(Dedent("\t  a\n\t b\n"), " a\nb\n");
}

TEST(Dedent, CarriageReturns) {
  EXPECT_EQ(Dedent("  a\r\n  \r\n  b\r\n"), "a\r\n\r\nb\r\n");
  // a line holding only '\r' has no indentation, so nothing is removed
  EXPECT_EQ(Dedent("  a\r\n\r\n  b\r\n"), "  a\r\n\r\n  b\r\n");
}

TEST(Dedent, WhitespaceOnly) {
  EXPECT_EQ(Dedent(""), "");
  EXPECT_EQ(Dedent("   \n\t\n"), "\n\n");
}

class StagedArtifactTest : public ::testing::Test {
 protected:
  TempDir root;
};

TEST_F(StagedArtifactTest, WritesSingleFile) {
  fs::path dir;
  {
    StagedArtifact artifact(root.Path(), "script.py", "  print('hi')\n");
    dir = artifact.Dir();
    EXPECT_EQ(dir.parent_path().string(), root.Path().string());
    EXPECT_EQ(artifact.File().string(), (dir / "script.py").string());
    EXPECT_EQ(CountEntries(dir), 1u);
    EXPECT_EQ(ReadFile(artifact.File()), "print('hi')\n");
    EXPECT_EQ(artifact.Id().size(), 6u);
    auto perms = fs::status(artifact.File()).permissions();
    EXPECT_NE(perms & fs::perms::others_read, fs::perms::none);
    EXPECT_EQ(perms & fs::perms::others_write, fs::perms::none);
    EXPECT_NE(fs::status(dir).permissions() & fs::perms::others_exec, fs::perms::none);
  }
  EXPECT_FALSE(fs::exists(dir));
  EXPECT_EQ(CountEntries(root.Path()), 0u);
}

TEST_F(StagedArtifactTest, RemovedOnException) {
  fs::path dir;
  try {
    StagedArtifact artifact(root.Path(), "script.py", "raise");
    dir = artifact.Dir();
    throw std::runtime_error("downstream failure");
  } catch (const std::runtime_error&) {
  }
  EXPECT_FALSE(dir.empty());
  EXPECT_FALSE(fs::exists(dir));
}

TEST_F(StagedArtifactTest, UniquePerInvocation) {
  StagedArtifact a(root.Path(), "script.py", "a");
  StagedArtifact b(root.Path(), "script.py", "b");
  EXPECT_NE(a.Dir().string(), b.Dir().string());
  EXPECT_NE(a.Id(), b.Id());
  EXPECT_EQ(ReadFile(a.File()), "a");
  EXPECT_EQ(ReadFile(b.File()), "b");
}

TEST_F(StagedArtifactTest, MissingRootThrows) {
  EXPECT_THROW(StagedArtifact(root.Path() / "missing", "script.py", "x"), std::system_error);
  EXPECT_EQ(CountEntries(root.Path()), 0u);
}
