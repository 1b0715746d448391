#include <sstream>

#include <gtest/gtest.h>
#include "config.h"
#include "utils.h"

TEST(ParseConfig, Defaults) {
  ServerConfig config;
  std::istringstream iss("");
  ASSERT_TRUE(ParseConfig(iss, config));
  EXPECT_EQ(config.host, "0.0.0.0");
  EXPECT_EQ(config.port, 5000);
  EXPECT_EQ(config.max_code_size, 5000);
  EXPECT_EQ(config.sandbox.image, "python:3.11-slim");
  EXPECT_EQ(config.sandbox.memory_limit_mib, 128);
  EXPECT_EQ(config.sandbox.network_mode, "none");
  EXPECT_EQ(config.sandbox.timeout.count(), 10);
  EXPECT_EQ(config.sandbox.max_output_bytes, 1024 * 1024);
}

TEST(ParseConfig, Overrides) {
  ServerConfig config;
  std::istringstream iss(R"([server]
host = 127.0.0.1
port = 8080
max_code_size = 100
static_dir = /srv/coderun

[sandbox]
image = python:3.12-alpine
memory_limit_mib = 64
pids_limit = 0
timeout = 3
max_output_bytes = 4096
staging_root = /var/tmp
)");
  ASSERT_TRUE(ParseConfig(iss, config));
  EXPECT_EQ(config.host, "127.0.0.1");
  EXPECT_EQ(config.port, 8080);
  EXPECT_EQ(config.max_code_size, 100);
  EXPECT_EQ(config.static_dir.string(), "/srv/coderun");
  EXPECT_EQ(config.sandbox.image, "python:3.12-alpine");
  EXPECT_EQ(config.sandbox.memory_limit_mib, 64);
  EXPECT_EQ(config.sandbox.pids_limit, 0);
  EXPECT_EQ(config.sandbox.timeout.count(), 3);
  EXPECT_EQ(config.sandbox.max_output_bytes, 4096);
  EXPECT_EQ(config.sandbox.staging_root.string(), "/var/tmp");
  // untouched keys keep their defaults
  EXPECT_EQ(config.sandbox.interpreter, "python");
  EXPECT_EQ(config.sandbox.guest_dir, "/app");
}

TEST(ParseConfig, InvalidValues) {
  for (const char* ini : {
      "[server]\nport = 70000\n",
      "[server]\nmax_code_size = 0\n",
      "[sandbox]\ntimeout = 0\n",
      "[sandbox]\nmemory_limit_mib = -1\n",
      "[sandbox]\nmax_output_bytes = 0\n",
      "[sandbox]\nguest_dir = app\n",
      "[sandbox]\nscript_name = a/b.py\n"}) {
    ServerConfig config;
    std::istringstream iss(ini);
    EXPECT_FALSE(ParseConfig(iss, config)) << ini;
  }
}

TEST(ParseConfig, File) {
  TempDir dir;
  WriteScript(dir.Path(), "coderun.conf", "[server]\nport = 6000\n");
  ServerConfig config;
  ASSERT_TRUE(ParseConfig(dir.Path() / "coderun.conf", config));
  EXPECT_EQ(config.port, 6000);
  EXPECT_FALSE(ParseConfig(dir.Path() / "missing.conf", config));
}
