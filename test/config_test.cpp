#include <unistd.h>

#include <gtest/gtest.h>
#include <datajail/paths.h>
#include "../src/config.h"
#include "utils.h"

class ConfigTest : public ::testing::Test {
 protected:
  fs::path file;
  fs::path box_root, uploads_root;
  void SetUp() override {
    file = fs::temp_directory_path() / ("datajail_test_" + std::to_string(getpid()) + ".conf");
    box_root = kBoxRoot;
    uploads_root = kUploadsRoot;
  }
  void TearDown() override {
    fs::remove(file);
    kBoxRoot = box_root;
    kUploadsRoot = uploads_root;
  }
};

TEST_F(ConfigTest, AllKeys) {
  WriteText(file, R"(box_root = /tmp/datajail_conf_box
uploads_root = /var/lib/datajail/uploads
backend = process

[limits]
timeout_seconds = 5
memory_limit_mb = 256
cpu_limit = 1.5
max_output_file_mb = 2
max_processes = 4

[container]
image = sandbox:test
dockerfile = /usr/share/datajail/Dockerfile.sandbox

[process]
python = /usr/bin/python3.11
syntax_check = false
uid_base = 61000
uid_count = 8
bind_dirs = /opt/conda,/srv/fonts
)");
  SandboxConfig config;
  ASSERT_TRUE(ParseConfig(file, config));
  EXPECT_EQ(kBoxRoot, fs::path("/tmp/datajail_conf_box"));
  EXPECT_EQ(kUploadsRoot, fs::path("/var/lib/datajail/uploads"));
  EXPECT_EQ(config.backend, "process");
  EXPECT_EQ(config.limits.timeout_seconds, 5);
  EXPECT_EQ(config.limits.memory_limit_bytes, 256L << 20);
  EXPECT_DOUBLE_EQ(config.limits.cpu_limit, 1.5);
  EXPECT_EQ(config.limits.max_output_file_bytes, 2L << 20);
  EXPECT_EQ(config.limits.max_processes, 4);
  EXPECT_EQ(config.image, "sandbox:test");
  EXPECT_EQ(config.dockerfile, fs::path("/usr/share/datajail/Dockerfile.sandbox"));
  EXPECT_EQ(config.python, "/usr/bin/python3.11");
  EXPECT_FALSE(config.syntax_check);
  EXPECT_EQ(config.uid_base, 61000);
  EXPECT_EQ(config.uid_count, 8);
  EXPECT_EQ(config.bind_dirs, (std::vector<std::string>{"/opt/conda", "/srv/fonts"}));
}

TEST_F(ConfigTest, DefaultsKept) {
  WriteText(file, "[limits]\ntimeout_seconds = 3\n");
  SandboxConfig config;
  ASSERT_TRUE(ParseConfig(file, config));
  SandboxConfig defaults;
  EXPECT_EQ(config.limits.timeout_seconds, 3);
  EXPECT_EQ(config.limits.memory_limit_bytes, defaults.limits.memory_limit_bytes);
  EXPECT_EQ(config.backend, "auto");
  EXPECT_EQ(config.image, defaults.image);
  EXPECT_TRUE(config.syntax_check);
  EXPECT_EQ(kBoxRoot, box_root);
}

TEST_F(ConfigTest, Invalid) {
  SandboxConfig config;
  EXPECT_FALSE(ParseConfig(file.string() + ".missing", config));
  WriteText(file, "[limits]\ntimeout_seconds = 0\n");
  EXPECT_FALSE(ParseConfig(file, config));
  config = SandboxConfig();
  WriteText(file, "[limits]\ntimeout_seconds = -5\n");
  EXPECT_FALSE(ParseConfig(file, config));
  config = SandboxConfig();
  WriteText(file, "[process]\nuid_count = 0\n");
  EXPECT_FALSE(ParseConfig(file, config));
}
