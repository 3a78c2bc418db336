#include <atomic>
#include <chrono>
#include <thread>

#include <gtest/gtest.h>
#include "../src/datajail/process_backend.h"
#include "../src/datajail/sandbox.h"

namespace {

SandboxOptions ExampleOptions() {
  SandboxOptions opt;
  opt.boxdir = "/tmp/datajail_box/1-000001";
  opt.command = {"/usr/bin/env", "python3", "-u", "/workdir/program.py"};
  opt.envs = {"PATH=/usr/bin:/bin", "HOME=/workdir/tmp"};
  opt.workdir = "/workdir";
  opt.fd_output = 5;
  opt.uid = opt.gid = 50001;
  opt.wall_time = 30'500'000;
  opt.cpu_time = 35'000'000;
  opt.rss = opt.vss = 512 * 1024;
  opt.proc_num = 16;
  opt.file_num = 256;
  opt.fsize = 10240;
  opt.dirs = {"/usr", "/bin"};
  return opt;
}

} // namespace

TEST(SandboxOptions, Serialize) {
  SandboxOptions opt = ExampleOptions();
  SandboxOptions copy;
  ASSERT_TRUE(SandboxOptions::Parse(opt.Serialize(), copy));
  EXPECT_EQ(copy.boxdir, opt.boxdir);
  EXPECT_EQ(copy.command, opt.command);
  EXPECT_EQ(copy.envs, opt.envs);
  EXPECT_EQ(copy.workdir, opt.workdir);
  EXPECT_EQ(copy.fd_input, -1);
  EXPECT_EQ(copy.fd_output, 5);
  EXPECT_EQ(copy.uid, 50001);
  EXPECT_EQ(copy.cpu_time, opt.cpu_time);
  EXPECT_EQ(copy.vss, opt.vss);
  EXPECT_EQ(copy.dirs, opt.dirs);
}

TEST(SandboxOptions, RejectsBrokenMessage) {
  auto vec = ExampleOptions().Serialize();
  SandboxOptions copy;
  EXPECT_FALSE(SandboxOptions::Parse(std::vector<uint8_t>(vec.begin(), vec.begin() + vec.size() / 2), copy));
  EXPECT_FALSE(SandboxOptions::Parse({}, copy));
  EXPECT_FALSE(SandboxOptions::Parse({0x01, 0x02, 0x03}, copy));
  // well-formed but without a command
  SandboxOptions empty;
  EXPECT_FALSE(SandboxOptions::Parse(empty.Serialize(), copy));
}

TEST(SandboxOptions, FilterDirs) {
  SandboxOptions opt;
  opt.dirs = {"/", "/nonexistent/datajail", "/proc/self/status"};
  opt.FilterDirs();
  EXPECT_EQ(opt.dirs, (std::vector<std::string>{"/"}));
}

TEST(SandboxOptions, ToCJailCtx) {
  SandboxOptions opt = ExampleOptions();
  JailContext jail;
  opt.ToCJailCtx(jail);
  const struct cjail_ctx& ctx = jail.Get();
  EXPECT_STREQ(ctx.argv[0], "/usr/bin/env");
  EXPECT_STREQ(ctx.argv[3], "/workdir/program.py");
  EXPECT_EQ(ctx.argv[4], nullptr);
  EXPECT_STREQ(ctx.environ[1], "HOME=/workdir/tmp");
  EXPECT_EQ(ctx.environ[2], nullptr);
  EXPECT_STREQ(ctx.chroot, opt.boxdir.c_str());
  EXPECT_EQ(ctx.fd_output, 5);
  EXPECT_EQ(ctx.uid, 50001u);
  EXPECT_EQ(ctx.rlim_core, 0);
  EXPECT_EQ(ctx.lim_time.tv_sec, 30);
  EXPECT_EQ(ctx.lim_time.tv_usec, 500'000);
  EXPECT_EQ(ctx.lim_cputime.tv_sec, 35);
  EXPECT_EQ(jail.MountCount(), 2u);
}

TEST(UidPool, LeasesFromConfiguredRange) {
  UidPool pool(61000, 2);
  int a = pool.Acquire();
  int b = pool.Acquire();
  EXPECT_NE(a, b);
  for (int uid : {a, b}) {
    EXPECT_GE(uid, 61000);
    EXPECT_LT(uid, 61002);
  }
  pool.Release(a);
  EXPECT_EQ(pool.Acquire(), a);
}

TEST(UidPool, AcquireWaitsForRelease) {
  UidPool pool(61000, 1);
  int uid = pool.Acquire();
  std::atomic_bool acquired = false;
  std::thread waiter([&]() {
    EXPECT_EQ(pool.Acquire(), uid);
    acquired = true;
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  EXPECT_FALSE(acquired);
  pool.Release(uid);
  waiter.join();
  EXPECT_TRUE(acquired);
}

TEST(UidPool, EmptyRangeStillUsable) {
  UidPool pool(61000, 0);
  EXPECT_EQ(pool.Acquire(), 61000);
}
