#include <chrono>

#include <gtest/gtest.h>
#include <datajail/execution.h>
#include <datajail/paths.h>
#include <datajail/utils.h>
#include "../src/datajail/container_backend.h"
#include "../src/datajail/process.h"
#include "../src/datajail/process_backend.h"
#include "utils.h"

namespace {

std::string ParamName(const ::testing::TestParamInfo<BackendType>& info) {
  return BackendTypeName(info.param);
}

bool HasImage(const std::string& image) {
  ProcessOptions opt;
  opt.envs = DockerClientEnv();
  opt.timeout_ms = 10'000;
  auto res = RunProcess({"docker", "image", "inspect", image}, opt);
  return res.started && res.exit_code == 0;
}

} // namespace

// Real executions; skipped where the backend cannot run on this machine
class EndToEnd : public testing::TestWithParam<BackendType> {
 protected:
  SandboxConfig config;
  std::unique_ptr<Executor> executor;
  fs::path uploads;

  void SetUp() override {
    config.limits.timeout_seconds = 20;
    if (GetParam() == BackendType::PROCESS) {
      if (!IsRoot()) GTEST_SKIP() << "the jail requires root";
      if (!fs::exists(internal::kDataDir / "sandbox-exec")) GTEST_SKIP() << "sandbox-exec not built";
      if (!HasPythonStack()) GTEST_SKIP() << "python3 with pandas & matplotlib not available";
      executor = std::make_unique<Executor>(std::make_unique<ProcessBackend>(config), config);
    } else {
      if (!HasDocker()) GTEST_SKIP() << "docker not available";
      if (!HasImage(config.image)) GTEST_SKIP() << "image " << config.image << " not built";
      executor = std::make_unique<Executor>(std::make_unique<ContainerBackend>(config), config);
    }
    uploads = kUploadsRoot / "e2e";
    fs::create_directories(uploads);
    WriteText(uploads / "orders.csv", "id,region,amount\n1,north,10.5\n2,south,20\n3,north,7\n");
    // the jailed user reads the copies, but the host side still needs this readable
    fs::permissions(uploads / "orders.csv", fs::perms::owner_read | fs::perms::owner_write |
                    fs::perms::group_read | fs::perms::others_read);
  }
  void TearDown() override {
    if (!uploads.empty()) fs::remove_all(uploads);
  }
};

TEST_P(EndToEnd, Scalar) {
  size_t before = CountWorkspaces();
  auto outcome = executor->Execute(ExecutionRequest("x = 5\nprint('done')"));
  ASSERT_TRUE(outcome.succeeded) << outcome.message << "\n" << outcome.traceback;
  ASSERT_TRUE(outcome.result_envelope);
  ASSERT_EQ(outcome.result_envelope->size(), 1u);
  auto& x = outcome.result_envelope->at("x");
  EXPECT_EQ(x.type, CapturedType::INT);
  EXPECT_EQ(x.data, 5);
  EXPECT_EQ(outcome.output, "done\n");
  EXPECT_EQ(CountWorkspaces(), before);
}

TEST_P(EndToEnd, DataFrame) {
  auto outcome = executor->Execute(ExecutionRequest(
      "shape = list(orders.shape)\n"
      "by_region = orders.groupby('region')['amount'].sum()\n"
      "top = orders[orders.amount > 8]\n"
      "ratio = float('nan')\n",
      {{"orders", "e2e/orders.csv"}}));
  ASSERT_TRUE(outcome.succeeded) << outcome.message << "\n" << outcome.traceback;
  auto& env = *outcome.result_envelope;
  EXPECT_EQ(env.at("shape").data, nlohmann::json({3, 3}));
  EXPECT_EQ(env.at("orders").type, CapturedType::DATAFRAME);
  EXPECT_EQ(env.at("orders").rows, 3);
  EXPECT_EQ(env.at("orders").cols, 3);
  EXPECT_EQ(env.at("top").rows, 2);
  EXPECT_EQ(env.at("by_region").type, CapturedType::SERIES);
  EXPECT_DOUBLE_EQ(env.at("by_region").data["north"].get<double>(), 17.5);
  EXPECT_EQ(env.at("by_region").name, "amount");
  EXPECT_TRUE(env.at("ratio").data.is_null());
}

TEST_P(EndToEnd, NonAsciiCode) {
  std::string label = "\xF0\x9F\x93\x8A Umsatz \xE2\x82\xAC";
  auto outcome = executor->Execute(ExecutionRequest(
      "label = '" + label + "'\nprint(label)\nplt.title(label)\n"));
  ASSERT_TRUE(outcome.succeeded) << outcome.message << "\n" << outcome.traceback;
  auto& env = *outcome.result_envelope;
  EXPECT_EQ(env.at("label").type, CapturedType::STR);
  EXPECT_EQ(env.at("label").data, label);
  EXPECT_EQ(outcome.output, label + "\n");
}

TEST_P(EndToEnd, Spreadsheet) {
  // the spreadsheet is written on the host; the sandbox needs openpyxl to read it
  ProcessOptions opt;
  opt.envs = {"PATH=/usr/local/bin:/usr/bin:/bin"};
  opt.timeout_ms = 60'000;
  auto res = RunProcess({"python3", "-c",
      "import sys, openpyxl\n"
      "wb = openpyxl.Workbook()\n"
      "ws = wb.active\n"
      "ws.append(['region', 'amount'])\n"
      "ws.append(['north', 10])\n"
      "ws.append(['south', 32.5])\n"
      "wb.save(sys.argv[1])\n",
      (uploads / "sales.xlsx").string()}, opt);
  if (!res.started || res.exit_code != 0) GTEST_SKIP() << "openpyxl not available on the host";
  fs::permissions(uploads / "sales.xlsx", fs::perms::owner_read | fs::perms::owner_write |
                  fs::perms::group_read | fs::perms::others_read);
  auto outcome = executor->Execute(ExecutionRequest(
      "total = float(sales['amount'].sum())\n", {{"sales", "e2e/sales.xlsx"}}));
  ASSERT_TRUE(outcome.succeeded) << outcome.message << "\n" << outcome.traceback;
  auto& env = *outcome.result_envelope;
  EXPECT_DOUBLE_EQ(env.at("total").data.get<double>(), 42.5);
  EXPECT_EQ(env.at("sales").type, CapturedType::DATAFRAME);
  EXPECT_EQ(env.at("sales").rows, 2);
  EXPECT_EQ(env.at("sales").columns, (std::vector<std::string>{"region", "amount"}));
}

TEST_P(EndToEnd, Plots) {
  auto outcome = executor->Execute(ExecutionRequest(
      "for i in range(7):\n    plt.figure()\n    plt.plot([1, 2, 3], [i, i * 2, i * 3])\n"));
  ASSERT_TRUE(outcome.succeeded) << outcome.message << "\n" << outcome.traceback;
  auto& plots = outcome.result_envelope->at("__plots");
  EXPECT_EQ(plots.type, CapturedType::PLOTS);
  EXPECT_EQ(plots.data.size(), 5u);
  EXPECT_EQ(plots.data[0], "plot_0.png");
}

TEST_P(EndToEnd, Timeout) {
  config.limits.timeout_seconds = 1;
  if (GetParam() == BackendType::PROCESS) {
    executor = std::make_unique<Executor>(std::make_unique<ProcessBackend>(config), config);
  } else {
    executor = std::make_unique<Executor>(std::make_unique<ContainerBackend>(config), config);
  }
  size_t before = CountWorkspaces();
  auto start = std::chrono::steady_clock::now();
  auto outcome = executor->Execute(ExecutionRequest("x = 0\nwhile True:\n    x += 1\n"));
  auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_FALSE(outcome.succeeded);
  EXPECT_EQ(outcome.failure_kind, FailureKind::TIMEOUT);
  EXPECT_FALSE(outcome.result_envelope);
  EXPECT_LT(elapsed, std::chrono::seconds(GetParam() == BackendType::PROCESS ? 4 : 15));
  EXPECT_EQ(CountWorkspaces(), before);
}

TEST_P(EndToEnd, RuntimeError) {
  auto outcome = executor->Execute(ExecutionRequest("x = 5\ny = x / 0\n"));
  EXPECT_FALSE(outcome.succeeded);
  EXPECT_EQ(outcome.failure_kind, FailureKind::RUNTIME_ERROR);
  EXPECT_NE(outcome.message.find("ZeroDivisionError"), std::string::npos) << outcome.message;
  EXPECT_NE(outcome.traceback.find("Traceback"), std::string::npos);
  EXPECT_FALSE(outcome.result_envelope);
}

TEST_P(EndToEnd, NoNetworkOrHostFiles) {
  // pandas itself can still reach the filesystem; the sandbox must not expose the host
  auto outcome = executor->Execute(ExecutionRequest("leak = pd.read_csv('/etc/shadow')\n"));
  EXPECT_FALSE(outcome.succeeded);
  EXPECT_EQ(outcome.failure_kind, FailureKind::RUNTIME_ERROR);
}

TEST_P(EndToEnd, HealthCheck) {
  auto status = executor->HealthCheck();
  EXPECT_TRUE(status.healthy) << status.error;
  EXPECT_EQ(status.backend, GetParam());
}

INSTANTIATE_TEST_SUITE_P(Backends, EndToEnd,
    testing::Values(BackendType::PROCESS, BackendType::CONTAINER),
    ParamName);
