#include "utils.h"

#include <unistd.h>
#include <fstream>
#include <sstream>

#include <datajail/paths.h>
#include "../src/datajail/process.h"

WrapOptions FakeBackend::Layout() const {
  WrapOptions ret;
  ret.data_dir = "/fake/data";
  ret.output_dir = "/fake/output";
  ret.harden = type == BackendType::PROCESS;
  return ret;
}

RawExecutionResult FakeBackend::Run(const std::string& program, const Workspace& ws,
                                    const ResourceLimits&) const {
  record->calls++;
  record->program = program;
  record->root = ws.Root();
  for (auto& entry : std::filesystem::directory_iterator(ws.DataDir())) {
    record->data_files[entry.path().filename().string()] = ReadText(entry.path());
  }
  if (action) action(ws);
  return result;
}

void WriteText(const std::filesystem::path& path, const std::string& content) {
  std::ofstream fout(path, std::ios::binary);
  fout << content;
}

std::string ReadText(const std::filesystem::path& path) {
  std::ifstream fin(path, std::ios::binary);
  std::stringstream ss;
  ss << fin.rdbuf();
  return ss.str();
}

size_t CountWorkspaces() {
  std::error_code ec;
  if (!std::filesystem::is_directory(kBoxRoot, ec)) return 0;
  size_t ret = 0;
  for (auto it = std::filesystem::directory_iterator(kBoxRoot, ec);
       !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
    ret++;
  }
  return ret;
}

bool IsRoot() {
  return geteuid() == 0;
}

bool HasPythonStack() {
  ProcessOptions opt;
  opt.envs = {"PATH=/usr/local/bin:/usr/bin:/bin"};
  opt.timeout_ms = 60'000;
  auto res = RunProcess({"python3", "-c", "import pandas, numpy, matplotlib"}, opt);
  return res.started && res.exit_code == 0;
}

bool HasDocker() {
  static const bool available = ContainerRuntimeAvailable();
  return available;
}
