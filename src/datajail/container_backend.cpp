#include "container_backend.h"

#include <unistd.h>
#include <cstdlib>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <datajail/workspace.h>
#include "paths.h"
#include "process.h"
#include "utils.h"

namespace {

constexpr long kProbeTimeoutMs = 10'000;
constexpr long kRemoveTimeoutMs = 30'000;
constexpr long kBuildTimeoutMs = 30 * 60'000;
// reported by the docker client itself, not by the program
constexpr int kDockerErrorMin = 125, kDockerErrorMax = 127;
constexpr int kOomExitCode = 128 + 9;

void AppendTruncationMarker(std::string& str, bool truncated) {
  if (truncated) str += "\n[Output truncated after " + std::to_string(kMaxStreamBytes) + " bytes]";
}

void RemoveContainer(const std::string& name) {
  ProcessOptions opt;
  opt.envs = DockerClientEnv();
  opt.timeout_ms = kRemoveTimeoutMs;
  ProcessResult res = RunProcess({"docker", "rm", "-f", name}, opt);
  if (!res.started || res.exit_code != 0) {
    spdlog::warn("Failed removing container {}: exit_code={} {}", name, res.exit_code, res.error);
  } else {
    spdlog::debug("Container removed: name={}", name);
  }
}

} // namespace

std::vector<std::string> DockerClientEnv() {
  std::vector<std::string> ret = {"PATH=/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin"};
  for (const char* name : {"HOME", "DOCKER_HOST", "DOCKER_CONFIG", "DOCKER_CONTEXT",
                           "DOCKER_CERT_PATH", "DOCKER_TLS_VERIFY"}) {
    if (const char* value = getenv(name)) ret.push_back(fmt::format("{}={}", name, value));
  }
  return ret;
}

ContainerBackend::ContainerBackend(const SandboxConfig& config) :
    image_(config.image), cpu_limit_(config.limits.cpu_limit) {}

WrapOptions ContainerBackend::Layout() const {
  WrapOptions ret;
  ret.data_dir = fmt::format("{}/data", kContainerWorkspace);
  ret.output_dir = kContainerOutput;
  ret.harden = false;
  return ret;
}

std::vector<std::string> ContainerBackend::RunCommand(const std::string& name, const Workspace& ws,
                                                      const ResourceLimits& limits) const {
  return {
    "docker", "run", "--rm",
    "--name", name,
    "--network", "none",
    "--read-only",
    "--cap-drop", "ALL",
    "--security-opt", "no-new-privileges",
    "--memory", std::to_string(limits.memory_limit_bytes),
    "--memory-swap", std::to_string(limits.memory_limit_bytes),
    "--cpus", fmt::format("{}", cpu_limit_),
    "--pids-limit", std::to_string(limits.max_processes),
    "--ulimit", fmt::format("fsize={}", limits.max_output_file_bytes),
    "--ulimit", "core=0",
    "--tmpfs", "/tmp:rw,noexec,nosuid,size=64m",
    "-e", "HOME=/tmp",
    "-e", "MPLCONFIGDIR=/tmp",
    "-e", "PYTHONIOENCODING=utf-8",
    "-v", fmt::format("{}:{}:ro", ws.Workdir().c_str(), kContainerWorkspace),
    "-v", fmt::format("{}:{}:rw", ws.OutputDir().c_str(), kContainerOutput),
    "--entrypoint", "python3",
    image_,
    "-u", fmt::format("{}/{}", kContainerWorkspace, ws.Program().filename().c_str()),
  };
}

RawExecutionResult ContainerBackend::Run(const std::string& program, const Workspace& ws,
                                         const ResourceLimits& limits) const {
  RawExecutionResult ret;
  if (!WriteFile(ws.Program(), program, kPerm644)) {
    ret.system_error = true;
    ret.message = "Failed writing the program into the workspace";
    return ret;
  }
  std::string name = fmt::format("datajail-{}-{}", getpid(), ws.Id());
  ProcessOptions opt;
  opt.envs = DockerClientEnv();
  opt.timeout_ms = limits.timeout_seconds * 1000;
  opt.max_output = kMaxStreamBytes;
  spdlog::info("Container execution started: id={} name={} image={}", ws.Id(), name, image_);
  ProcessResult res = RunProcess(RunCommand(name, ws, limits), opt);
  ret.output = std::move(res.output);
  ret.error = std::move(res.error);
  AppendTruncationMarker(ret.output, res.output_truncated);
  AppendTruncationMarker(ret.error, res.error_truncated);
  if (!res.started) {
    ret.system_error = true;
    ret.message = "Container runtime unavailable";
  } else if (res.timed_out) {
    // the killed client leaves the container running
    ret.timed_out = true;
    RemoveContainer(name);
  } else if (res.exit_code >= kDockerErrorMin && res.exit_code <= kDockerErrorMax) {
    ret.system_error = true;
    ret.exit_code = res.exit_code;
    ret.message = fmt::format("Container failed to start (exit code {})", res.exit_code);
    RemoveContainer(name);
  } else {
    ret.exit_code = res.exit_code;
    ret.signal = res.signal;
    if (res.exit_code == kOomExitCode) ret.message = "Memory limit exceeded";
  }
  spdlog::info("Container execution finished: id={} exit_code={} timed_out={} system_error={}",
               ws.Id(), ret.exit_code, ret.timed_out, ret.system_error);
  return ret;
}

bool ContainerRuntimeAvailable() {
  ProcessOptions opt;
  opt.envs = DockerClientEnv();
  opt.timeout_ms = kProbeTimeoutMs;
  ProcessResult res = RunProcess({"docker", "version", "--format", "{{.Server.Version}}"}, opt);
  bool ok = res.started && !res.timed_out && res.exit_code == 0;
  spdlog::debug("Docker probe: available={} version={}", ok, res.output);
  return ok;
}

bool BuildSandboxImage(const SandboxConfig& config) {
  std::error_code ec;
  if (!fs::is_regular_file(config.dockerfile, ec)) {
    spdlog::error("Dockerfile {} not found", config.dockerfile.c_str());
    return false;
  }
  fs::path context = config.dockerfile.parent_path();
  if (context.empty()) context = ".";
  ProcessOptions opt;
  opt.envs = DockerClientEnv();
  opt.timeout_ms = kBuildTimeoutMs;
  opt.max_output = 64 * 1024;
  spdlog::info("Building sandbox image: image={} dockerfile={}", config.image, config.dockerfile.c_str());
  ProcessResult res = RunProcess({"docker", "build", "-t", config.image, "-f",
                                  config.dockerfile.string(), context.string()}, opt);
  if (!res.started || res.timed_out || res.exit_code != 0) {
    spdlog::error("Failed to build sandbox image: exit_code={} timed_out={} {}",
                  res.exit_code, res.timed_out, res.error);
    return false;
  }
  spdlog::info("Sandbox image built: image={}", config.image);
  return true;
}
