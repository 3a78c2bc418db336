#include "process_backend.h"

#include <fcntl.h>
#include <unistd.h>
#include <signal.h>
#include <cstring>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <datajail/workspace.h>
#include "paths.h"
#include "sandbox_exec.h"
#include "utils.h"

namespace {

constexpr long kCpuTimeMarginSeconds = 5;
constexpr int kMaxOpenFiles = 256;

class UidLease {
  UidPool& pool_;
  int uid_;
 public:
  explicit UidLease(UidPool& pool) : pool_(pool), uid_(pool.Acquire()) {}
  ~UidLease() { pool_.Release(uid_); }
  UidLease(const UidLease&) = delete;
  UidLease& operator=(const UidLease&) = delete;
  int Get() const { return uid_; }
};

class FileDescriptor {
  int fd_;
 public:
  explicit FileDescriptor(int fd) : fd_(fd) {}
  ~FileDescriptor() { if (fd_ >= 0) close(fd_); }
  FileDescriptor(const FileDescriptor&) = delete;
  FileDescriptor& operator=(const FileDescriptor&) = delete;
  int Get() const { return fd_; }
};

} // namespace

UidPool::UidPool(int base, int count) {
  // an empty pool would block every execution forever
  if (count <= 0) {
    spdlog::warn("Invalid uid pool size {}; using 1", count);
    count = 1;
  }
  for (int i = 0; i < count; i++) uid_pool_.push_back(base + i);
}

int UidPool::Acquire() {
  std::unique_lock lck(mtx_);
  cv_.wait(lck, [this]{ return !uid_pool_.empty(); });
  int uid = uid_pool_.back();
  uid_pool_.pop_back();
  return uid;
}

void UidPool::Release(int uid) {
  {
    std::lock_guard lck(mtx_);
    uid_pool_.push_back(uid);
  }
  cv_.notify_one();
}

ProcessBackend::ProcessBackend(const SandboxConfig& config) :
    python_(config.python),
    dirs_{"/usr", "/lib", "/lib64", "/lib32", "/libx32", "/etc/alternatives", "/bin"},
    uid_pool_(std::make_unique<UidPool>(config.uid_base, config.uid_count)) {
  dirs_.insert(dirs_.end(), config.bind_dirs.begin(), config.bind_dirs.end());
}

WrapOptions ProcessBackend::Layout() const {
  WrapOptions ret;
  ret.data_dir = WorkspaceDataDir(-1, true).string();
  ret.output_dir = WorkspaceOutputDir(-1, true).string();
  ret.harden = true;
  return ret;
}

RawExecutionResult ProcessBackend::Run(const std::string& program, const Workspace& ws,
                                       const ResourceLimits& limits) const {
  RawExecutionResult ret;
  if (!WriteFile(ws.Program(), program, kPerm644)) {
    ret.system_error = true;
    ret.message = "Failed writing the program into the workspace";
    return ret;
  }
  FileDescriptor fd_input(open("/dev/null", O_RDONLY | O_CLOEXEC));
  FileDescriptor fd_output(open(ws.Stdout().c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600));
  FileDescriptor fd_error(open(ws.Stderr().c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600));
  if (fd_input.Get() < 0 || fd_output.Get() < 0 || fd_error.Get() < 0) {
    spdlog::warn("Failed opening redirection files: id={} {}", ws.Id(), strerror(errno));
    ret.system_error = true;
    ret.message = "Failed preparing the sandbox streams";
    return ret;
  }

  UidLease uid(*uid_pool_);
  fs::path tmp_dir = WorkspaceTmpDir(-1, true);
  SandboxOptions opt;
  opt.boxdir = ws.Root().string();
  opt.command = {"/usr/bin/env", python_, "-u", WorkspaceProgram(-1, true).string()};
  opt.envs = {
    "PATH=/usr/local/bin:/usr/bin:/bin",
    "HOME=" + tmp_dir.string(),
    "TMPDIR=" + tmp_dir.string(),
    "MPLCONFIGDIR=" + tmp_dir.string(),
    "MPLBACKEND=Agg",
    "PYTHONDONTWRITEBYTECODE=1",
    "PYTHONUNBUFFERED=1",
    "PYTHONIOENCODING=utf-8",
    "OPENBLAS_NUM_THREADS=1",
    "OMP_NUM_THREADS=1",
    "MKL_NUM_THREADS=1",
  };
  opt.workdir = Workdir(fs::path("/")).string();
  opt.fd_input = fd_input.Get();
  opt.fd_output = fd_output.Get();
  opt.fd_error = fd_error.Get();
  opt.uid = opt.gid = uid.Get();
  opt.wall_time = limits.timeout_seconds * 1'000'000;
  opt.cpu_time = (limits.timeout_seconds + kCpuTimeMarginSeconds) * 1'000'000;
  opt.rss = opt.vss = limits.memory_limit_bytes / 1024;
  opt.proc_num = limits.max_processes;
  opt.file_num = kMaxOpenFiles;
  opt.fsize = limits.max_output_file_bytes / 1024;
  opt.dirs = dirs_;
  opt.FilterDirs();

  spdlog::info("Restricted execution started: id={} uid={}", ws.Id(), opt.uid);
  struct cjail_result res = SandboxExec(opt);
  ret.output = ReadFileTruncated(ws.Stdout(), kMaxStreamBytes);
  ret.error = ReadFileTruncated(ws.Stderr(), kMaxStreamBytes);
  if (res.timekill == -1) {
    ret.system_error = true;
    ret.message = fmt::format("Sandbox failed: {}", strerror(res.oomkill));
  } else if (res.timekill) {
    ret.timed_out = true;
  } else if (res.oomkill > 0) {
    ret.signal = SIGKILL;
    ret.exit_code = 128 + SIGKILL;
    ret.message = "Memory limit exceeded";
  } else if (res.info.si_code == CLD_KILLED || res.info.si_code == CLD_DUMPED) {
    ret.signal = res.info.si_status;
    ret.exit_code = 128 + ret.signal;
    if (ret.signal == SIGXCPU) {
      ret.timed_out = true;
    } else if (ret.signal == SIGXFSZ) {
      ret.message = "Output file size limit exceeded";
    } else {
      ret.message = fmt::format("Killed by signal {} ({})", ret.signal, strsignal(ret.signal));
    }
  } else {
    ret.exit_code = res.info.si_status;
  }
  spdlog::info("Restricted execution finished: id={} exit_code={} signal={} timed_out={} system_error={}",
               ws.Id(), ret.exit_code, ret.signal, ret.timed_out, ret.system_error);
  return ret;
}
