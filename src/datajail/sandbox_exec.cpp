#include "sandbox_exec.h"

#include <poll.h>
#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <cerrno>
#include <cstring>
#include <pthread.h>
#include <algorithm>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include "paths.h"
#include "utils.h"

namespace {

constexpr long kHelperGraceMs = 5000;

bool WriteAll(int fd, const void* buf, size_t len) {
  const char* ptr = (const char*)buf;
  while (len) {
    ssize_t ret = write(fd, ptr, len);
    if (ret < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    ptr += ret;
    len -= ret;
  }
  return true;
}

// false with errno = ETIMEDOUT if the helper has not answered before the deadline
bool ReadResult(int fd, struct cjail_result& res, long timeout_ms) {
  char* ptr = (char*)&res;
  size_t len = sizeof(res);
  while (len) {
    struct pollfd pfd = {fd, POLLIN, 0};
    int ret = poll(&pfd, 1, timeout_ms);
    if (ret < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    if (ret == 0) {
      errno = ETIMEDOUT;
      return false;
    }
    ssize_t sz = read(fd, ptr, len);
    if (sz < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    if (sz == 0) {
      errno = EPIPE;
      return false;
    }
    ptr += sz;
    len -= sz;
  }
  return true;
}

} // namespace

struct cjail_result SandboxExec(const SandboxOptions& opt) {
  struct cjail_result ret = {};
  int inpipe[2], outpipe[2];
  pid_t pid;
  if (pipe2(inpipe, O_CLOEXEC) < 0) goto err;
  if (pipe2(outpipe, O_CLOEXEC) < 0) {
    int saved = errno;
    close(inpipe[0]), close(inpipe[1]);
    errno = saved;
    goto err;
  }
  pid = fork();
  if (pid < 0) {
    int saved = errno;
    close(inpipe[0]), close(inpipe[1]);
    close(outpipe[0]), close(outpipe[1]);
    errno = saved;
    goto err;
  }
  if (pid == 0) {
    dup2(inpipe[1], 1);
    dup2(outpipe[0], 0);
    // keep the jail's redirected streams; everything else (other executions' pipes) goes
    int keep = 3;
    for (int fd : {opt.fd_input, opt.fd_output, opt.fd_error}) keep = std::max(keep, fd + 1);
    for (int fd = 3; fd < keep; fd++) {
      if (fd != opt.fd_input && fd != opt.fd_output && fd != opt.fd_error) {
        close(fd);
      } else {
        fcntl(fd, F_SETFD, 0); // opened with O_CLOEXEC by the caller
      }
    }
    CloseFrom(keep);
    auto cmd = SandboxExecPath();
    execl(cmd.c_str(), cmd.c_str(), nullptr);
    _exit(1);
  }
  {
    spdlog::debug("cjail_exec pid={} childpid={} boxdir={} command={}",
        getpid(), pid, opt.boxdir, fmt::format("{}", opt.command));
    close(inpipe[1]);
    close(outpipe[0]);
    auto vec = opt.Serialize();
    long size = vec.size();
    // the helper may die before reading; report it instead of dying on SIGPIPE
    sigset_t pipe_set, old_set;
    sigemptyset(&pipe_set);
    sigaddset(&pipe_set, SIGPIPE);
    pthread_sigmask(SIG_BLOCK, &pipe_set, &old_set);
    bool ok = WriteAll(outpipe[1], &size, sizeof(size)) &&
              WriteAll(outpipe[1], vec.data(), vec.size());
    int saved = errno;
    struct timespec zero = {0, 0};
    while (sigtimedwait(&pipe_set, nullptr, &zero) > 0);
    pthread_sigmask(SIG_SETMASK, &old_set, nullptr);
    errno = saved;
    close(outpipe[1]);
    if (ok) ok = ReadResult(inpipe[0], ret, opt.wall_time / 1000 + kHelperGraceMs);
    saved = errno;
    close(inpipe[0]);
    if (!ok) {
      kill(pid, SIGKILL);
      waitpid(pid, nullptr, 0);
      errno = saved;
      goto err;
    }
  }
  waitpid(pid, nullptr, 0);
  if (ret.timekill == -1) {
    spdlog::warn("cjail_exec error: errno={} {}", ret.oomkill, strerror(ret.oomkill));
  }
  return ret;
err:
  spdlog::warn("SandboxExec error: errno={} {}", errno, strerror(errno));
  ret.oomkill = errno;
  ret.timekill = -1;
  return ret;
}
