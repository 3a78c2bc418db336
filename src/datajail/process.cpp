#include "process.h"

#include <poll.h>
#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <pthread.h>
#include <sys/wait.h>
#include <sys/resource.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <algorithm>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include "utils.h"

namespace {

// Reaps the child on every exit path; kills the whole group if it is still running
class ProcessGuard {
  pid_t pid_;
 public:
  explicit ProcessGuard(pid_t pid) : pid_(pid) {}
  ProcessGuard(const ProcessGuard&) = delete;
  ProcessGuard& operator=(const ProcessGuard&) = delete;
  ~ProcessGuard() {
    if (pid_ <= 0) return;
    KillGroup();
    int status;
    while (waitpid(pid_, &status, 0) < 0 && errno == EINTR);
  }

  void KillGroup() {
    if (pid_ > 0) kill(-pid_, SIGKILL);
  }
  // returns 0 if still running; the guard is released once the child is reaped
  pid_t Wait(int& status, bool block) {
    for (;;) {
      pid_t w = waitpid(pid_, &status, block ? 0 : WNOHANG);
      if (w == -1 && errno == EINTR) continue;
      if (w == pid_) pid_ = -1;
      return w;
    }
  }
};

struct Stream {
  int fd;
  std::string* buf;
  bool* truncated;
};

bool SetLimit(int resource, rlim_t value) {
  struct rlimit lim = {value, value};
  return setrlimit(resource, &lim) == 0;
}

} // namespace

ProcessResult RunProcess(const std::vector<std::string>& argv, const ProcessOptions& opt) {
  ProcessResult ret;
  if (argv.empty()) return ret;
  // argv/envp must be built before fork
  std::vector<char*> c_argv, c_envp;
  for (auto& i : argv) c_argv.push_back(const_cast<char*>(i.c_str()));
  c_argv.push_back(nullptr);
  for (auto& i : opt.envs) c_envp.push_back(const_cast<char*>(i.c_str()));
  c_envp.push_back(nullptr);

  int pipes[3][2] = {{-1, -1}, {-1, -1}, {-1, -1}};
  auto close_all = [&]() {
    for (auto& p : pipes) for (int& fd : p) {
      if (fd >= 0) close(fd);
      fd = -1;
    }
  };
  for (auto& p : pipes) {
    if (pipe2(p, O_CLOEXEC) < 0) {
      spdlog::warn("Failed creating pipe: {}", strerror(errno));
      close_all();
      return ret;
    }
  }
  pid_t pid = fork();
  if (pid < 0) {
    spdlog::warn("Failed forking for {}: {}", argv[0], strerror(errno));
    close_all();
    return ret;
  }
  if (pid == 0) {
    setpgid(0, 0);
    if (dup2(pipes[0][0], 0) < 0 || dup2(pipes[1][1], 1) < 0 || dup2(pipes[2][1], 2) < 0) _exit(127);
    CloseFrom(3);
    sigset_t empty;
    sigemptyset(&empty);
    sigprocmask(SIG_SETMASK, &empty, nullptr);
    signal(SIGPIPE, SIG_DFL);
    if ((opt.no_core && !SetLimit(RLIMIT_CORE, 0)) ||
        (opt.rlim_as && !SetLimit(RLIMIT_AS, opt.rlim_as)) ||
        (opt.rlim_cpu && !SetLimit(RLIMIT_CPU, opt.rlim_cpu)) ||
        (opt.rlim_fsize && !SetLimit(RLIMIT_FSIZE, opt.rlim_fsize)) ||
        (opt.rlim_proc && !SetLimit(RLIMIT_NPROC, opt.rlim_proc))) {
      _exit(127);
    }
    execvpe(c_argv[0], c_argv.data(), c_envp.data());
    _exit(127);
  }
  // also from the parent, so that a kill right after fork reaches the group
  setpgid(pid, pid);
  ProcessGuard guard(pid);
  ret.started = true;
  spdlog::debug("Spawned pid={} command={}", pid, fmt::format("{}", argv));
  close(pipes[0][0]), pipes[0][0] = -1;
  close(pipes[1][1]), pipes[1][1] = -1;
  close(pipes[2][1]), pipes[2][1] = -1;
  int in_fd = pipes[0][1], out_fd = pipes[1][0], err_fd = pipes[2][0];
  for (int fd : {in_fd, out_fd, err_fd}) fcntl(fd, F_SETFL, fcntl(fd, F_GETFL) | O_NONBLOCK);

  // writes to a closed stdin must fail with EPIPE instead of killing the host
  sigset_t pipe_set, old_set;
  sigemptyset(&pipe_set);
  sigaddset(&pipe_set, SIGPIPE);
  pthread_sigmask(SIG_BLOCK, &pipe_set, &old_set);

  size_t input_pos = 0;
  if (opt.input.empty()) close(in_fd), in_fd = pipes[0][1] = -1;
  Stream streams[2] = {{out_fd, &ret.output, &ret.output_truncated},
                       {err_fd, &ret.error, &ret.error_truncated}};
  auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(opt.timeout_ms);
  char buf[8192];
  while (streams[0].fd >= 0 || streams[1].fd >= 0) {
    int wait_ms = -1;
    if (opt.timeout_ms > 0) {
      auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - std::chrono::steady_clock::now()).count();
      if (left <= 0) {
        ret.timed_out = true;
        break;
      }
      wait_ms = left;
    }
    struct pollfd pfds[3];
    int nfds = 0;
    for (auto& s : streams) if (s.fd >= 0) pfds[nfds++] = {s.fd, POLLIN, 0};
    if (in_fd >= 0) pfds[nfds++] = {in_fd, POLLOUT, 0};
    int r = poll(pfds, nfds, wait_ms);
    if (r < 0) {
      if (errno == EINTR) continue;
      spdlog::warn("poll failed for pid={}: {}", pid, strerror(errno));
      break;
    }
    for (int i = 0; i < nfds; i++) {
      if (!pfds[i].revents) continue;
      if (pfds[i].fd == in_fd) {
        ssize_t sz = write(in_fd, opt.input.data() + input_pos, opt.input.size() - input_pos);
        if (sz > 0) input_pos += sz;
        if ((sz < 0 && errno != EAGAIN && errno != EINTR) || input_pos == opt.input.size()) {
          close(in_fd), in_fd = pipes[0][1] = -1;
        }
        continue;
      }
      for (auto& s : streams) {
        if (s.fd != pfds[i].fd) continue;
        ssize_t sz = read(s.fd, buf, sizeof(buf));
        if (sz < 0 && (errno == EAGAIN || errno == EINTR)) break;
        if (sz <= 0) {
          close(s.fd), s.fd = -1;
          break;
        }
        size_t room = opt.max_output > s.buf->size() ? opt.max_output - s.buf->size() : 0;
        if ((size_t)sz > room) *s.truncated = true;
        s.buf->append(buf, std::min((size_t)sz, room));
      }
    }
  }
  pipes[1][0] = streams[0].fd;
  pipes[2][0] = streams[1].fd;
  close_all();
  struct timespec zero = {0, 0};
  while (sigtimedwait(&pipe_set, nullptr, &zero) > 0);
  pthread_sigmask(SIG_SETMASK, &old_set, nullptr);

  int status = 0;
  pid_t w = 0;
  // the child may close its streams and keep running
  while (!ret.timed_out && opt.timeout_ms > 0 && (w = guard.Wait(status, false)) == 0) {
    if (std::chrono::steady_clock::now() >= deadline) {
      ret.timed_out = true;
      break;
    }
    usleep(10'000);
  }
  if (ret.timed_out) {
    spdlog::info("Process pid={} timed out after {} ms; killing", pid, opt.timeout_ms);
    guard.KillGroup();
  }
  if (w == 0) w = guard.Wait(status, true);
  if (w < 0) {
    spdlog::warn("waitpid failed for pid={}: {}", pid, strerror(errno));
    ret.started = false;
    return ret;
  }
  if (WIFEXITED(status)) {
    ret.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    ret.signal = WTERMSIG(status);
    ret.exit_code = 128 + ret.signal;
  }
  // the group may outlive its leader
  kill(-pid, SIGKILL);
  spdlog::debug("Process pid={} finished: exit_code={} signal={} timed_out={}",
                pid, ret.exit_code, ret.signal, ret.timed_out);
  return ret;
}
