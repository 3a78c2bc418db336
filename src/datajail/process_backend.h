#ifndef DATAJAIL_PROCESS_BACKEND_H_
#define DATAJAIL_PROCESS_BACKEND_H_

#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <condition_variable>

#include <datajail/backend.h>

// Concurrent executions never share a uid, so RLIMIT_NPROC is per execution.
// Acquire blocks while every uid is leased.
class UidPool {
  std::mutex mtx_;
  std::condition_variable cv_;
  std::vector<int> uid_pool_;
 public:
  UidPool(int base, int count);
  UidPool(const UidPool&) = delete;
  UidPool& operator=(const UidPool&) = delete;
  int Acquire();
  void Release(int uid);
};

// Degraded-mode fallback: a cjail jail rooted at the workspace, with the system
// directories bind-mounted, a fixed environment and rlimits. No network isolation.
class ProcessBackend : public Backend {
  std::string python_;
  std::vector<std::string> dirs_;
  std::unique_ptr<UidPool> uid_pool_;
 public:
  explicit ProcessBackend(const SandboxConfig&);
  BackendType Type() const override { return BackendType::PROCESS; }
  WrapOptions Layout() const override;
  RawExecutionResult Run(const std::string& program, const Workspace&, const ResourceLimits&) const override;
};

#endif  // DATAJAIL_PROCESS_BACKEND_H_
