#ifndef INCLUDE_DATAJAIL_BACKEND_H_
#define INCLUDE_DATAJAIL_BACKEND_H_

#include <string>

#include <datajail/execution.h>

class Workspace;

struct RawExecutionResult {
  int exit_code;
  int signal; // 0 if not killed by a signal
  bool timed_out;
  bool system_error; // the backend itself failed; no user code ran (or its result is unknown)
  std::string output, error; // stdout & stderr, truncated
  std::string message; // backend diagnosis, e.g. kill reason

  RawExecutionResult() : exit_code(0), signal(0), timed_out(false), system_error(false) {}
};

// How the generated program sees the workspace
struct WrapOptions {
  std::string data_dir;
  std::string output_dir;
  bool harden; // in-interpreter restrictions; only for backends without a container boundary

  WrapOptions() : harden(false) {}
};

// A backend decides where and how the generated program runs, never what it does.
class Backend {
 public:
  virtual ~Backend() = default;
  virtual BackendType Type() const = 0;
  virtual WrapOptions Layout() const = 0;
  // Must return (never hang) within the timeout plus a bounded overhead, and leave no
  // process or container behind.
  virtual RawExecutionResult Run(const std::string& program, const Workspace&, const ResourceLimits&) const = 0;
};

#endif  // INCLUDE_DATAJAIL_BACKEND_H_
