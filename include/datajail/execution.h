#ifndef INCLUDE_DATAJAIL_EXECUTION_H_
#define INCLUDE_DATAJAIL_EXECUTION_H_

#include <map>
#include <memory>
#include <string>
#include <vector>
#include <optional>
#include <filesystem>

#include <nlohmann/json.hpp>

#define ENUM_FAILURE_KIND_ \
  X(NONE, "", "nil") \
  /* rejected before any sandbox is created */ \
  X(VALIDATION_ERROR, "ValidationError", "Code rejected by validation") \
  /* anticipated outcomes of running untrusted code */ \
  X(TIMEOUT, "Timeout", "Execution exceeded the time limit") \
  X(RUNTIME_ERROR, "RuntimeError", "Execution failed") \
  /* service fault, not a user-code fault */ \
  X(INFRASTRUCTURE_ERROR, "InfrastructureError", "Sandbox infrastructure failure")
enum class FailureKind {
#define X(name, abr, desc) name,
  ENUM_FAILURE_KIND_
#undef X
};

#define ENUM_CAPTURED_TYPE_ \
  X(DATAFRAME, "dataframe") \
  X(SERIES, "series") \
  X(INT, "int") \
  X(FLOAT, "float") \
  X(STR, "str") \
  X(BOOL, "bool") \
  X(LIST, "list") \
  X(DICT, "dict") \
  X(PLOTS, "plots")
enum class CapturedType {
#define X(name, typname) name,
  ENUM_CAPTURED_TYPE_
#undef X
};

#define ENUM_BACKEND_TYPE_ \
  X(CONTAINER, "container") \
  X(PROCESS, "process")
enum class BackendType {
#define X(name, typname) name,
  ENUM_BACKEND_TYPE_
#undef X
};

// Shared read-only by every execution of one backend instance
struct ResourceLimits {
  long timeout_seconds;
  long memory_limit_bytes;
  double cpu_limit; // number of CPUs (container only)
  long max_output_file_bytes;
  int max_processes;

  ResourceLimits() :
      timeout_seconds(30),
      memory_limit_bytes(512L * 1024 * 1024),
      cpu_limit(0.5),
      max_output_file_bytes(10L * 1024 * 1024),
      max_processes(16) {}
  // every limit positive; a zero timeout would mean no wall clock limit at all
  bool Valid() const;
};

struct SandboxConfig {
  std::string backend; // "auto", "container" or "process"
  ResourceLimits limits;
  // container backend
  std::string image;
  std::filesystem::path dockerfile;
  // restricted process backend
  std::string python;
  std::vector<std::string> bind_dirs; // mounted read-only into the jail, in addition to the defaults
  // jailed programs run as uid_base .. uid_base + uid_count - 1; host processes sharing
  // a machine need disjoint ranges
  int uid_base, uid_count;
  bool syntax_check; // run the interpreter's compile() during validation

  SandboxConfig() :
      backend("auto"),
      image("datajail-sandbox:latest"),
      python("python3"),
      uid_base(50000), uid_count(100),
      syntax_check(true) {}
};

class ExecutionRequest {
 public:
  const std::string code;
  // dataset name -> path (relative to the uploads root, or absolute inside it)
  const std::map<std::string, std::string> data_bindings;

  explicit ExecutionRequest(std::string code, std::map<std::string, std::string> data_bindings = {}) :
      code(std::move(code)), data_bindings(std::move(data_bindings)) {}
};

struct CapturedValue {
  CapturedType type;
  // dataframe: records; series: index -> value; plots: file names; otherwise the literal
  nlohmann::json data;
  // dataframe only
  std::vector<std::string> columns;
  long rows, cols;
  // series only (may be null)
  nlohmann::json name;

  CapturedValue() : type(CapturedType::STR), rows(0), cols(0) {}
  nlohmann::json ToJson() const;
};
using ResultEnvelope = std::map<std::string, CapturedValue>;

class ExecutionOutcome {
 public:
  bool succeeded;
  std::string output; // stdout of the program
  std::optional<ResultEnvelope> result_envelope;
  FailureKind failure_kind;
  std::string message, traceback;

  ExecutionOutcome() : succeeded(false), failure_kind(FailureKind::NONE) {}
  nlohmann::json ToJson() const;
};

struct HealthStatus {
  bool healthy;
  BackendType backend;
  std::string output, error;

  HealthStatus() : healthy(false), backend(BackendType::PROCESS) {}
  nlohmann::json ToJson() const;
};

class Backend;

// Thread-safe: Execute and HealthCheck may be called concurrently.
class Executor {
  std::unique_ptr<Backend> backend_;
  SandboxConfig config_;
 public:
  // selects the backend with SelectBackend
  explicit Executor(const SandboxConfig&);
  Executor(std::unique_ptr<Backend>, const SandboxConfig&);
  ~Executor();
  Executor(const Executor&) = delete;
  Executor& operator=(const Executor&) = delete;

  ExecutionOutcome Execute(const ExecutionRequest&) const;
  // runs print('healthy') on the active backend
  HealthStatus HealthCheck() const;
  BackendType GetBackendType() const;
};

// Chosen once per process; "auto" prefers the container backend if the Docker daemon answers
std::unique_ptr<Backend> SelectBackend(const SandboxConfig&);
bool ContainerRuntimeAvailable();
bool BuildSandboxImage(const SandboxConfig&);

#endif  // INCLUDE_DATAJAIL_EXECUTION_H_
