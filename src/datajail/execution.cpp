#include <datajail/execution.h>

#include <cctype>
#include <chrono>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <datajail/backend.h>
#include <datajail/utils.h>
#include <datajail/workspace.h>
#include "collector.h"
#include "container_backend.h"
#include "paths.h"
#include "process_backend.h"
#include "utils.h"
#include "validator.h"
#include "wrapper.h"

namespace {

const char kHealthCheckCode[] = "print('healthy')";

ExecutionOutcome Failure(FailureKind kind, const std::string& message) {
  ExecutionOutcome ret;
  ret.failure_kind = kind;
  ret.message = message;
  return ret;
}

// Copies the resolved data files into the workspace; returns name -> path seen by the program
bool StageData(const Workspace& ws, const std::map<std::string, fs::path>& resolved,
               const WrapOptions& layout, std::map<std::string, std::string>& bindings) {
  for (auto& [name, file] : resolved) {
    DataFormat format = GetDataFormat(file);
    if (format == DataFormat::UNSUPPORTED) {
      spdlog::warn("Unsupported dataset format, skipping binding: id={} name={} file={}",
                   ws.Id(), name, file.c_str());
      continue;
    }
    std::string filename = name + file.extension().string();
    if (!Copy(file, ws.DataDir() / filename, kPerm644)) return false;
    bindings[name] = layout.data_dir + "/" + filename;
  }
  return true;
}

} // namespace

nlohmann::json CapturedValue::ToJson() const {
  nlohmann::json ret = {{"type", CapturedTypeName(type)}, {"data", data}};
  if (type == CapturedType::DATAFRAME) {
    ret["columns"] = columns;
    ret["shape"] = {rows, cols};
  } else if (type == CapturedType::SERIES) {
    ret["name"] = name;
  }
  return ret;
}

nlohmann::json ExecutionOutcome::ToJson() const {
  nlohmann::json ret = {
    {"succeeded", succeeded},
    {"stdout", output},
  };
  if (result_envelope) {
    nlohmann::json envelope = nlohmann::json::object();
    for (auto& [name, value] : *result_envelope) envelope[name] = value.ToJson();
    ret["result"] = std::move(envelope);
  } else {
    ret["result"] = nullptr;
  }
  if (failure_kind != FailureKind::NONE) {
    ret["failure_kind"] = FailureKindToAbr(failure_kind);
    ret["message"] = message;
    if (!traceback.empty()) ret["traceback"] = traceback;
  } else {
    ret["failure_kind"] = nullptr;
  }
  return ret;
}

nlohmann::json HealthStatus::ToJson() const {
  nlohmann::json ret = {
    {"healthy", healthy},
    {"backend", BackendTypeName(backend)},
    {"output", output},
  };
  if (!error.empty()) ret["error"] = error;
  return ret;
}

bool ResourceLimits::Valid() const {
  return timeout_seconds > 0 && memory_limit_bytes > 0 && cpu_limit > 0 &&
         max_output_file_bytes > 0 && max_processes > 0;
}

std::unique_ptr<Backend> SelectBackend(const SandboxConfig& config) {
  bool container;
  if (config.backend == "container") {
    container = true;
  } else if (config.backend == "process") {
    container = false;
  } else {
    if (config.backend != "auto") spdlog::warn("Unknown backend {}; probing", config.backend);
    container = ContainerRuntimeAvailable();
    if (!container) spdlog::warn("Docker is not available; falling back to the restricted process backend");
  }
  spdlog::info("Selected backend: {}", container ? "container" : "process");
  if (container) return std::make_unique<ContainerBackend>(config);
  return std::make_unique<ProcessBackend>(config);
}

Executor::Executor(const SandboxConfig& config) :
    backend_(SelectBackend(config)), config_(config) {}

Executor::Executor(std::unique_ptr<Backend> backend, const SandboxConfig& config) :
    backend_(std::move(backend)), config_(config) {}

Executor::~Executor() = default;

BackendType Executor::GetBackendType() const {
  return backend_->Type();
}

ExecutionOutcome Executor::Execute(const ExecutionRequest& req) const {
  long id = GetUniqueExecutionId();
  auto start = std::chrono::steady_clock::now();
  spdlog::info("Execution requested: id={} code_size={} bindings={}",
               id, req.code.size(), req.data_bindings.size());
  if (!config_.limits.Valid()) {
    spdlog::error("Invalid resource limits: id={} timeout_seconds={}", id, config_.limits.timeout_seconds);
    return Failure(FailureKind::INFRASTRUCTURE_ERROR, "Invalid resource limits");
  }
  std::string error;
  if (!ValidateCode(req.code, error, config_.syntax_check ? config_.python : "")) {
    return Failure(FailureKind::VALIDATION_ERROR, error);
  }
  std::map<std::string, fs::path> resolved;
  if (!ValidateBindings(req.data_bindings, kUploadsRoot, resolved, error)) {
    spdlog::info("Bindings rejected: id={} reason=\"{}\"", id, error);
    return Failure(FailureKind::VALIDATION_ERROR, error);
  }

  ExecutionOutcome ret;
  {
    Workspace ws(id);
    if (!ws.Valid()) return Failure(FailureKind::INFRASTRUCTURE_ERROR, "Failed creating the sandbox workspace");
    WrapOptions layout = backend_->Layout();
    std::map<std::string, std::string> bindings;
    if (!StageData(ws, resolved, layout, bindings)) {
      return Failure(FailureKind::INFRASTRUCTURE_ERROR, "Failed copying data files into the workspace");
    }
    std::string program = WrapCode(req.code, bindings, layout);
    RawExecutionResult raw = backend_->Run(program, ws, config_.limits);
    ret = Collect(raw, ws, config_.limits);
  }
  long elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start).count();
  spdlog::info("Execution finished: id={} succeeded={} failure={} captured={} elapsed_ms={}",
               id, ret.succeeded, FailureKindToAbr(ret.failure_kind),
               ret.result_envelope ? ret.result_envelope->size() : 0, elapsed);
  return ret;
}

HealthStatus Executor::HealthCheck() const {
  HealthStatus ret;
  ret.backend = backend_->Type();
  ExecutionOutcome outcome = Execute(ExecutionRequest(kHealthCheckCode));
  ret.output = outcome.output;
  while (!ret.output.empty() && std::isspace((unsigned char)ret.output.back())) ret.output.pop_back();
  ret.healthy = outcome.succeeded && ret.output == "healthy";
  if (!outcome.succeeded) {
    ret.error = fmt::format("{}: {}", FailureKindToAbr(outcome.failure_kind), outcome.message);
  } else if (!ret.healthy) {
    ret.error = "Unexpected output";
  }
  spdlog::info("Health check: backend={} healthy={}", BackendTypeName(ret.backend), ret.healthy);
  return ret;
}
