#include "collector.h"

#include <fstream>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include "utils.h"

namespace {

const char kErrorKey[] = "__error";

ExecutionOutcome RuntimeError(const RawExecutionResult& raw) {
  ExecutionOutcome ret;
  ret.output = raw.output;
  ret.failure_kind = FailureKind::RUNTIME_ERROR;
  if (!raw.message.empty()) {
    ret.message = raw.message;
    ret.traceback = raw.error;
  } else if (!raw.error.empty()) {
    ret.message = raw.error;
  } else if (!raw.output.empty()) {
    ret.message = raw.output;
  } else if (raw.signal) {
    ret.message = fmt::format("Process killed by signal {}", raw.signal);
  } else {
    ret.message = fmt::format("Process exited with code {}", raw.exit_code);
  }
  return ret;
}

} // namespace

bool ParseCapturedValue(const nlohmann::json& json, CapturedValue& value) {
  if (!json.is_object()) return false;
  auto type_it = json.find("type");
  auto data_it = json.find("data");
  if (type_it == json.end() || !type_it->is_string() || data_it == json.end()) return false;
  if (!GetCapturedType(type_it->get<std::string>(), value.type)) return false;
  value.data = *data_it;
  switch (value.type) {
    case CapturedType::DATAFRAME: {
      if (!value.data.is_array()) return false;
      if (auto it = json.find("columns"); it != json.end() && it->is_array()) {
        for (auto& col : *it) {
          if (col.is_string()) value.columns.push_back(col.get<std::string>());
        }
      }
      if (auto it = json.find("shape"); it != json.end() && it->is_array() && it->size() == 2 &&
          (*it)[0].is_number_integer() && (*it)[1].is_number_integer()) {
        value.rows = (*it)[0].get<long>();
        value.cols = (*it)[1].get<long>();
      } else {
        value.rows = value.data.size();
        value.cols = value.columns.size();
      }
      break;
    }
    case CapturedType::SERIES:
      if (!value.data.is_object()) return false;
      if (auto it = json.find("name"); it != json.end()) value.name = *it;
      break;
    case CapturedType::INT: return value.data.is_number_integer();
    case CapturedType::FLOAT: return value.data.is_number() || value.data.is_null();
    case CapturedType::STR: return value.data.is_string();
    case CapturedType::BOOL: return value.data.is_boolean();
    case CapturedType::LIST: return value.data.is_array();
    case CapturedType::DICT: return value.data.is_object();
    case CapturedType::PLOTS: {
      if (!value.data.is_array()) return false;
      for (auto& i : value.data) {
        if (!i.is_string()) return false;
      }
      break;
    }
  }
  return true;
}

ExecutionOutcome Collect(const RawExecutionResult& raw, const Workspace& ws, const ResourceLimits& limits) {
  ExecutionOutcome ret;
  ret.output = raw.output;
  if (raw.system_error) {
    ret.failure_kind = FailureKind::INFRASTRUCTURE_ERROR;
    ret.message = raw.message.empty() ? "Sandbox backend failed" : raw.message;
    ret.traceback = raw.error;
    return ret;
  }
  if (raw.timed_out) {
    ret.failure_kind = FailureKind::TIMEOUT;
    ret.message = fmt::format("Code execution timed out after {} seconds", limits.timeout_seconds);
    return ret;
  }
  bool exited_ok = raw.exit_code == 0 && raw.signal == 0;
  std::error_code ec;
  fs::path result_file = ws.ResultFile();
  if (!fs::is_regular_file(result_file, ec)) {
    spdlog::debug("No result envelope: id={} exit_code={}", ws.Id(), raw.exit_code);
    if (!exited_ok) return RuntimeError(raw);
    ret.succeeded = true;
    return ret;
  }

  nlohmann::json envelope;
  try {
    std::ifstream fin(result_file);
    fin >> envelope;
  } catch (nlohmann::detail::parse_error& err) {
    spdlog::info("Malformed result envelope: id={} error={}", ws.Id(), err.what());
  }
  if (!envelope.is_object()) {
    ret = RuntimeError(raw);
    ret.message = "Malformed result envelope";
    return ret;
  }
  if (auto it = envelope.find(kErrorKey); it != envelope.end()) {
    ret.failure_kind = FailureKind::RUNTIME_ERROR;
    ret.message = "Unknown error";
    if (it->is_object()) {
      if (auto msg = it->find("error"); msg != it->end() && msg->is_string()) {
        ret.message = msg->get<std::string>();
      }
      if (auto tb = it->find("traceback"); tb != it->end() && tb->is_string()) {
        ret.traceback = tb->get<std::string>();
      }
    }
    return ret;
  }
  if (!exited_ok) return RuntimeError(raw);

  ResultEnvelope result;
  for (auto& [key, value] : envelope.items()) {
    CapturedValue captured;
    if (!ParseCapturedValue(value, captured)) {
      spdlog::warn("Skipping malformed capture: id={} name={}", ws.Id(), key);
      continue;
    }
    result.emplace(key, std::move(captured));
  }
  ret.succeeded = true;
  ret.result_envelope = std::move(result);
  return ret;
}
