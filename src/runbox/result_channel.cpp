#include <runbox/result_channel.h>

#include <runbox/utils.h>

namespace {

using nlohmann::json;

inline int64_t ToMs(int64_t us) { return us / 1000; }

struct ResponseVisitor {
  json& ret;

  void operator()(const outcome::Completed& res) {
    ret["stdout"] = res.stdout_data;
    ret["stderr"] = res.stderr_data;
    ret["exit_code"] = res.exit_code;
    ret["signal"] = res.signal;
    ret["stdout_truncated"] = res.stdout_truncated;
    ret["stderr_truncated"] = res.stderr_truncated;
    ret["elapsed_ms"] = ToMs(res.elapsed);
  }
  void operator()(const outcome::TimedOut& res) {
    ret["error"] = "Timeout (" + std::to_string(res.timeout) + "s) exceeded during code execution.";
    ret["elapsed_ms"] = ToMs(res.elapsed);
  }
  void operator()(const outcome::ProvisioningFailed& res) {
    ret["error"] = "Failed to provision the environment: " + res.cause;
  }
  void operator()(const outcome::PolicyError& res) {
    ret["error"] = "Failed to apply the syscall policy: " + res.cause;
  }
  void operator()(const outcome::RuntimeFailure& res) {
    ret["error"] = "Failed to run the code: " + res.cause;
  }
  void operator()(const outcome::Cancelled& res) {
    ret["error"] = "Execution was cancelled.";
    ret["elapsed_ms"] = ToMs(res.elapsed);
  }
};

} // namespace

nlohmann::json ToResponse(const ExecutionOutcome& out) {
  json ret = {
    {"kind", OutcomeKindName(out.Kind())},
    {"ok", out.IsCompleted()},
    {"sandbox", SandboxStrengthName(out.sandbox)},
  };
  std::visit(ResponseVisitor{ret}, out.result);
  return ret;
}

std::string DumpResponse(const nlohmann::json& res, int indent) {
  return res.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::optional<ExecutionRequest> ParseRequest(const nlohmann::json& body, std::string* error) {
  if (!body.is_object()) {
    *error = "request body must be a JSON object";
    return std::nullopt;
  }
  ExecutionRequest req;
  try {
    if (!body.contains("code") || !body["code"].is_string()) {
      *error = "\"code\" must be a string";
      return std::nullopt;
    }
    req.code = body["code"].get<std::string>();
    if (body.contains("extra_dependencies") && !body["extra_dependencies"].is_null()) {
      req.extra_dependencies = body["extra_dependencies"].get<std::vector<std::string>>();
    }
    if (body.contains("timeout_seconds")) {
      if (!body["timeout_seconds"].is_number_integer()) {
        *error = "\"timeout_seconds\" must be an integer";
        return std::nullopt;
      }
      req.timeout_seconds = body["timeout_seconds"].get<long>();
    }
    if (body.contains("max_output_bytes")) {
      if (!body["max_output_bytes"].is_number_integer()) {
        *error = "\"max_output_bytes\" must be an integer";
        return std::nullopt;
      }
      req.max_output_bytes = body["max_output_bytes"].get<long>();
    }
  } catch (const json::exception& e) {
    *error = e.what();
    return std::nullopt;
  }
  if (req.timeout_seconds <= 0 || req.timeout_seconds > kMaxTimeoutSeconds) {
    *error = "\"timeout_seconds\" must be between 1 and " + std::to_string(kMaxTimeoutSeconds);
    return std::nullopt;
  }
  if (req.max_output_bytes <= 0) {
    *error = "\"max_output_bytes\" must be positive";
    return std::nullopt;
  }
  return req;
}

nlohmann::json InvalidRequestResponse(const std::string& error) {
  return {{"kind", "invalid_request"}, {"ok", false}, {"error", error}};
}
