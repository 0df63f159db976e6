#include <runbox/engine.h>

#include <mutex>
#include <chrono>
#include <optional>
#include <exception>

#include <spdlog/spdlog.h>
#include "environment.h"
#include "sandbox.h"
#include "supervisor.h"
#include "syscall_policy.h"
#include "utils.h"

long kDefaultTimeout = 30;
long kDefaultMaxOutput = 10240;
long kProvisionTimeout = 300;
std::filesystem::path kRuntime = "/usr/bin/python3";
std::string kIndexUrl = "";
long kMemoryLimit = 1024; // 1G
long kFileSizeLimit = 64;
long kMaxOpenFiles = 256;
long kMaxProcesses = 0;
PolicyMode kPolicyMode = PolicyMode::INTERPRETER;

namespace {

std::mutex status_mtx;
std::optional<EngineStatus> engine_status;

inline int64_t ElapsedUs(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::steady_clock::now() - start).count();
}

OutcomeVariant RunInternal(const ExecutionRequest& req, const Reporter& reporter,
                           CancelToken* cancel, SandboxStrength strength) {
  auto start = std::chrono::steady_clock::now();
  if (req.timeout_seconds <= 0 || req.timeout_seconds > kMaxTimeoutSeconds) {
    return outcome::RuntimeFailure{"timeout_seconds must be between 1 and " +
                                   std::to_string(kMaxTimeoutSeconds)};
  }
  if (req.max_output_bytes <= 0) {
    return outcome::RuntimeFailure{"max_output_bytes must be a positive integer"};
  }
  if (cancel && cancel->IsCancelled()) return outcome::Cancelled{0};

  std::string cause;
  std::unique_ptr<Environment> env = CreateEnvironment(&cause);
  if (!env) return outcome::ProvisioningFailed{cause};
  if (reporter.ReportTeardown) env->SetReleaseCallback(reporter.ReportTeardown);
  if (reporter.ReportEnvironmentCreated) reporter.ReportEnvironmentCreated(env->Id(), env->Root());

  // env is released on every path below, either explicitly or by its destructor
  if (!Provision(*env, req.extra_dependencies, cancel, &cause)) {
    env->Release();
    if (cancel && cancel->IsCancelled()) return outcome::Cancelled{ElapsedUs(start)};
    return outcome::ProvisioningFailed{cause};
  }

  std::optional<SyscallPolicy> policy = BuildPolicy(kPolicyMode, strength, &cause);
  if (!policy) {
    env->Release();
    spdlog::error("Failed to build syscall policy: {}", cause);
    return outcome::PolicyError{cause};
  }
  if (cancel && cancel->IsCancelled()) {
    env->Release();
    return outcome::Cancelled{ElapsedUs(start)};
  }

  OutcomeVariant ret = Execute(*env, *policy, req, cancel);
  env->Release();
  return ret;
}

} // namespace

EngineStatus InitEngine() {
  EngineStatus status;
  status.mode = kPolicyMode;
  std::string reason;
  status.strength = DetectSandboxStrength(kPolicyMode, &reason);
  if (status.strength == SandboxStrength::NONE) {
    status.warning = "syscall isolation is not available: " + reason;
    spdlog::warn("{}; untrusted code will run WITHOUT a syscall filter", status.warning);
  }
  status.runtime_found = !ResolveExecutable(kRuntime.string()).empty();
  if (!status.runtime_found) {
    spdlog::warn("Runtime {} is not an executable; every request will fail to provision",
                 kRuntime.string());
  }
  spdlog::info("Engine initialized: sandbox={} policy={} runtime={}",
               SandboxStrengthName(status.strength), PolicyModeName(status.mode), kRuntime.string());
  std::lock_guard lck(status_mtx);
  engine_status = status;
  return status;
}

EngineStatus GetEngineStatus() {
  {
    std::lock_guard lck(status_mtx);
    if (engine_status) return *engine_status;
  }
  return InitEngine();
}

ExecutionOutcome Run(const ExecutionRequest& req, const Reporter& reporter, CancelToken* cancel) {
  SandboxStrength strength = GetEngineStatus().strength;
  OutcomeVariant result = [&]() -> OutcomeVariant {
    try {
      return RunInternal(req, reporter, cancel, strength);
    } catch (const std::exception& e) {
      spdlog::error("Run failed with exception: {}", e.what());
      return outcome::RuntimeFailure{std::string("internal error: ") + e.what()};
    }
  }();
  ExecutionOutcome ret(std::move(result), strength);
  spdlog::info("Run finished: {}", OutcomeKindName(ret.Kind()));
  if (reporter.ReportOutcome) reporter.ReportOutcome(ret);
  return ret;
}
