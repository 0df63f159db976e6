#include "supervisor.h"

#include <signal.h>

#include <spdlog/spdlog.h>
#include <runbox/cancel.h>
#include "environment.h"
#include "sandbox.h"
#include "syscall_policy.h"
#include "utils.h"

namespace {

// MAX_ARG_STRLEN of Linux, including the terminating NUL
constexpr size_t kMaxArgLength = 32 * 4096;

} // namespace

OutcomeVariant Execute(Environment& env, const SyscallPolicy& policy,
                       const ExecutionRequest& req, CancelToken* cancel) {
  if (req.code.find('\0') != std::string::npos) {
    return outcome::RuntimeFailure{"program contains NUL bytes"};
  }
  if (req.code.size() >= kMaxArgLength) {
    return outcome::RuntimeFailure{"program is too long (" + std::to_string(req.code.size()) +
                                   " bytes, at most " + std::to_string(kMaxArgLength - 1) + ")"};
  }

  SandboxOptions opt;
  // the program is passed as an argument; it never touches the filesystem
  opt.command = {env.Interpreter().string(), "-c", req.code};
  opt.envs = env.Envs();
  opt.workdir = env.Workdir();
  opt.wall_time = req.timeout_seconds * 1'000'000;
  opt.max_output = req.max_output_bytes;
  opt.vss = kMemoryLimit * 1024;
  opt.fsize = kFileSizeLimit * 1024;
  opt.file_num = kMaxOpenFiles;
  opt.proc_num = kMaxProcesses;
  opt.policy = &policy;
  opt.on_spawn = env.SpawnHook();
  opt.on_reap = env.ReapHook();
  spdlog::info("Executing program in environment {}: {} bytes, timeout {}s, policy {}",
               env.Id(), req.code.size(), req.timeout_seconds,
               policy.IsNoop() ? "none" : PolicyModeName(policy.mode));

  SandboxResult res = SandboxExec(opt, cancel);
  if (!res.Spawned()) {
    if (res.failed_stage == SpawnStage::POLICY) {
      return outcome::PolicyError{"failed to apply syscall policy: " + res.error};
    }
    return outcome::RuntimeFailure{std::string("failed to start interpreter (") +
                                   SpawnStageName(res.failed_stage) + "): " + res.error};
  }
  if (res.cancelled) return outcome::Cancelled{res.time};
  if (res.timekill) return outcome::TimedOut{res.time, req.timeout_seconds};
  if (res.signal == SIGSYS) {
    spdlog::warn("Program in environment {} was killed for a forbidden syscall", env.Id());
  }
  return outcome::Completed{
    std::move(res.stdout_data), std::move(res.stderr_data),
    res.exit_code, res.signal,
    res.stdout_truncated, res.stderr_truncated,
    res.time,
  };
}
