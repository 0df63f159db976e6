#ifndef RUNBOX_SANDBOX_H_
#define RUNBOX_SANDBOX_H_

#include <string>
#include <vector>
#include <cstdint>
#include <functional>
#include <sys/types.h>
#include <sys/resource.h>

class CancelToken;
class SyscallPolicy;

#define ENUM_SPAWN_STAGE_ \
  X(NONE, "none") /* spawned successfully */ \
  X(PIPE, "pipe") \
  X(FORK, "fork") \
  X(SETSID, "setsid") \
  X(REDIRECT, "redirect") \
  X(CHDIR, "chdir") \
  X(RLIMIT, "setrlimit") \
  X(POLICY, "policy") \
  X(EXEC, "exec")
enum class SpawnStage : int {
#define X(name, str) name,
  ENUM_SPAWN_STAGE_
#undef X
};

const char* SpawnStageName(SpawnStage);

class SandboxOptions {
 public:
  // command[0] is resolved against the PATH of this process if it has no slash
  std::vector<std::string> command;
  // the child never inherits our environment
  std::vector<std::string> envs;
  std::string workdir;
  long wall_time; // us; 0 = no limit
  long max_output; // bytes kept per stream; the rest is read and discarded
  // 0 = no limit
  long vss; // KiB
  long fsize; // KiB
  int file_num;
  int proc_num;
  // installed right before execve; nullptr = none
  const SyscallPolicy* policy;
  // called in the parent with the pid (= process group id) right after fork
  std::function<void(pid_t)> on_spawn;
  // called in the parent right before the pid is reaped; the group is dead by then
  std::function<void(pid_t)> on_reap;

  SandboxOptions() :
      wall_time(0),
      max_output(1 << 16),
      vss(0), fsize(0),
      file_num(0), proc_num(0),
      policy(nullptr) {}
};

struct SandboxResult {
  SpawnStage failed_stage; // NONE if the command was executed
  std::string error; // set iff failed_stage != NONE
  int exit_code; // 128 + signal if killed by a signal
  int signal;
  bool timekill; // wall time exceeded
  bool cancelled;
  int64_t time; // us, measured from spawn
  struct rusage rus;
  std::string stdout_data, stderr_data;
  bool stdout_truncated, stderr_truncated;

  SandboxResult() :
      failed_stage(SpawnStage::NONE),
      exit_code(0), signal(0),
      timekill(false), cancelled(false),
      time(0), rus{},
      stdout_truncated(false), stderr_truncated(false) {}
  bool Spawned() const { return failed_stage == SpawnStage::NONE; }
};

// Blocks until the command and its process group are gone.
// Every descendant still in the group is killed before returning.
SandboxResult SandboxExec(const SandboxOptions&, CancelToken* cancel = nullptr);

// Search PATH for `name`; empty if not found or not executable.
std::string ResolveExecutable(const std::string& name);

#endif  // RUNBOX_SANDBOX_H_
