#ifndef RUNBOX_SYSCALL_POLICY_H_
#define RUNBOX_SYSCALL_POLICY_H_

#include <string>
#include <vector>
#include <optional>
#include <linux/filter.h>

#include <runbox/engine.h>
#include <runbox/outcome.h>

// Allow-list with a default action of killing the process.
// Built in the parent, installed by the child right before execve.
class SyscallPolicy {
 public:
  PolicyMode mode;
  // in the order they were requested; names unknown on this architecture are kept here
  std::vector<std::string> allowed;
  uint32_t default_action;
  // compiled classic BPF program; empty if the policy is a no-op
  std::vector<struct sock_filter> program;

  SyscallPolicy() : mode(PolicyMode::NONE), default_action(0) {}
  bool IsNoop() const { return program.empty(); }
};

const std::vector<std::string>& PolicySyscalls(PolicyMode);

// Kernel support of seccomp filter mode; `reason` explains a NONE result.
SandboxStrength DetectSandboxStrength(PolicyMode, std::string* reason = nullptr);

// If strength is NONE the policy is a documented no-op.
// Returns nullopt (and sets error) if the filter cannot be compiled.
std::optional<SyscallPolicy> BuildPolicy(PolicyMode, SandboxStrength, std::string* error);

// Child side, between fork and exec; async-signal-safe.
// Returns 0 or an errno value.
int ApplyPolicy(const SyscallPolicy&);

#endif  // RUNBOX_SYSCALL_POLICY_H_
