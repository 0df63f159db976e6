#ifndef INCLUDE_RUNBOX_OUTCOME_H_
#define INCLUDE_RUNBOX_OUTCOME_H_

#include <string>
#include <variant>
#include <cstdint>

#define ENUM_SANDBOX_STRENGTH_ \
  X(FULL, "full") \
  X(NONE, "none") /* no kernel syscall filtering */
enum class SandboxStrength {
#define X(name, str) name,
  ENUM_SANDBOX_STRENGTH_
#undef X
};

// must be in the same order as OutcomeVariant
#define ENUM_OUTCOME_KIND_ \
  X(COMPLETED, "completed") \
  X(TIMED_OUT, "timed_out") \
  X(PROVISIONING_FAILED, "provisioning_failed") \
  X(POLICY_ERROR, "policy_error") \
  X(RUNTIME_FAILURE, "runtime_failure") \
  X(CANCELLED, "cancelled")
enum class OutcomeKind {
#define X(name, str) name,
  ENUM_OUTCOME_KIND_
#undef X
};

namespace outcome {

// the program ran to completion; a non-zero exit_code is the program's own failure
struct Completed {
  std::string stdout_data, stderr_data;
  int exit_code; // 128 + signal if killed by a signal
  int signal; // 0 if exited normally
  bool stdout_truncated, stderr_truncated;
  int64_t elapsed; // us
};

struct TimedOut {
  int64_t elapsed; // us
  long timeout; // seconds
};

struct ProvisioningFailed {
  std::string cause;
};

struct PolicyError {
  std::string cause;
};

struct RuntimeFailure {
  std::string cause;
};

struct Cancelled {
  int64_t elapsed; // us
};

} // namespace outcome

using OutcomeVariant = std::variant<
    outcome::Completed,
    outcome::TimedOut,
    outcome::ProvisioningFailed,
    outcome::PolicyError,
    outcome::RuntimeFailure,
    outcome::Cancelled>;

class ExecutionOutcome {
 public:
  OutcomeVariant result;
  // isolation actually in force for this execution
  SandboxStrength sandbox;

  ExecutionOutcome() : result(outcome::RuntimeFailure{"not executed"}), sandbox(SandboxStrength::NONE) {}
  template <class T>
  ExecutionOutcome(T&& res, SandboxStrength strength) :
      result(std::forward<T>(res)), sandbox(strength) {}

  OutcomeKind Kind() const { return (OutcomeKind)result.index(); }
  bool IsCompleted() const { return Kind() == OutcomeKind::COMPLETED; }
};

#endif  // INCLUDE_RUNBOX_OUTCOME_H_
