#ifndef INCLUDE_RUNBOX_ENGINE_H_
#define INCLUDE_RUNBOX_ENGINE_H_

#include <string>

#include "cancel.h"
#include "outcome.h"
#include "request.h"
#include "reporter.h"

#define ENUM_POLICY_MODE_ \
  X(STRICT, "strict") /* only the minimal startup & I/O syscalls */ \
  X(INTERPRETER, "interpreter") /* minimal set + what the interpreter needs to start */ \
  X(NONE, "none") /* no syscall filter */
enum class PolicyMode {
#define X(name, str) name,
  ENUM_POLICY_MODE_
#undef X
};

extern PolicyMode kPolicyMode;

struct EngineStatus {
  SandboxStrength strength;
  PolicyMode mode;
  bool runtime_found;
  std::string warning; // empty if full isolation is available
};

// Capability check; logs a warning if isolation is weaker than requested.
// Call again after changing kPolicyMode or kRuntime.
EngineStatus InitEngine();
// Result of the last InitEngine(); runs it first if it has never been called.
EngineStatus GetEngineStatus();

// Provision, execute and tear down one request.
// Never throws; every failure is reported as an outcome.
// Thread-safe: requests share no environment.
ExecutionOutcome Run(const ExecutionRequest&, const Reporter& = {}, CancelToken* cancel = nullptr);

#endif  // INCLUDE_RUNBOX_ENGINE_H_
