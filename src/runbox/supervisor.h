#ifndef RUNBOX_SUPERVISOR_H_
#define RUNBOX_SUPERVISOR_H_

#include <runbox/outcome.h>
#include <runbox/request.h>

class CancelToken;
class Environment;
class SyscallPolicy;

// Run req.code with the interpreter of `env` under `policy`.
// Completed is returned whatever the exit code of the program is.
OutcomeVariant Execute(Environment& env, const SyscallPolicy& policy,
                       const ExecutionRequest& req, CancelToken* cancel);

#endif  // RUNBOX_SUPERVISOR_H_
