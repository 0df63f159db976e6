#ifndef INCLUDE_RUNBOX_UTILS_H_
#define INCLUDE_RUNBOX_UTILS_H_

#include <string>
#include <optional>

#include "outcome.h"
#include "engine.h"

long GetUniqueEnvironmentId();

const char* SandboxStrengthName(SandboxStrength);
const char* OutcomeKindName(OutcomeKind);
const char* PolicyModeName(PolicyMode);
std::optional<PolicyMode> GetPolicyMode(const std::string&);

#endif  // INCLUDE_RUNBOX_UTILS_H_
