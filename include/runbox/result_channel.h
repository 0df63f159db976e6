#ifndef INCLUDE_RUNBOX_RESULT_CHANNEL_H_
#define INCLUDE_RUNBOX_RESULT_CHANNEL_H_

#include <string>
#include <optional>
#include <nlohmann/json.hpp>

#include "engine.h"
#include "outcome.h"

// {"kind", "ok", "sandbox", ...}; "error" is present iff !ok
nlohmann::json ToResponse(const ExecutionOutcome&);
// invalid UTF-8 in captured output is replaced instead of throwing
std::string DumpResponse(const nlohmann::json&, int indent = -1);

// {"code", "extra_dependencies"?, "timeout_seconds"?, "max_output_bytes"?};
// missing fields take the configured defaults
std::optional<ExecutionRequest> ParseRequest(const nlohmann::json&, std::string* error);
// {"kind": "invalid_request", "ok": false, "error"}
nlohmann::json InvalidRequestResponse(const std::string& error);

inline nlohmann::json RunToResponse(const ExecutionRequest& req, const Reporter& reporter = {},
                                    CancelToken* cancel = nullptr) {
  return ToResponse(Run(req, reporter, cancel));
}

#endif  // INCLUDE_RUNBOX_RESULT_CHANNEL_H_
