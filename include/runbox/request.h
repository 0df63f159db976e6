#ifndef INCLUDE_RUNBOX_REQUEST_H_
#define INCLUDE_RUNBOX_REQUEST_H_

#include <string>
#include <vector>
#include <filesystem>

// upper bound of every timeout; keeps the conversion to microseconds in range
constexpr long kMaxTimeoutSeconds = 86400;

// defaults of ExecutionRequest; overridden by configuration
extern long kDefaultTimeout; // seconds
extern long kDefaultMaxOutput; // bytes
// overall deadline of environment creation + dependency installation
extern long kProvisionTimeout; // seconds
// host interpreter used to create throwaway environments
extern std::filesystem::path kRuntime;
// empty for the installer's default index
extern std::string kIndexUrl;
// rlimits of the executed program; 0 = unlimited
extern long kMemoryLimit; // MiB
extern long kFileSizeLimit; // MiB
extern long kMaxOpenFiles;
extern long kMaxProcesses;

class ExecutionRequest {
 public:
  std::string code;
  // installed in order; empty means no installer is ever spawned
  std::vector<std::string> extra_dependencies;
  long timeout_seconds;
  long max_output_bytes;

  ExecutionRequest() :
      timeout_seconds(kDefaultTimeout),
      max_output_bytes(kDefaultMaxOutput) {}
  explicit ExecutionRequest(std::string code_,
                            std::vector<std::string> deps = {}) :
      code(std::move(code_)),
      extra_dependencies(std::move(deps)),
      timeout_seconds(kDefaultTimeout),
      max_output_bytes(kDefaultMaxOutput) {}
};

#endif  // INCLUDE_RUNBOX_REQUEST_H_
