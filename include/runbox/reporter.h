#ifndef INCLUDE_RUNBOX_REPORTER_H_
#define INCLUDE_RUNBOX_REPORTER_H_

#include <functional>
#include <filesystem>

class ExecutionOutcome;

struct Reporter {
  // these functions should not block; any of them may be empty
  std::function<void(long env_id, const std::filesystem::path& root)> ReportEnvironmentCreated;
  std::function<void(long env_id, const std::filesystem::path& root)> ReportTeardown;
  std::function<void(const ExecutionOutcome&)> ReportOutcome;
};

#endif  // INCLUDE_RUNBOX_REPORTER_H_
