#ifndef RUNBOX_ENVIRONMENT_H_
#define RUNBOX_ENVIRONMENT_H_

#include <mutex>
#include <memory>
#include <string>
#include <vector>
#include <algorithm>
#include <functional>
#include <sys/types.h>

#include "paths.h"

class CancelToken;

// A disposable directory tree owned by exactly one request.
// Release() removes it together with every process group spawned inside it;
// it runs at most once and is also invoked by the destructor.
class Environment {
  long id_;
  fs::path root_;
  std::mutex mtx_;
  bool released_;
  std::vector<pid_t> process_groups_;
  std::function<void(long, const fs::path&)> on_release_;

 public:
  Environment(long id, fs::path root) : id_(id), root_(std::move(root)), released_(false) {}
  ~Environment() { Release(); }
  Environment(const Environment&) = delete;
  Environment& operator=(const Environment&) = delete;

  long Id() const { return id_; }
  const fs::path& Root() const { return root_; }
  fs::path Interpreter() const { return EnvInterpreter(root_); }
  fs::path Workdir() const { return EnvWorkdir(root_); }
  bool Released();

  // environment variables of every process run inside the environment
  std::vector<std::string> Envs() const;
  // for SandboxOptions::on_spawn and on_reap; a group is recorded only while its leader is unreaped
  std::function<void(pid_t)> SpawnHook();
  std::function<void(pid_t)> ReapHook();
  size_t LiveProcessGroups();
  void SetReleaseCallback(std::function<void(long, const fs::path&)> func) {
    on_release_ = std::move(func);
  }

  // idempotent; never throws
  void Release() noexcept;
};

// Create a new uniquely-named tree under kBoxRoot; nullptr and `cause` on failure.
std::unique_ptr<Environment> CreateEnvironment(std::string* cause);

// Create the isolated runtime inside `env` and install `deps` in order.
// Stops at the first failure; the caller tears the environment down.
// No installer is spawned at all when `deps` is empty.
bool Provision(Environment& env, const std::vector<std::string>& deps,
               CancelToken* cancel, std::string* cause);

#endif  // RUNBOX_ENVIRONMENT_H_
