#include "environment.h"

#include <signal.h>
#include <stdlib.h>
#include <chrono>
#include <cerrno>
#include <cstring>
#include <exception>

#include <spdlog/spdlog.h>
#include <runbox/cancel.h>
#include <runbox/request.h>
#include "sandbox.h"
#include "utils.h"

namespace {

constexpr long kInstallerOutput = 64 * 1024; // bytes
constexpr size_t kCauseTail = 2000;

const char kHostPath[] = "/usr/local/bin:/usr/bin:/bin";

bool ValidDependency(const std::string& dep, std::string* cause) {
  if (dep.empty()) {
    *cause = "empty dependency name";
    return false;
  }
  if (dep[0] == '-') {
    *cause = dep + ": dependency name must not start with '-'";
    return false;
  }
  if (dep.find_first_of(std::string("\0\n\r", 3)) != std::string::npos) {
    *cause = "dependency name contains control characters";
    return false;
  }
  return true;
}

// failure description of one provisioning step, empty if it succeeded
std::string StepError(const std::string& step, const SandboxResult& res) {
  if (!res.Spawned()) return step + ": " + res.error;
  if (res.cancelled) return step + ": cancelled";
  if (res.timekill) {
    return step + ": provisioning timed out (" + std::to_string(kProvisionTimeout) + "s)";
  }
  if (res.exit_code == 0) return "";
  std::string ret = step + ": exited with status " + std::to_string(res.exit_code);
  const std::string& output = res.stderr_data.empty() ? res.stdout_data : res.stderr_data;
  if (!output.empty()) ret += ": " + Tail(output, kCauseTail);
  return ret;
}

} // namespace

bool Environment::Released() {
  std::lock_guard lck(mtx_);
  return released_;
}

std::vector<std::string> Environment::Envs() const {
  fs::path venv = EnvVenvPath(root_);
  return {
    "PATH=" + (venv / "bin").string() + ":" + kHostPath,
    "HOME=" + EnvHome(root_).string(),
    "TMPDIR=" + EnvTmp(root_).string(),
    "VIRTUAL_ENV=" + venv.string(),
    "PIP_CACHE_DIR=" + EnvPipCache(root_).string(),
    "PYTHONNOUSERSITE=1",
    "PYTHONDONTWRITEBYTECODE=1",
    "PYTHONIOENCODING=utf-8",
    "LANG=C.UTF-8",
  };
}

std::function<void(pid_t)> Environment::SpawnHook() {
  return [this](pid_t pgid) {
    std::lock_guard lck(mtx_);
    process_groups_.push_back(pgid);
  };
}

std::function<void(pid_t)> Environment::ReapHook() {
  return [this](pid_t pgid) {
    std::lock_guard lck(mtx_);
    process_groups_.erase(std::remove(process_groups_.begin(), process_groups_.end(), pgid),
                          process_groups_.end());
  };
}

size_t Environment::LiveProcessGroups() {
  std::lock_guard lck(mtx_);
  return process_groups_.size();
}

void Environment::Release() noexcept {
  std::vector<pid_t> groups;
  {
    std::lock_guard lck(mtx_);
    if (released_) return;
    released_ = true;
    groups.swap(process_groups_);
  }
  spdlog::debug("Tear down environment {} at {}", id_, root_.c_str());
  // only groups whose leader is still unreaped, i.e. a SandboxExec that has not returned yet
  for (pid_t pgid : groups) {
    if (kill(-pgid, SIGKILL) < 0 && errno != ESRCH) {
      spdlog::warn("Failed to kill process group {} of environment {}: {}", pgid, id_, strerror(errno));
    }
  }
  if (!root_.empty() && !RemoveAll(root_)) {
    spdlog::warn("Environment {} was not fully removed", id_);
  }
  if (on_release_) {
    try {
      on_release_(id_, root_);
    } catch (const std::exception& e) {
      spdlog::error("Release callback of environment {} threw: {}", id_, e.what());
    }
  }
}

std::unique_ptr<Environment> CreateEnvironment(std::string* cause) {
  if (!CreateDirs(kBoxRoot)) {
    *cause = "cannot create box root " + kBoxRoot.string();
    return nullptr;
  }
  long id = GetUniqueEnvironmentId();
  std::string templ = EnvironmentTemplate(id).string();
  // mkdtemp creates the directory with mode 0700
  if (!mkdtemp(templ.data())) {
    *cause = "mkdtemp " + templ + ": " + strerror(errno);
    spdlog::warn("Failed to create environment: {}", *cause);
    return nullptr;
  }
  auto env = std::make_unique<Environment>(id, fs::path(templ));
  const fs::path& root = env->Root();
  if (!CreateDirs(EnvHome(root), kPerm700) ||
      !CreateDirs(EnvTmp(root), kPerm700) ||
      !CreateDirs(EnvWorkdir(root), kPerm700)) {
    *cause = "cannot create directories in " + root.string();
    return nullptr; // env is released here
  }
  spdlog::info("Created environment {} at {}", id, root.c_str());
  return env;
}

bool Provision(Environment& env, const std::vector<std::string>& deps,
               CancelToken* cancel, std::string* cause) {
  for (auto& dep : deps) {
    if (!ValidDependency(dep, cause)) return false;
  }
  const fs::path& root = env.Root();
  auto start = std::chrono::steady_clock::now();
  auto remaining = [&]() -> long {
    long elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start).count();
    return kProvisionTimeout * 1'000'000 - elapsed;
  };

  SandboxOptions opt;
  opt.envs = env.Envs();
  opt.workdir = root;
  opt.max_output = kInstallerOutput;
  opt.on_spawn = env.SpawnHook();
  opt.on_reap = env.ReapHook();

  // the installer is only needed if there is something to install
  opt.command = {kRuntime.string(), "-m", "venv"};
  if (deps.empty()) opt.command.push_back("--without-pip");
  opt.command.push_back(EnvVenvPath(root).string());
  opt.wall_time = remaining();
  SandboxResult res = SandboxExec(opt, cancel);
  if (std::string err = StepError("create environment", res); !err.empty()) {
    *cause = err;
    spdlog::info("Provisioning of environment {} failed: {}", env.Id(), err);
    return false;
  }

  for (auto& dep : deps) {
    long remain = remaining();
    if (remain <= 0) {
      *cause = dep + ": provisioning timed out (" + std::to_string(kProvisionTimeout) + "s)";
      return false;
    }
    spdlog::info("Installing {} into environment {}", dep, env.Id());
    opt.command = {env.Interpreter().string(), "-m", "pip", "install",
                   "--no-input", "--no-cache-dir", "--disable-pip-version-check"};
    if (!kIndexUrl.empty()) opt.command.insert(opt.command.end(), {"--index-url", kIndexUrl});
    opt.command.insert(opt.command.end(), {"--", dep});
    opt.wall_time = remain;
    res = SandboxExec(opt, cancel);
    if (std::string err = StepError(dep, res); !err.empty()) {
      *cause = err;
      spdlog::info("Provisioning of environment {} failed: {}", env.Id(), err);
      return false;
    }
  }
  spdlog::debug("Environment {} provisioned with {} dependencies", env.Id(), deps.size());
  return true;
}
