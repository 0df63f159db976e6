#include "sandbox.h"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/prctl.h>
#include <sys/wait.h>
#include <chrono>
#include <cerrno>
#include <cstring>
#include <cstdlib>
#include <algorithm>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <runbox/cancel.h>
#include "syscall_policy.h"
#include "utils.h"

namespace {

// the status pipe is moved here in the child
constexpr int kStatusFd = 3;
// max poll() sleep; bounds how late we notice the exit of the child
constexpr int kPollIntervalMs = 10;
// how long to keep reading after the child exited and its group was killed
constexpr long kDrainGrace = 200'000; // us
constexpr size_t kReadChunk = 65536;

struct SpawnStatus {
  int stage;
  int err;
};

struct ChildArgs {
  std::vector<char*> argv;
  std::vector<char*> envp;
  const char* workdir;
  const SandboxOptions* opt;
  pid_t parent;
  int stdout_fd, stderr_fd, status_fd;
};

[[noreturn]] void ChildDie(int status_fd, SpawnStage stage, int err) {
  SpawnStatus st{(int)stage, err};
  IGNORE_RETURN(write(status_fd, &st, sizeof(st)));
  _exit(127);
}

/// child
// Only async-signal-safe calls from here on; everything is prepared by the parent.
[[noreturn]] void Child(const ChildArgs& args) {
  const SandboxOptions& opt = *args.opt;
  int status_fd = args.status_fd;
  if (setsid() < 0) ChildDie(status_fd, SpawnStage::SETSID, errno);
  // setsid() detaches us from the terminal; die with the thread supervising us instead
  if (prctl(PR_SET_PDEATHSIG, SIGKILL, 0, 0, 0) < 0) ChildDie(status_fd, SpawnStage::SETSID, errno);
  if (getppid() != args.parent) _exit(127); // parent died before PR_SET_PDEATHSIG
  // the parent may block signals for a sigwait thread; the mask survives execve
  sigset_t mask;
  sigemptyset(&mask);
  if (sigprocmask(SIG_SETMASK, &mask, nullptr) < 0) ChildDie(status_fd, SpawnStage::SETSID, errno);

  int null_fd = open("/dev/null", O_RDONLY | O_CLOEXEC);
  if (null_fd < 0) ChildDie(status_fd, SpawnStage::REDIRECT, errno);
  if (dup2(null_fd, STDIN_FILENO) < 0 ||
      dup2(args.stdout_fd, STDOUT_FILENO) < 0 ||
      dup2(args.stderr_fd, STDERR_FILENO) < 0) {
    ChildDie(status_fd, SpawnStage::REDIRECT, errno);
  }
  if (status_fd != kStatusFd) {
    if (dup2(status_fd, kStatusFd) < 0) ChildDie(status_fd, SpawnStage::REDIRECT, errno);
    status_fd = kStatusFd;
    if (fcntl(status_fd, F_SETFD, FD_CLOEXEC) < 0) ChildDie(status_fd, SpawnStage::REDIRECT, errno);
  }
  if (CloseFrom(kStatusFd + 1) < 0) ChildDie(status_fd, SpawnStage::REDIRECT, errno);

  if (args.workdir[0] && chdir(args.workdir) < 0) ChildDie(status_fd, SpawnStage::CHDIR, errno);

  struct rlimit rlim {};
#define SET_RLIM(res, value) \
  { \
    rlim_t lim = value; \
    if (lim) { \
      rlim.rlim_cur = rlim.rlim_max = lim; \
      if (setrlimit(RLIMIT_##res, &rlim) < 0) ChildDie(status_fd, SpawnStage::RLIMIT, errno); \
    } \
  }
  SET_RLIM(AS, (rlim_t)opt.vss * 1024);
  SET_RLIM(FSIZE, (rlim_t)opt.fsize * 1024);
  SET_RLIM(NOFILE, (rlim_t)opt.file_num);
  SET_RLIM(NPROC, (rlim_t)opt.proc_num);
#undef SET_RLIM
  rlim.rlim_cur = rlim.rlim_max = 0; // no core dump
  if (setrlimit(RLIMIT_CORE, &rlim) < 0) ChildDie(status_fd, SpawnStage::RLIMIT, errno);

  // must be the last step: the filter may not allow anything but execve
  if (opt.policy) {
    if (int err = ApplyPolicy(*opt.policy)) ChildDie(status_fd, SpawnStage::POLICY, err);
  }
  execve(args.argv[0], args.argv.data(), args.envp.data());
  ChildDie(status_fd, SpawnStage::EXEC, errno);
}

/// parent
inline long ElapsedUs(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::steady_clock::now() - start).count();
}

void ClosePipe(int fds[2]) {
  if (fds[0] >= 0) close(fds[0]);
  if (fds[1] >= 0) close(fds[1]);
  fds[0] = fds[1] = -1;
}

class OutputStream {
  int fd_;
  size_t max_;
  std::string& data_;
  bool& truncated_;
 public:
  OutputStream(int fd, size_t max, std::string& data, bool& truncated) :
      fd_(fd), max_(max), data_(data), truncated_(truncated) {}
  ~OutputStream() { Close(); }

  int Fd() const { return fd_; }
  bool IsOpen() const { return fd_ >= 0; }
  void Close() {
    if (fd_ >= 0) close(fd_);
    fd_ = -1;
  }
  // keep the head of the stream; drain everything else so that the writer never blocks
  void ReadAvailable() {
    char buf[kReadChunk];
    ssize_t len = read(fd_, buf, sizeof(buf));
    if (len < 0) {
      if (errno == EINTR || errno == EAGAIN) return;
      spdlog::warn("Failed to read output of child: {}", strerror(errno));
      Close();
      return;
    }
    if (len == 0) {
      Close();
      return;
    }
    size_t keep = data_.size() < max_ ? std::min(max_ - data_.size(), (size_t)len) : 0;
    data_.append(buf, keep);
    if (keep < (size_t)len) truncated_ = true;
  }
};

} // namespace

const char* SpawnStageName(SpawnStage stage) {
  switch (stage) {
#define X(name, str) case SpawnStage::name: return str;
    ENUM_SPAWN_STAGE_
#undef X
  }
  __builtin_unreachable();
}

std::string ResolveExecutable(const std::string& name) {
  if (name.empty()) return "";
  if (name.find('/') != std::string::npos) {
    return access(name.c_str(), X_OK) == 0 ? name : "";
  }
  const char* path_env = getenv("PATH");
  std::string path = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";
  size_t pos = 0;
  while (pos <= path.size()) {
    size_t nxt = path.find(':', pos);
    if (nxt == std::string::npos) nxt = path.size();
    std::string dir = path.substr(pos, nxt - pos);
    if (dir.empty()) dir = ".";
    std::string candidate = dir + "/" + name;
    struct stat st;
    if (stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) && access(candidate.c_str(), X_OK) == 0) {
      return candidate;
    }
    pos = nxt + 1;
  }
  return "";
}

SandboxResult SandboxExec(const SandboxOptions& opt, CancelToken* cancel) {
  SandboxResult ret;
  auto fail = [&](SpawnStage stage, const std::string& what, int err) {
    ret.failed_stage = stage;
    ret.error = what + ": " + strerror(err);
    spdlog::warn("SandboxExec error at {}: {}", SpawnStageName(stage), ret.error);
    return ret;
  };
  if (opt.command.empty()) return fail(SpawnStage::EXEC, "empty command", EINVAL);
  std::string executable = ResolveExecutable(opt.command[0]);
  if (executable.empty()) return fail(SpawnStage::EXEC, opt.command[0], ENOENT);

  // all argument arrays are built before fork
  std::vector<std::string> argv_buf = opt.command;
  argv_buf[0] = executable;
  ChildArgs args;
  args.opt = &opt;
  args.parent = getpid();
  args.workdir = opt.workdir.c_str();
  for (auto& i : argv_buf) args.argv.push_back(i.data());
  args.argv.push_back(nullptr);
  std::vector<std::string> env_buf = opt.envs;
  for (auto& i : env_buf) args.envp.push_back(i.data());
  args.envp.push_back(nullptr);

  // O_CLOEXEC: concurrent spawns must not inherit each other's pipes
  int out_pipe[2] = {-1, -1}, err_pipe[2] = {-1, -1}, status_pipe[2] = {-1, -1};
  if (pipe2(out_pipe, O_CLOEXEC) < 0 || pipe2(err_pipe, O_CLOEXEC) < 0 ||
      pipe2(status_pipe, O_CLOEXEC) < 0) {
    int err = errno;
    ClosePipe(out_pipe), ClosePipe(err_pipe), ClosePipe(status_pipe);
    return fail(SpawnStage::PIPE, "pipe2", err);
  }
  args.stdout_fd = out_pipe[1];
  args.stderr_fd = err_pipe[1];
  args.status_fd = status_pipe[1];

  spdlog::debug("SandboxExec command: {}", fmt::format("{}", opt.command));
  pid_t pid = fork();
  if (pid < 0) {
    int err = errno;
    ClosePipe(out_pipe), ClosePipe(err_pipe), ClosePipe(status_pipe);
    return fail(SpawnStage::FORK, "fork", err);
  }
  if (pid == 0) Child(args);

  auto start = std::chrono::steady_clock::now();
  if (opt.on_spawn) opt.on_spawn(pid);
  close(out_pipe[1]);
  close(err_pipe[1]);
  close(status_pipe[1]);

  // EOF on the status pipe means execve succeeded
  SpawnStatus st{};
  ssize_t st_len;
  do {
    st_len = read(status_pipe[0], &st, sizeof(st));
  } while (st_len < 0 && errno == EINTR);
  close(status_pipe[0]);
  if (st_len == sizeof(st)) {
    close(out_pipe[0]);
    close(err_pipe[0]);
    if (opt.on_reap) opt.on_reap(pid);
    while (waitpid(pid, nullptr, 0) < 0 && errno == EINTR);
    std::string what = (SpawnStage)st.stage == SpawnStage::EXEC ? executable : SpawnStageName((SpawnStage)st.stage);
    return fail((SpawnStage)st.stage, what, st.err);
  }
  spdlog::debug("SandboxExec pid={} started", pid);

  OutputStream out(out_pipe[0], opt.max_output, ret.stdout_data, ret.stdout_truncated);
  OutputStream err(err_pipe[0], opt.max_output, ret.stderr_data, ret.stderr_truncated);
  int cancel_fd = cancel ? cancel->EventFd() : -1;
  bool exited = false;
  long exit_time = 0;
  while (true) {
    long elapsed = ElapsedUs(start);
    if (!exited && cancel && cancel->IsCancelled()) {
      ret.cancelled = true;
      break;
    }
    if (!exited && opt.wall_time && elapsed >= opt.wall_time) {
      ret.timekill = true;
      break;
    }
    if (!exited) {
      // WNOWAIT: the zombie keeps the process group id from being reused until we kill the group
      siginfo_t info{};
      if (waitid(P_PID, pid, &info, WEXITED | WNOHANG | WNOWAIT) == 0 && info.si_pid == pid) {
        exited = true;
        exit_time = elapsed;
        kill(-pid, SIGKILL);
      }
    }
    if (exited && (!out.IsOpen() && !err.IsOpen())) break;
    if (exited && elapsed - exit_time >= kDrainGrace) {
      spdlog::debug("SandboxExec pid={}: output still open after exit, dropping it", pid);
      break;
    }

    struct pollfd fds[3];
    int nfds = 0;
    if (out.IsOpen()) fds[nfds++] = {out.Fd(), POLLIN, 0};
    if (err.IsOpen()) fds[nfds++] = {err.Fd(), POLLIN, 0};
    if (!exited && cancel_fd >= 0) fds[nfds++] = {cancel_fd, POLLIN, 0};
    int timeout_ms = kPollIntervalMs;
    if (!exited && opt.wall_time) {
      long remain_ms = (opt.wall_time - elapsed + 999) / 1000;
      timeout_ms = (int)std::max(0L, std::min((long)timeout_ms, remain_ms));
    }
    int pret = poll(fds, nfds, timeout_ms);
    if (pret < 0) {
      if (errno == EINTR) continue;
      spdlog::warn("poll failed: {}", strerror(errno));
      break;
    }
    for (int i = 0; i < nfds; i++) {
      if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
      if (fds[i].fd == out.Fd()) {
        out.ReadAvailable();
      } else if (fds[i].fd == err.Fd()) {
        err.ReadAvailable();
      }
    }
  }
  ret.time = exited ? exit_time : ElapsedUs(start);
  // kill everything left in the group: timeout, cancellation, or descendants of an exited leader
  if (kill(-pid, SIGKILL) < 0 && errno != ESRCH) {
    spdlog::warn("Failed to kill process group {}: {}", pid, strerror(errno));
  }
  // the pid (and with it the group id) may be reused as soon as it is reaped
  if (opt.on_reap) opt.on_reap(pid);
  int status = 0;
  while (wait4(pid, &status, 0, &ret.rus) < 0) {
    if (errno != EINTR) {
      spdlog::warn("wait4 pid={} failed: {}", pid, strerror(errno));
      break;
    }
  }
  if (WIFEXITED(status)) {
    ret.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    ret.signal = WTERMSIG(status);
    ret.exit_code = 128 + ret.signal;
  }
  spdlog::debug("SandboxExec pid={} finished: exit_code={} signal={} time={}us timekill={} cancelled={}",
                pid, ret.exit_code, ret.signal, ret.time, ret.timekill, ret.cancelled);
  return ret;
}
