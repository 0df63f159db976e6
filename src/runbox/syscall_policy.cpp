#include "syscall_policy.h"

#include <unistd.h>
#include <sys/mman.h>
#include <sys/prctl.h>
#include <sys/syscall.h>
#include <linux/seccomp.h>
#include <cerrno>
#include <cstring>

#include <seccomp.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include "utils.h"

namespace {

// stat/access have no entry on some architectures; the *at variants stand in for them
const std::vector<std::string> kStrictSyscalls = {
  "read", "write", "open", "openat", "close",
  "stat", "fstat", "newfstatat", "lseek",
  "mmap", "munmap", "brk",
  "access", "faccessat",
  "exit", "exit_group",
  "execve",
};

// interpreter startup, imports, tracebacks and simple console I/O
const std::vector<std::string> kInterpreterExtraSyscalls = {
  "lstat", "statx", "fstatfs", "statfs", "faccessat2",
  "pread64", "readv", "writev",
  "getdents64", "getcwd", "readlink", "readlinkat",
  "ioctl", "fcntl", "dup", "dup2", "dup3", "pipe", "pipe2",
  "poll", "ppoll", "select", "pselect6",
  "mprotect", "mremap", "madvise", "membarrier",
  "rt_sigaction", "rt_sigprocmask", "rt_sigreturn", "sigaltstack", "tgkill",
  "futex", "set_tid_address", "set_robust_list", "get_robust_list", "rseq",
  "arch_prctl", "prlimit64", "getrlimit",
  "getrandom",
  "clock_gettime", "clock_getres", "clock_nanosleep", "nanosleep", "gettimeofday", "time",
  "getpid", "getppid", "gettid", "getuid", "geteuid", "getgid", "getegid", "getgroups",
  "uname", "sysinfo", "sched_getaffinity", "sched_yield",
};

std::vector<std::string> MakeInterpreterSyscalls() {
  std::vector<std::string> ret = kStrictSyscalls;
  ret.insert(ret.end(), kInterpreterExtraSyscalls.begin(), kInterpreterExtraSyscalls.end());
  return ret;
}

const std::vector<std::string> kInterpreterSyscalls = MakeInterpreterSyscalls();
const std::vector<std::string> kNoSyscalls;

uint32_t KillAction() {
  uint32_t kill_code = SCMP_ACT_KILL_PROCESS;
  if (syscall(__NR_seccomp, SECCOMP_GET_ACTION_AVAIL, 0, &kill_code) < 0) {
    spdlog::debug("Seccomp action KILL_PROCESS is not available; falling back to KILL_THREAD");
    kill_code = SCMP_ACT_KILL;
  }
  return kill_code;
}

// seccomp_export_bpf only writes to a file descriptor
bool ExportProgram(scmp_filter_ctx ctx, std::vector<struct sock_filter>& program, std::string* error) {
  int fd = memfd_create("runbox-bpf", MFD_CLOEXEC);
  if (fd < 0) {
    *error = std::string("memfd_create: ") + strerror(errno);
    return false;
  }
  std::string buf;
  if (int ret = seccomp_export_bpf(ctx, fd); ret < 0) {
    *error = std::string("seccomp_export_bpf: ") + strerror(-ret);
    goto err;
  }
  if (lseek(fd, 0, SEEK_SET) < 0) {
    *error = std::string("lseek: ") + strerror(errno);
    goto err;
  }
  for (char chunk[4096];;) {
    ssize_t len = read(fd, chunk, sizeof(chunk));
    if (len < 0) {
      if (errno == EINTR) continue;
      *error = std::string("read: ") + strerror(errno);
      goto err;
    }
    if (len == 0) break;
    buf.append(chunk, len);
  }
  close(fd);
  if (buf.empty() || buf.size() % sizeof(struct sock_filter)) {
    *error = "seccomp_export_bpf produced a malformed program";
    return false;
  }
  program.resize(buf.size() / sizeof(struct sock_filter));
  memcpy(program.data(), buf.data(), buf.size());
  return true;
err:
  close(fd);
  return false;
}

} // namespace

const std::vector<std::string>& PolicySyscalls(PolicyMode mode) {
  switch (mode) {
    case PolicyMode::STRICT: return kStrictSyscalls;
    case PolicyMode::INTERPRETER: return kInterpreterSyscalls;
    case PolicyMode::NONE: return kNoSyscalls;
  }
  __builtin_unreachable();
}

SandboxStrength DetectSandboxStrength(PolicyMode mode, std::string* reason) {
  auto weak = [&](const std::string& msg) {
    if (reason) *reason = msg;
    return SandboxStrength::NONE;
  };
  if (mode == PolicyMode::NONE) {
    return weak("syscall filtering is disabled by configuration");
  }
  if (prctl(PR_GET_SECCOMP, 0, 0, 0, 0) < 0) {
    return weak(std::string("kernel has no seccomp support: ") + strerror(errno));
  }
  // with a null program, EFAULT means filter mode exists and EINVAL means it does not
  if (prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, nullptr, 0, 0) == 0 || errno != EFAULT) {
    return weak(std::string("kernel has no seccomp filter mode: ") + strerror(errno));
  }
  if (reason) reason->clear();
  return SandboxStrength::FULL;
}

std::optional<SyscallPolicy> BuildPolicy(PolicyMode mode, SandboxStrength strength, std::string* error) {
  SyscallPolicy policy;
  policy.mode = mode;
  policy.allowed = PolicySyscalls(mode);
  if (mode == PolicyMode::NONE || strength == SandboxStrength::NONE) {
    spdlog::debug("Syscall policy {} is a no-op", PolicyModeName(mode));
    return policy;
  }
  policy.default_action = KillAction();
  scmp_filter_ctx ctx = seccomp_init(policy.default_action);
  if (!ctx) {
    *error = "seccomp_init failed";
    return std::nullopt;
  }
  for (auto& name : policy.allowed) {
    int nr = seccomp_syscall_resolve_name(name.c_str());
    if (nr == __NR_SCMP_ERROR) {
      spdlog::debug("Ignoring syscall {} unknown on this architecture", name);
      continue;
    }
    if (int ret = seccomp_rule_add(ctx, SCMP_ACT_ALLOW, nr, 0); ret < 0) {
      *error = "seccomp_rule_add " + name + ": " + strerror(-ret);
      seccomp_release(ctx);
      return std::nullopt;
    }
  }
  bool ok = ExportProgram(ctx, policy.program, error);
  seccomp_release(ctx);
  if (!ok) return std::nullopt;
  spdlog::debug("Built syscall policy {}: {} instructions, allow {}",
                PolicyModeName(mode), policy.program.size(), fmt::join(policy.allowed, ","));
  return policy;
}

int ApplyPolicy(const SyscallPolicy& policy) {
  if (policy.IsNoop()) return 0;
  if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) < 0) return errno;
  struct sock_fprog prog = {};
  prog.len = (unsigned short)policy.program.size();
  prog.filter = const_cast<struct sock_filter*>(policy.program.data());
  if (prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, &prog, 0, 0) < 0) return errno;
  return 0;
}
