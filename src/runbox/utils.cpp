#include "utils.h"

#include <unistd.h>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <cstdlib>

#include <spdlog/spdlog.h>

#if __has_include(<linux/close_range.h>)
#include <linux/close_range.h>
int CloseFrom(int minfd) {
  return close_range(minfd, ~0U, 0);
}
#else
#include <dirent.h>
int CloseFrom(int minfd) {
  DIR *fddir = opendir("/proc/self/fd");
  if (!fddir) goto error;
  {
    int dfd = dirfd(fddir);
    for (struct dirent *dent; (dent = readdir(fddir));) {
      if (!strcmp(dent->d_name, ".") || !strcmp(dent->d_name, "..")) continue;
      int fd = strtol(dent->d_name, NULL, 10);
      if (fd >= minfd && fd != dfd) {
        if (close(fd) && errno != EBADF) goto error_dir;
      }
    }
  }
  closedir(fddir);
  return 0;

error_dir:
  closedir(fddir);
error:
  return -1;
}
#endif // has_include(<linux/close_range.h>)

namespace {

std::atomic_long environment_id_seq = 0;

} // namespace

long GetUniqueEnvironmentId() {
  return ++environment_id_seq;
}

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG2(cls, x, y, ...) case cls::x: return y;

#define X(...) X_RETURN_ARG2(SandboxStrength, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* SandboxStrengthName, SandboxStrength, ENUM_SANDBOX_STRENGTH_)
#undef X

#define X(...) X_RETURN_ARG2(OutcomeKind, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* OutcomeKindName, OutcomeKind, ENUM_OUTCOME_KIND_)
#undef X

#define X(...) X_RETURN_ARG2(PolicyMode, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* PolicyModeName, PolicyMode, ENUM_POLICY_MODE_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG2

static const char* kPolicyModeNameTable[] = {
#define X(name, str) str,
  ENUM_POLICY_MODE_
#undef X
};

std::optional<PolicyMode> GetPolicyMode(const std::string& str) {
  for (size_t i = 0; i < sizeof(kPolicyModeNameTable) / sizeof(kPolicyModeNameTable[0]); i++) {
    if (str == kPolicyModeNameTable[i]) return (PolicyMode)i;
  }
  return std::nullopt;
}

bool CreateDirs(const fs::path& path, fs::perms perms) {
  spdlog::debug("Create directories {}", path.c_str());
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) goto err;
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed creating directory {}: {}", path.c_str(), ec.message());
  return false;
}

bool RemoveAll(const fs::path& path) {
  spdlog::debug("Delete {}", path.c_str());
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed deleting {}: {}", path.c_str(), ec.message());
  return false;
}

std::string Tail(const std::string& str, size_t max_len) {
  if (str.size() <= max_len) return str;
  return "..." + str.substr(str.size() - max_len);
}
