#include "utils.h"

#include <stdlib.h>
#include <unistd.h>
#include <fstream>
#include <cstdlib>

namespace {

const char kFakeRuntimeScript[] = R"(
if [ "$1" = "-c" ]; then
  echo "run" >> "$LOG"
  exec /bin/sh -c "$2"
fi
for last; do :; done
if [ "$1 $2" = "-m venv" ]; then
  echo "venv $*" >> "$LOG"
  mkdir -p "$last/bin" && cp "$0" "$last/bin/python"
  exit $?
fi
if [ "$1 $2 $3" = "-m pip install" ]; then
  echo "install $last" >> "$LOG"
  case "$last" in
    bad-package) echo "ERROR: No matching distribution found for bad-package" >&2; exit 1;;
    slow-package) sleep 5;;
  esac
  echo "$last" > "$VIRTUAL_ENV/${last%%==*}"
  exit $?
fi
echo "unexpected arguments: $*" >&2
exit 2
)";

} // namespace

bool HasPython() {
  static const bool has_python = [] {
    std::string cmd = kRuntime.string() + " -c 'import venv' >/dev/null 2>&1";
    return access(kRuntime.c_str(), X_OK) == 0 && std::system(cmd.c_str()) == 0;
  }();
  return has_python;
}

FakeRuntime::FakeRuntime() : prev_runtime_(kRuntime), prev_mode_(kPolicyMode) {
  std::string templ = (fs::temp_directory_path() / "runbox-fake-XXXXXX").string();
  EXPECT_NE(mkdtemp(templ.data()), nullptr);
  dir_ = templ;
  fs::path script = dir_ / "python3";
  {
    std::ofstream fout(script);
    fout << "#!/bin/sh\nLOG='" << LogPath().string() << "'\n" << kFakeRuntimeScript;
  }
  fs::permissions(script, fs::perms::owner_all);
  kRuntime = script;
  // /bin/sh is not an interpreter the syscall policies are made for
  kPolicyMode = PolicyMode::NONE;
}

FakeRuntime::~FakeRuntime() {
  kRuntime = prev_runtime_;
  kPolicyMode = prev_mode_;
  std::error_code ec;
  fs::remove_all(dir_, ec);
}

std::vector<std::string> FakeRuntime::Log() const {
  std::vector<std::string> ret;
  std::ifstream fin(LogPath());
  for (std::string line; std::getline(fin, line);) ret.push_back(line);
  return ret;
}

AssertTeardownReporter::~AssertTeardownReporter() {
  std::lock_guard lck(mtx_);
  EXPECT_EQ(created_.size(), released_.size());
  for (auto& [id, cnt] : created_) {
    EXPECT_EQ(cnt, 1) << "environment " << id;
    EXPECT_EQ(released_[id], 1) << "environment " << id;
  }
}

Reporter AssertTeardownReporter::GetReporter() {
  Reporter reporter;
  reporter.ReportEnvironmentCreated = [this](long id, const fs::path& root) {
    EXPECT_TRUE(fs::is_directory(root));
    std::lock_guard lck(mtx_);
    created_[id]++;
  };
  reporter.ReportTeardown = [this](long id, const fs::path& root) {
    EXPECT_FALSE(fs::exists(root));
    std::lock_guard lck(mtx_);
    released_[id]++;
  };
  reporter.ReportOutcome = [this](const ExecutionOutcome&) {
    std::lock_guard lck(mtx_);
    outcomes_++;
  };
  return reporter;
}

int AssertTeardownReporter::Created() {
  std::lock_guard lck(mtx_);
  return created_.size();
}

int AssertTeardownReporter::Outcomes() {
  std::lock_guard lck(mtx_);
  return outcomes_;
}

size_t CountEntries(const fs::path& dir) {
  std::error_code ec;
  size_t ret = 0;
  for (auto it = fs::directory_iterator(dir, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
    ret++;
  }
  return ret;
}
