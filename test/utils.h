#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <map>
#include <mutex>
#include <string>
#include <vector>
#include <filesystem>
#include <gtest/gtest.h>
#include <runbox/engine.h>
#include <runbox/paths.h>

// a usable host interpreter, including the venv module
bool HasPython();

#define SKIP_IF_NO_PYTHON() \
  if (!HasPython()) GTEST_SKIP() << "host runtime " << kRuntime << " is not usable"

// A shell script standing in for the interpreter:
//   -m venv [...] DIR         copies itself to DIR/bin/python
//   -m pip install ... PKG    "installs" PKG; fails for bad-package, sleeps for slow-package
//   -c CODE                   runs CODE with /bin/sh
// Every invocation is appended to LogPath().
class FakeRuntime {
  fs::path dir_;
  fs::path prev_runtime_;
  PolicyMode prev_mode_;
 public:
  FakeRuntime();
  ~FakeRuntime();
  fs::path LogPath() const { return dir_ / "log"; }
  std::vector<std::string> Log() const;
};

// Reporter asserting that every created environment is torn down exactly once
class AssertTeardownReporter {
  std::mutex mtx_;
  std::map<long, int> created_, released_;
  int outcomes_;
 public:
  AssertTeardownReporter() : outcomes_(0) {}
  ~AssertTeardownReporter();

  Reporter GetReporter();
  int Created();
  int Outcomes();
};

size_t CountEntries(const fs::path&);

#endif // TEST_UTILS_H_
