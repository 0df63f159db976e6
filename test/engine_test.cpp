#include <chrono>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include <runbox/utils.h>
#include <runbox/engine.h>
#include <runbox/cancel.h>
#include "utils.h"

namespace {

using namespace std::chrono_literals;

const outcome::Completed& GetCompleted(const ExecutionOutcome& out) {
  return std::get<outcome::Completed>(out.result);
}

class EngineTest : public ::testing::Test {
 protected:
  void TearDown() override {
    EXPECT_EQ(CountEntries(kBoxRoot), 0);
  }
};

// the interpreter is replaced by /bin/sh; see FakeRuntime
TEST_F(EngineTest, RunProgram) {
  FakeRuntime runtime;
  AssertTeardownReporter reporter;
  auto out = ::Run(ExecutionRequest("echo 42"), reporter.GetReporter());
  ASSERT_EQ(out.Kind(), OutcomeKind::COMPLETED);
  EXPECT_EQ(GetCompleted(out).stdout_data, "42\n");
  EXPECT_EQ(GetCompleted(out).exit_code, 0);
  EXPECT_EQ(out.sandbox, GetEngineStatus().strength);
  EXPECT_EQ(reporter.Created(), 1);
  EXPECT_EQ(reporter.Outcomes(), 1);
}

TEST_F(EngineTest, NonZeroExitIsCompleted) {
  FakeRuntime runtime;
  AssertTeardownReporter reporter;
  auto out = ::Run(ExecutionRequest("echo oops >&2; exit 5"), reporter.GetReporter());
  ASSERT_TRUE(out.IsCompleted());
  EXPECT_EQ(GetCompleted(out).exit_code, 5);
  EXPECT_EQ(GetCompleted(out).stderr_data, "oops\n");
}

TEST_F(EngineTest, DependenciesInstalledBeforeRun) {
  FakeRuntime runtime;
  AssertTeardownReporter reporter;
  auto out = ::Run(ExecutionRequest("echo ran", {"alpha", "beta"}), reporter.GetReporter());
  ASSERT_TRUE(out.IsCompleted());
  auto log = runtime.Log();
  ASSERT_EQ(log.size(), 4);
  EXPECT_EQ(log[1], "install alpha");
  EXPECT_EQ(log[2], "install beta");
  EXPECT_EQ(log[3], "run");
}

TEST_F(EngineTest, ProvisioningFailure) {
  FakeRuntime runtime;
  AssertTeardownReporter reporter;
  auto out = ::Run(ExecutionRequest("echo ran", {"bad-package"}), reporter.GetReporter());
  ASSERT_EQ(out.Kind(), OutcomeKind::PROVISIONING_FAILED);
  EXPECT_NE(std::get<outcome::ProvisioningFailed>(out.result).cause.find("bad-package"), std::string::npos);
  EXPECT_EQ(reporter.Created(), 1);
  for (auto& line : runtime.Log()) EXPECT_NE(line, "run");
}

TEST_F(EngineTest, InvalidRequest) {
  AssertTeardownReporter reporter;
  ExecutionRequest req("print(1)");
  req.timeout_seconds = 0;
  EXPECT_EQ(::Run(req, reporter.GetReporter()).Kind(), OutcomeKind::RUNTIME_FAILURE);
  req.timeout_seconds = 10000000000000;
  EXPECT_EQ(::Run(req, reporter.GetReporter()).Kind(), OutcomeKind::RUNTIME_FAILURE);
  req.timeout_seconds = 1;
  req.max_output_bytes = -1;
  EXPECT_EQ(::Run(req, reporter.GetReporter()).Kind(), OutcomeKind::RUNTIME_FAILURE);
  EXPECT_EQ(reporter.Created(), 0);
  EXPECT_EQ(reporter.Outcomes(), 3);
}

TEST_F(EngineTest, ProgramWithNulByte) {
  FakeRuntime runtime;
  AssertTeardownReporter reporter;
  auto out = ::Run(ExecutionRequest(std::string("echo a\0b", 8)), reporter.GetReporter());
  EXPECT_EQ(out.Kind(), OutcomeKind::RUNTIME_FAILURE);
}

TEST_F(EngineTest, Timeout) {
  FakeRuntime runtime;
  AssertTeardownReporter reporter;
  ExecutionRequest req("sleep 10");
  req.timeout_seconds = 1;
  auto start = std::chrono::steady_clock::now();
  auto out = ::Run(req, reporter.GetReporter());
  EXPECT_LT(std::chrono::steady_clock::now() - start, 3s);
  ASSERT_EQ(out.Kind(), OutcomeKind::TIMED_OUT);
  EXPECT_EQ(std::get<outcome::TimedOut>(out.result).timeout, 1);
}

TEST_F(EngineTest, CancelBeforeRun) {
  AssertTeardownReporter reporter;
  CancelToken token;
  token.Cancel();
  auto out = ::Run(ExecutionRequest("echo 1"), reporter.GetReporter(), &token);
  EXPECT_EQ(out.Kind(), OutcomeKind::CANCELLED);
  EXPECT_EQ(reporter.Created(), 0);
}

TEST_F(EngineTest, CancelDuringProvisioning) {
  FakeRuntime runtime;
  AssertTeardownReporter reporter;
  CancelToken token;
  std::thread thr([&]() {
    std::this_thread::sleep_for(300ms);
    token.Cancel();
  });
  auto out = ::Run(ExecutionRequest("echo 1", {"slow-package"}), reporter.GetReporter(), &token);
  thr.join();
  EXPECT_EQ(out.Kind(), OutcomeKind::CANCELLED);
  EXPECT_EQ(reporter.Created(), 1);
}

TEST_F(EngineTest, CancelDuringExecution) {
  FakeRuntime runtime;
  AssertTeardownReporter reporter;
  CancelToken token;
  std::thread thr([&]() {
    std::this_thread::sleep_for(500ms);
    token.Cancel();
  });
  auto start = std::chrono::steady_clock::now();
  auto out = ::Run(ExecutionRequest("sleep 10"), reporter.GetReporter(), &token);
  thr.join();
  EXPECT_LT(std::chrono::steady_clock::now() - start, 4s);
  EXPECT_EQ(out.Kind(), OutcomeKind::CANCELLED);
}

TEST_F(EngineTest, ConcurrentRequests) {
  FakeRuntime runtime;
  AssertTeardownReporter reporter;
  constexpr int kThreads = 8;
  std::vector<ExecutionOutcome> outs(kThreads);
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; i++) {
    threads.emplace_back([&, i]() {
      outs[i] = ::Run(ExecutionRequest("echo " + std::to_string(i)), reporter.GetReporter());
    });
  }
  for (auto& thr : threads) thr.join();
  for (int i = 0; i < kThreads; i++) {
    ASSERT_TRUE(outs[i].IsCompleted()) << i;
    EXPECT_EQ(GetCompleted(outs[i]).stdout_data, std::to_string(i) + "\n");
  }
  EXPECT_EQ(reporter.Created(), kThreads);
}

TEST_F(EngineTest, ConcurrentConflictingDependencies) {
  FakeRuntime runtime;
  AssertTeardownReporter reporter;
  constexpr int kThreads = 6;
  std::vector<ExecutionOutcome> outs(kThreads);
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; i++) {
    threads.emplace_back([&, i]() {
      ExecutionRequest req("cat \"$VIRTUAL_ENV/shared\"");
      req.extra_dependencies = {"shared==" + std::to_string(i)};
      outs[i] = ::Run(req, reporter.GetReporter());
    });
  }
  for (auto& thr : threads) thr.join();
  for (int i = 0; i < kThreads; i++) {
    ASSERT_TRUE(outs[i].IsCompleted()) << i << ' ' << OutcomeKindName(outs[i].Kind());
    EXPECT_EQ(GetCompleted(outs[i]).stdout_data, "shared==" + std::to_string(i) + "\n");
  }
  EXPECT_EQ(reporter.Created(), kThreads);
}

TEST_F(EngineTest, OutputAtLimitIsNotTruncated) {
  FakeRuntime runtime;
  AssertTeardownReporter reporter;
  ExecutionRequest req("printf 0123456789; printf abcdefghij >&2");
  req.max_output_bytes = 10;
  auto out = ::Run(req, reporter.GetReporter());
  ASSERT_TRUE(out.IsCompleted()) << OutcomeKindName(out.Kind());
  EXPECT_EQ(GetCompleted(out).stdout_data, "0123456789");
  EXPECT_FALSE(GetCompleted(out).stdout_truncated);
  EXPECT_EQ(GetCompleted(out).stderr_data, "abcdefghij");
  EXPECT_FALSE(GetCompleted(out).stderr_truncated);
}

// --- real interpreter ---

TEST_F(EngineTest, PythonPrint) {
  SKIP_IF_NO_PYTHON();
  AssertTeardownReporter reporter;
  auto out = ::Run(ExecutionRequest("print(6*7)"), reporter.GetReporter());
  ASSERT_TRUE(out.IsCompleted()) << OutcomeKindName(out.Kind());
  EXPECT_EQ(GetCompleted(out).stdout_data, "42\n") << GetCompleted(out).stderr_data;
  EXPECT_EQ(GetCompleted(out).exit_code, 0);
}

TEST_F(EngineTest, PythonInfiniteLoop) {
  SKIP_IF_NO_PYTHON();
  AssertTeardownReporter reporter;
  ExecutionRequest req("while True: pass");
  req.timeout_seconds = 1;
  auto start = std::chrono::steady_clock::now();
  auto out = ::Run(req, reporter.GetReporter());
  ASSERT_EQ(out.Kind(), OutcomeKind::TIMED_OUT);
  // environment creation is not part of the execution timeout
  EXPECT_LT(std::get<outcome::TimedOut>(out.result).elapsed, 3'000'000);
  EXPECT_LT(std::chrono::steady_clock::now() - start, 30s);
}

TEST_F(EngineTest, PythonMissingModule) {
  SKIP_IF_NO_PYTHON();
  AssertTeardownReporter reporter;
  auto out = ::Run(ExecutionRequest("import runbox_no_such_module"), reporter.GetReporter());
  ASSERT_TRUE(out.IsCompleted());
  EXPECT_NE(GetCompleted(out).exit_code, 0);
  EXPECT_NE(GetCompleted(out).stderr_data.find("No module named"), std::string::npos);
}

TEST_F(EngineTest, PythonOutputTruncated) {
  SKIP_IF_NO_PYTHON();
  AssertTeardownReporter reporter;
  ExecutionRequest req("print('x' * 100000)");
  req.max_output_bytes = 10;
  auto out = ::Run(req, reporter.GetReporter());
  ASSERT_TRUE(out.IsCompleted());
  EXPECT_EQ(GetCompleted(out).stdout_data, "xxxxxxxxxx");
  EXPECT_TRUE(GetCompleted(out).stdout_truncated);
}

TEST_F(EngineTest, PythonExitCode) {
  SKIP_IF_NO_PYTHON();
  AssertTeardownReporter reporter;
  auto out = ::Run(ExecutionRequest("import sys; sys.exit(3)"), reporter.GetReporter());
  ASSERT_TRUE(out.IsCompleted());
  EXPECT_EQ(GetCompleted(out).exit_code, 3);
}

} // namespace
