#include <poll.h>
#include <thread>
#include <gtest/gtest.h>
#include <runbox/cancel.h>

namespace {

TEST(CancelTokenTest, InitiallyNotCancelled) {
  CancelToken token;
  EXPECT_FALSE(token.IsCancelled());
  ASSERT_GE(token.EventFd(), 0);
  struct pollfd pfd = {token.EventFd(), POLLIN, 0};
  EXPECT_EQ(poll(&pfd, 1, 0), 0);
}

TEST(CancelTokenTest, CancelWakesWaiters) {
  CancelToken token;
  std::thread thr([&]() { token.Cancel(); });
  struct pollfd pfd = {token.EventFd(), POLLIN, 0};
  EXPECT_EQ(poll(&pfd, 1, 5000), 1);
  thr.join();
  EXPECT_TRUE(token.IsCancelled());
}

TEST(CancelTokenTest, Idempotent) {
  CancelToken token;
  token.Cancel();
  token.Cancel();
  EXPECT_TRUE(token.IsCancelled());
}

} // namespace
