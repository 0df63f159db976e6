#ifndef INCLUDE_RUNBOX_CANCEL_H_
#define INCLUDE_RUNBOX_CANCEL_H_

#include <atomic>

// Shared by every step of one request; cancelling it kills whatever process
// the request is currently waiting on (installer or program).
// Cancel() may be called from any thread, at most once taking effect.
class CancelToken {
  std::atomic_bool cancelled_;
  int event_fd_; // readable once cancelled; -1 if eventfd is unavailable
 public:
  CancelToken();
  ~CancelToken();
  CancelToken(const CancelToken&) = delete;
  CancelToken& operator=(const CancelToken&) = delete;

  void Cancel();
  bool IsCancelled() const { return cancelled_.load(); }
  // for poll(); -1 if not available (waiters fall back to periodic checks)
  int EventFd() const { return event_fd_; }
};

#endif  // INCLUDE_RUNBOX_CANCEL_H_
