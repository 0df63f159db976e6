#include <runbox/cancel.h>

#include <unistd.h>
#include <sys/eventfd.h>
#include <cerrno>
#include <cstring>
#include <cstdint>

#include <spdlog/spdlog.h>

CancelToken::CancelToken() : cancelled_(false) {
  event_fd_ = eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
  if (event_fd_ < 0) {
    spdlog::warn("eventfd failed, cancellation will be polled: {}", strerror(errno));
  }
}

CancelToken::~CancelToken() {
  if (event_fd_ >= 0) close(event_fd_);
}

void CancelToken::Cancel() {
  if (cancelled_.exchange(true)) return;
  spdlog::debug("Cancellation requested");
  if (event_fd_ >= 0) {
    uint64_t one = 1;
    if (write(event_fd_, &one, sizeof(one)) < 0) {
      spdlog::warn("Failed to signal cancellation: {}", strerror(errno));
    }
  }
}
