#include <runbox/logger.h>

#include <pthread.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/ansicolor_sink.h>

namespace {

using ansicolor_sink = spdlog::sinks::ansicolor_sink<spdlog::details::console_mutex>;

// a child forked while another thread is logging must not inherit a held lock
void LockSinks() {
  for (auto& i : spdlog::default_logger()->sinks()) {
    if (auto ptr = dynamic_cast<ansicolor_sink*>(i.get())) {
      ptr->mutex_.lock();
    }
  }
}

void UnlockSinks() {
  for (auto& i : spdlog::default_logger()->sinks()) {
    if (auto ptr = dynamic_cast<ansicolor_sink*>(i.get())) {
      ptr->mutex_.unlock();
    }
  }
}

} // namespace

void InitLogger() {
  static pthread_once_t once = PTHREAD_ONCE_INIT;
  pthread_once(&once, [] {
    spdlog::debug("Setup logger pthread_atfork");
    if (int err = pthread_atfork(LockSinks, UnlockSinks, UnlockSinks)) {
      spdlog::warn("pthread_atfork failed: {}", err);
    }
  });
}
