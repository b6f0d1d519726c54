#include "util/unix_signal.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>

namespace sysdmon::util {

UnixSignalHandler::UnixSignalHandler() {
  sigemptyset(&mask_);
  dispatcher_.connect(sigc::mem_fun(*this, &UnixSignalHandler::dispatch));
}

UnixSignalHandler::SignalProxy &UnixSignalHandler::signal(int signum) {
  if (thread_.joinable()) {
    /*
     * At this point we may have more threads running with the original sigmask,
     * and it's too late to block new signals for them.
     */
    throw std::runtime_error("Cannot add signal to already running signal thread");
  }

  sigaddset(&mask_, signum);
  return handlers_[signum];
}

void UnixSignalHandler::start() {
  // Block signals so they can be handled by the signal thread
  // Any threads created by this one (the main thread) should not
  // modify their signal mask to unblock the handled signals
  if (int err = pthread_sigmask(SIG_BLOCK, &mask_, nullptr); err != 0) {
    throw std::runtime_error(std::string("pthread_sigmask failed: ") + strerror(err));
  }

  running_ = true;
  thread_ = std::thread([this]() { run(); });
}

UnixSignalHandler::~UnixSignalHandler() {
  running_ = false;
  if (thread_.joinable()) {
    thread_.join();
  }
}

void UnixSignalHandler::run() {
  struct timespec timeout;
  timeout.tv_sec = 0;
  timeout.tv_nsec = 100 * 1000 * 1000;

  while (running_) {
    int signum = sigtimedwait(&mask_, nullptr, &timeout);
    if (signum == -1) {
      if (errno != EAGAIN && errno != EINTR) {
        spdlog::error("sigtimedwait failed: {}", strerror(errno));
      }
      continue;
    }

    {
      std::unique_lock lock{pending_mtx_};
      pending_.push(signum);
    }
    dispatcher_.emit();
  }
}

void UnixSignalHandler::dispatch() {
  for (std::unique_lock lock(pending_mtx_); !pending_.empty(); lock.lock()) {
    int signum = pending_.front();
    pending_.pop();
    lock.unlock();

    spdlog::debug("Received signal {} ({})", signum, strsignal(signum));
    try {
      if (auto it = handlers_.find(signum); it != handlers_.end()) {
        it->second.emit(signum);
      }
    } catch (const std::exception &e) {
      spdlog::error("Error handling signal {}: {}", signum, e.what());
    }
  }
}

}  // namespace sysdmon::util
