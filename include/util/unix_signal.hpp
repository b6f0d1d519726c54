#pragma once

#include <glibmm/dispatcher.h>
#include <sigc++/signal.h>

#include <atomic>
#include <csignal>
#include <map>
#include <mutex>
#include <queue>
#include <thread>

namespace sysdmon::util {

/*
 * Waits for POSIX signals on a dedicated thread and replays them on the thread that created
 * the handler (the Glib main loop), so handlers may touch any main loop state.
 */
class UnixSignalHandler {
 public:
  using SignalProxy = sigc::signal<void(int)>;

  UnixSignalHandler();
  ~UnixSignalHandler();

  UnixSignalHandler(const UnixSignalHandler &) = delete;
  UnixSignalHandler &operator=(const UnixSignalHandler &) = delete;

  /* Must be called before start() */
  SignalProxy &signal(int signum);

  /*
   * Blocks the registered signals for the calling thread and every thread created afterwards,
   * then starts waiting for them. Call it before anything spawns threads (GDBus does).
   */
  void start();

 private:
  void run();
  void dispatch();

  sigset_t mask_;
  std::thread thread_;
  std::atomic<bool> running_{false};

  Glib::Dispatcher dispatcher_;
  std::mutex pending_mtx_;
  std::queue<int> pending_;
  std::map<int, SignalProxy> handlers_;
};

}  // namespace sysdmon::util
