#include <giomm/init.h>
#include <glibmm/main.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>

#include "cli.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "notifier.hpp"
#include "systemd/manager.hpp"
#include "util/logging.hpp"
#include "util/unix_signal.hpp"
#include "watcher.hpp"

namespace {

const int EXIT_FAILURE_RUNTIME = 1;
const int EXIT_USAGE = 2;

class Watch {
 public:
  explicit Watch(const sysdmon::WatchOptions &options) : options_(options) {
    auto loop = loop_;
    auto quit = [loop](int signum) {
      spdlog::info("Quitting on {}.", strsignal(signum));
      loop->quit();
    };
    for (int signum : {SIGINT, SIGTERM, SIGHUP, SIGQUIT}) {
      signals_.signal(signum).connect(quit);
    }
    signals_.signal(SIGUSR1).connect([this](int) { reload(); });
    // Before GDBus spawns its worker thread, so that it inherits the mask
    signals_.start();
  }

  int run() {
    using sysdmon::systemd::BusScope;

    config_.load(options_.config);
    notifier_ = std::make_unique<sysdmon::DesktopNotifier>(config_.notificationSettings());
    watcher_ = std::make_unique<sysdmon::FailureWatcher>(*notifier_, config_.watcherSettings());

    manager_ =
        std::make_unique<sysdmon::systemd::Manager>(options_.user ? BusScope::USER
                                                                  : BusScope::SYSTEM);
    manager_->signal_connection_lost().connect([this](const std::string &) {
      exit_code_ = EXIT_FAILURE_RUNTIME;
      loop_->quit();
    });

    subscription_ = manager_->subscribe();
    subscription_->signal_unit_changed().connect(
        [this](const sysdmon::UnitStateChange &change) { watcher_->handleChange(change); });

    spdlog::info("Listening for failed units on the {} bus...",
                 options_.user ? "session" : "system");
    loop_->run();

    subscription_.reset();
    return exit_code_;
  }

 private:
  void reload() {
    try {
      config_.reload();
      auto settings = config_.watcherSettings();
      auto notification = config_.notificationSettings();
      if (watcher_) watcher_->reconfigure(std::move(settings));
      if (notifier_) notifier_->setSettings(notification);
    } catch (const sysdmon::ConfigError &e) {
      spdlog::error("Keeping the previous configuration: {}", e.what());
    }
  }

  sysdmon::WatchOptions options_;
  Glib::RefPtr<Glib::MainLoop> loop_ = Glib::MainLoop::create();
  sysdmon::util::UnixSignalHandler signals_;
  sysdmon::Config config_;
  std::unique_ptr<sysdmon::DesktopNotifier> notifier_;
  std::unique_ptr<sysdmon::FailureWatcher> watcher_;
  std::unique_ptr<sysdmon::systemd::Manager> manager_;
  std::unique_ptr<sysdmon::systemd::Subscription> subscription_;
  int exit_code_ = 0;
};

}  // namespace

int main(int argc, char *argv[]) {
  spdlog::set_default_logger(spdlog::stderr_color_mt("sysdmon-watch"));
  sysdmon::util::logToJournalIfRunAsService("sysdmon-watch");

  const std::string program = argc > 0 ? argv[0] : "sysdmon-watch";

  sysdmon::WatchOptions options;
  try {
    options = sysdmon::parseWatchOptions(argc, argv);
  } catch (const sysdmon::UsageError &e) {
    spdlog::error("{}", e.what());
    std::cerr << sysdmon::watchUsage(program);
    return EXIT_USAGE;
  }

  if (options.show_help) {
    std::cout << sysdmon::watchUsage(program);
    return 0;
  }

  if (!options.log_level.empty()) {
    try {
      sysdmon::util::setLogLevel(options.log_level);
    } catch (const std::invalid_argument &e) {
      spdlog::error("{}", e.what());
      return EXIT_USAGE;
    }
  }

  Gio::init();

  try {
    Watch watch(options);
    return watch.run();
  } catch (const sysdmon::ConfigError &e) {
    spdlog::error("{}", e.what());
    return EXIT_USAGE;
  } catch (const std::exception &e) {
    spdlog::error("{}", e.what());
    return EXIT_FAILURE_RUNTIME;
  } catch (const Glib::Exception &e) {
    spdlog::error("{}", static_cast<std::string>(e.what()));
    return EXIT_FAILURE_RUNTIME;
  }
}
