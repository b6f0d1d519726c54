#include "watcher.hpp"

#if __has_include(<catch2/catch_test_macros.hpp>)
#include <catch2/catch_test_macros.hpp>
#else
#include <catch2/catch.hpp>
#endif

#include <utility>
#include <vector>

#include "errors.hpp"

using namespace sysdmon;

namespace {

struct Notification {
  std::string title;
  std::string body;
  std::string tag;
};

class RecordingNotifier : public INotifier {
 public:
  auto notify(const std::string& title, const std::string& body, const std::string& tag)
      -> void override {
    sent.push_back({title, body, tag});
    if (fail) throw NotifyError("notification daemon is gone");
  }

  std::vector<Notification> sent;
  bool fail = false;
};

UnitStateChange change(const std::string& unit, const std::string& active,
                       const std::string& sub) {
  return {unit, "", active, sub};
}

const UnitStateChange OK = change("nginx.service", "active", "running");
const UnitStateChange FAILED = change("nginx.service", "failed", "failed");

}  // namespace

TEST_CASE("Edge trigger", "[watcher]") {
  REQUIRE(shouldNotify(FailState::UNKNOWN, FailState::FAILED));
  REQUIRE(shouldNotify(FailState::OK, FailState::FAILED));
  REQUIRE_FALSE(shouldNotify(FailState::FAILED, FailState::FAILED));
  REQUIRE_FALSE(shouldNotify(FailState::FAILED, FailState::OK));
  REQUIRE_FALSE(shouldNotify(FailState::UNKNOWN, FailState::OK));
  REQUIRE_FALSE(shouldNotify(FailState::OK, FailState::OK));
}

TEST_CASE("State patterns", "[watcher]") {
  auto pattern = StatePattern::parse("active/failed");
  REQUIRE(pattern.matches("active", "failed"));
  REQUIRE_FALSE(pattern.matches("active", "running"));
  REQUIRE(StatePattern::parse(" failed / * ").matches("failed", "auto-restart"));

  REQUIRE_THROWS_AS(StatePattern::parse("failed"), ConfigError);
  REQUIRE_THROWS_AS(StatePattern::parse("a/b/c"), ConfigError);
  REQUIRE_THROWS_AS(StatePattern::parse("/failed"), ConfigError);
}

TEST_CASE("Failure predicate", "[watcher]") {
  SECTION("default table") {
    FailurePredicate predicate;
    REQUIRE(predicate.classify("a.service", "failed", "failed") == FailState::FAILED);
    REQUIRE(predicate.classify("a.mount", "active", "failed") == FailState::FAILED);
    REQUIRE(predicate.classify("a.service", "active", "running") == FailState::OK);
    REQUIRE(predicate.classify("a.service", "inactive", "dead") == FailState::OK);
    REQUIRE(predicate.classify("a.service", "activating", "auto-restart") == FailState::OK);
  }
  SECTION("per type entries override the fallback") {
    FailurePredicate::Table table = {{"*", {StatePattern::parse("failed/*")}},
                                     {"timer", {StatePattern::parse("inactive/elapsed")}}};
    FailurePredicate predicate(table);
    REQUIRE(predicate.classify("backup.timer", "inactive", "elapsed") == FailState::FAILED);
    REQUIRE(predicate.classify("backup.timer", "failed", "failed") == FailState::OK);
    REQUIRE(predicate.classify("backup.service", "failed", "failed") == FailState::FAILED);
  }
  SECTION("no fallback") {
    FailurePredicate::Table table = {{"service", {StatePattern::parse("failed/*")}}};
    FailurePredicate predicate(table);
    REQUIRE(predicate.classify("a.socket", "failed", "failed") == FailState::OK);
  }
}

TEST_CASE("Ignore list", "[watcher]") {
  IgnoreList ignore;
  ignore.addName("flaky.service");
  ignore.addRegex("user@[0-9]+\\.service");

  REQUIRE(ignore.size() == 2);
  REQUIRE(ignore.contains("flaky.service"));
  REQUIRE(ignore.contains("user@1000.service"));
  REQUIRE_FALSE(ignore.contains("user@1000.service.wants"));
  REQUIRE_FALSE(ignore.contains("nginx.service"));
  REQUIRE_THROWS_AS(ignore.addRegex("("), ConfigError);
}

TEST_CASE("Failure watcher", "[watcher]") {
  RecordingNotifier notifier;
  FailureWatcher watcher(notifier, WatcherSettings{});

  SECTION("a unit entering the failed state is reported once") {
    REQUIRE_FALSE(watcher.handleChange(OK));
    REQUIRE(watcher.handleChange(FAILED));
    REQUIRE(notifier.sent.size() == 1);
    REQUIRE(notifier.sent[0].title == "Unit failed");
    REQUIRE(notifier.sent[0].body.find("nginx.service") != std::string::npos);
    REQUIRE(notifier.sent[0].tag == "nginx.service");
  }
  SECTION("repeated failure signals") {
    watcher.handleChange(OK);
    watcher.handleChange(FAILED);
    watcher.handleChange(FAILED);
    watcher.handleChange(FAILED);
    REQUIRE(notifier.sent.size() == 1);
  }
  SECTION("recovery re-arms") {
    watcher.handleChange(OK);
    watcher.handleChange(FAILED);
    watcher.handleChange(OK);
    watcher.handleChange(FAILED);
    REQUIRE(notifier.sent.size() == 2);
  }
  SECTION("first sight of an already failed unit") {
    REQUIRE(watcher.handleChange(FAILED));
    REQUIRE(notifier.sent.size() == 1);
    REQUIRE(watcher.entries().at("nginx.service").state == FailState::FAILED);
  }
  SECTION("units are tracked independently") {
    watcher.handleChange(FAILED);
    watcher.handleChange(change("cron.service", "failed", "failed"));
    watcher.handleChange(FAILED);
    REQUIRE(notifier.sent.size() == 2);
    REQUIRE(watcher.entries().size() == 2);
  }
  SECTION("notification errors don't stop the watcher") {
    notifier.fail = true;
    REQUIRE(watcher.handleChange(FAILED));
    notifier.fail = false;
    watcher.handleChange(OK);
    REQUIRE(watcher.handleChange(FAILED));
    REQUIRE(notifier.sent.size() == 2);
  }
  SECTION("last state is recorded") {
    watcher.handleChange(change("nginx.service", "activating", "start"));
    const auto& entry = watcher.entries().at("nginx.service");
    REQUIRE(entry.state == FailState::OK);
    REQUIRE(entry.active_state == "activating");
    REQUIRE(entry.sub_state == "start");
  }
}

TEST_CASE("Failure watcher settings", "[watcher]") {
  RecordingNotifier notifier;
  WatcherSettings settings;
  settings.ignore.addName("nginx.service");
  settings.summary = "Service down";
  FailureWatcher watcher(notifier, std::move(settings));

  SECTION("ignored units stay silent but are tracked") {
    REQUIRE_FALSE(watcher.handleChange(FAILED));
    REQUIRE(notifier.sent.empty());
    REQUIRE(watcher.entries().at("nginx.service").state == FailState::FAILED);
  }
  SECTION("custom summary") {
    watcher.handleChange(change("cron.service", "failed", "failed"));
    REQUIRE(notifier.sent.size() == 1);
    REQUIRE(notifier.sent[0].title == "Service down");
  }
  SECTION("reconfigure keeps known states") {
    watcher.handleChange(FAILED);
    watcher.reconfigure(WatcherSettings{});
    // Still the same incident
    REQUIRE_FALSE(watcher.handleChange(FAILED));
    watcher.handleChange(OK);
    REQUIRE(watcher.handleChange(FAILED));
    REQUIRE(notifier.sent.size() == 1);
  }
}
