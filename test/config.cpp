#include "config.hpp"

#if __has_include(<catch2/catch_test_macros.hpp>)
#include <catch2/catch_test_macros.hpp>
#else
#include <catch2/catch.hpp>
#endif

#include <filesystem>
#include <fstream>

#include "errors.hpp"

using sysdmon::Config;
using sysdmon::ConfigError;
using sysdmon::FailState;
using sysdmon::Urgency;

TEST_CASE("Load full config", "[config]") {
  Config conf;
  conf.load("test/config/full.json");
  REQUIRE(conf.path() == "test/config/full.json");

  SECTION("validate the config data") {
    auto& data = conf.getConfig();
    REQUIRE(data["ignore"].size() == 2);
    REQUIRE(data["notification"]["icon"].asString() == "dialog-error");
  }
  SECTION("watcher settings") {
    auto settings = conf.watcherSettings();
    REQUIRE(settings.summary == "Unit down");
    REQUIRE(settings.ignore.size() == 3);
    REQUIRE(settings.ignore.contains("flaky.service"));
    REQUIRE(settings.ignore.contains("systemd-coredump@1-1234-0.service"));
    REQUIRE_FALSE(settings.ignore.contains("nginx.service"));

    const auto& predicate = settings.predicate;
    REQUIRE(predicate.table().count("*") == 1);
    REQUIRE(predicate.classify("home.mount", "inactive", "failed") == FailState::FAILED);
    REQUIRE(predicate.classify("backup.timer", "active", "failed") == FailState::OK);
    // Types without an entry fall back to the defaults
    REQUIRE(predicate.classify("nginx.service", "active", "failed") == FailState::FAILED);
  }
  SECTION("notification settings") {
    auto settings = conf.notificationSettings();
    REQUIRE(settings.app_name == "watcher-test");
    REQUIRE(settings.icon == "dialog-error");
    REQUIRE(settings.urgency == Urgency::NORMAL);
    REQUIRE(settings.expire_timeout == 10000);
    REQUIRE(settings.call_timeout == 1000);
  }
}

TEST_CASE("Defaults without a config", "[config]") {
  Config conf;

  auto watcher = conf.watcherSettings();
  REQUIRE(watcher.summary == "Unit failed");
  REQUIRE(watcher.ignore.size() == 0);
  REQUIRE(watcher.predicate.classify("a.service", "failed", "failed") == FailState::FAILED);

  auto notification = conf.notificationSettings();
  REQUIRE(notification.urgency == Urgency::CRITICAL);
  REQUIRE(notification.expire_timeout == 0);
}

TEST_CASE("Reject invalid configs", "[config]") {
  Config conf;

  SECTION("missing file") {
    REQUIRE_THROWS_AS(conf.load("test/config/missing.json"), ConfigError);
  }
  SECTION("malformed json") {
    REQUIRE_THROWS_AS(conf.load("test/config/malformed.json"), ConfigError);
  }
  SECTION("not an object") {
    REQUIRE_THROWS_AS(conf.load("test/config/not-object.json"), ConfigError);
  }
  SECTION("values of the wrong type") {
    conf.load("test/config/bad-types.json");
    REQUIRE_THROWS_AS(conf.watcherSettings(), ConfigError);
    REQUIRE_THROWS_AS(conf.notificationSettings(), ConfigError);
  }
  SECTION("unknown urgency") {
    conf.load("test/config/bad-urgency.json");
    REQUIRE_THROWS_AS(conf.notificationSettings(), ConfigError);
  }
  SECTION("bad state pattern") {
    conf.load("test/config/bad-pattern.json");
    REQUIRE_THROWS_AS(conf.watcherSettings(), ConfigError);
  }
}

TEST_CASE("Find config path", "[config]") {
  SECTION("first matching directory wins") {
    auto path = Config::findConfigPath({"full.json"}, {"test/missing/", "test/config/"});
    REQUIRE(path.has_value());
    REQUIRE(path.value() == "test/config/full.json");
  }
  SECTION("nothing found") {
    REQUIRE_FALSE(Config::findConfigPath({"nope.json"}, {"test/config/"}).has_value());
  }
}

TEST_CASE("Reload config", "[config]") {
  namespace fs = std::filesystem;
  auto dir = fs::temp_directory_path() / "sysdmon-config-test";
  fs::create_directories(dir);
  auto file = dir / "watcher.json";

  std::ofstream(file) << R"({"ignore": ["a.service"]})";
  Config conf;
  conf.load(file.string());
  REQUIRE(conf.watcherSettings().ignore.contains("a.service"));

  SECTION("new content is picked up") {
    std::ofstream(file) << R"({"ignore": ["b.service"]})";
    conf.reload();
    auto settings = conf.watcherSettings();
    REQUIRE(settings.ignore.contains("b.service"));
    REQUIRE_FALSE(settings.ignore.contains("a.service"));
  }
  SECTION("a broken file keeps the previous config") {
    std::ofstream(file) << "{";
    REQUIRE_THROWS_AS(conf.reload(), ConfigError);
    REQUIRE(conf.watcherSettings().ignore.contains("a.service"));
  }

  fs::remove_all(dir);
}
