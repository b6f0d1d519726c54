#include "systemd/bus_label.hpp"

#if __has_include(<catch2/catch_test_macros.hpp>)
#include <catch2/catch_test_macros.hpp>
#else
#include <catch2/catch.hpp>
#endif

using namespace sysdmon::systemd;

TEST_CASE("Escape unit names for object paths", "[bus_label]") {
  REQUIRE(escapeBusLabel("nginx.service") == "nginx_2eservice");
  REQUIRE(escapeBusLabel("user@1000.service") == "user_401000_2eservice");
  REQUIRE(escapeBusLabel("dev-sda.device") == "dev_2dsda_2edevice");
  REQUIRE(escapeBusLabel("1password.service") == "_31password_2eservice");
  REQUIRE(escapeBusLabel("") == "_");
}

TEST_CASE("Unescape object path labels", "[bus_label]") {
  REQUIRE(unescapeBusLabel("nginx_2eservice") == "nginx.service");
  REQUIRE(unescapeBusLabel("_31password_2eservice") == "1password.service");
  REQUIRE(unescapeBusLabel("_") == "");
  // Not a valid escape, kept as is
  REQUIRE(unescapeBusLabel("a_zz") == "a_zz");
}

TEST_CASE("Unit object paths", "[bus_label]") {
  REQUIRE(unitObjectPath("cron.service") == "/org/freedesktop/systemd1/unit/cron_2eservice");

  SECTION("round trip through the path") {
    auto name = "systemd-fsck@dev-disk-by\\x2duuid-12.service";
    REQUIRE(unitNameFromPath(unitObjectPath(name)) == std::optional<std::string>(name));
  }
  SECTION("paths outside the unit tree") {
    REQUIRE_FALSE(unitNameFromPath("/org/freedesktop/systemd1").has_value());
    REQUIRE_FALSE(unitNameFromPath("/org/freedesktop/systemd1/unit/").has_value());
    REQUIRE_FALSE(unitNameFromPath("/org/freedesktop/systemd1/job/42").has_value());
  }
}
