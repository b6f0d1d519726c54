#include "table.hpp"

#if __has_include(<catch2/catch_test_macros.hpp>)
#include <catch2/catch_test_macros.hpp>
#else
#include <catch2/catch.hpp>
#endif

#include <sstream>

#include "util/string.hpp"

using namespace sysdmon;

namespace {

Unit makeUnit(const std::string& name, const std::string& active, const std::string& sub,
              const std::string& file_state = "") {
  RawUnitRecord raw;
  raw.name = name;
  raw.description = "Unit " + name;
  raw.load_state = "loaded";
  raw.active_state = active;
  raw.sub_state = sub;
  raw.unit_file_state = file_state;
  raw.fragment_path = file_state.empty() ? "" : "/usr/lib/systemd/system/" + name;
  return normalize(raw);
}

std::vector<std::string> lines(const std::string& text) {
  std::vector<std::string> result;
  std::istringstream stream(text);
  for (std::string line; std::getline(stream, line);) result.push_back(line);
  return result;
}

}  // namespace

TEST_CASE("Display helpers", "[table]") {
  REQUIRE(displayName("dev-disk-by\\x2duuid-abcd.swap") == "dev-disk-by-uuid-abcd.swap");
  REQUIRE(displayName("nginx.service") == "nginx.service");
  REQUIRE(displayWidth("running") == 7);
  REQUIRE(displayWidth("日本") == 4);
  REQUIRE(displayWidth("") == 0);
}

TEST_CASE("Render unit table", "[table]") {
  std::vector<Unit> units = {
      makeUnit("nginx.service", "active", "running", "enabled"),
      makeUnit("systemd-journald-dev\\x2dlog.socket", "active", "running", "static"),
      makeUnit("dev-sda.device", "active", "plugged"),
  };

  SECTION("header and one line per unit") {
    auto out = lines(renderTable(units, {}));
    REQUIRE(out.size() == 4);
    REQUIRE(out[0].rfind("Name", 0) == 0);
    REQUIRE(out[1].rfind("nginx.service", 0) == 0);
    REQUIRE(out[2].rfind("systemd-journald-dev-log.socket", 0) == 0);
  }
  SECTION("columns are aligned") {
    auto out = lines(renderTable(units, {}));
    auto loaded = out[0].find("Loaded");
    auto active = out[0].find("Active");
    auto sub = out[0].find("SubActive");
    auto file_state = out[0].find("FileState");
    for (size_t i = 1; i < out.size(); i++) {
      REQUIRE(out[i].find("loaded") == loaded);
      REQUIRE(out[i].find("active") == active);
      REQUIRE(out[i].find_first_not_of(' ', active + 6) == sub);
    }
    REQUIRE(out[1].find("enabled") == file_state);
    REQUIRE(out[2].find("static") == file_state);
  }
  SECTION("widths follow the result set") {
    auto narrow = lines(renderTable({units[0]}, {}));
    auto wide = lines(renderTable(units, {}));
    REQUIRE(narrow[0].find("Loaded") < wide[0].find("Loaded"));
    REQUIRE(narrow[0].find("Loaded") == std::string("nginx.service").size() + 3);
  }
  SECTION("no trailing blanks") {
    for (const auto& line : lines(renderTable(units, {}))) {
      REQUIRE(line == util::rtrim(line));
    }
  }
  SECTION("description and file columns") {
    auto out = lines(renderTable(units, {true}));
    REQUIRE(out[0].find("Description") != std::string::npos);
    REQUIRE(out[0].find("File") != std::string::npos);
    REQUIRE(out[1].find("Unit nginx.service") != std::string::npos);
    REQUIRE(out[1].find("/usr/lib/systemd/system/nginx.service") != std::string::npos);
  }
  SECTION("empty result still has a header") {
    auto out = lines(renderTable({}, {}));
    REQUIRE(out.size() == 1);
    REQUIRE(out[0] == "Name   Loaded   Active   SubActive   FileState   FilePreset");
  }
}

TEST_CASE("Render summary", "[table]") {
  std::vector<Unit> all = {
      makeUnit("nginx.service", "active", "running", "enabled"),
      makeUnit("cron.service", "failed", "failed", "enabled"),
      makeUnit("fstrim.timer", "inactive", "dead", "enabled"),
  };

  SECTION("all units listed") {
    auto out = renderSummary(all, all, false);
    REQUIRE(out.find("SERVICES: 2\n") != std::string::npos);
    REQUIRE(out.find("TIMERS: 1\n") != std::string::npos);
    REQUIRE(out.find("Active: active: 1, failed: 1\n") != std::string::npos);
    REQUIRE(out.find("FileState: enabled: 2\n") != std::string::npos);
  }
  SECTION("filtered units") {
    auto out = renderSummary(all, {all[1]}, false);
    REQUIRE(out.find("SERVICES: 1 / 2\n") != std::string::npos);
    REQUIRE(out.find("TIMERS") == std::string::npos);
  }
  SECTION("nothing listed") { REQUIRE(renderSummary(all, {}, false).empty()); }
}
