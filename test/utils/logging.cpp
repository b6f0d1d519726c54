#include "util/logging.hpp"

#if __has_include(<catch2/catch_test_macros.hpp>)
#include <catch2/catch_test_macros.hpp>
#else
#include <catch2/catch.hpp>
#endif

#include <spdlog/spdlog.h>

#include <stdexcept>

using sysdmon::util::parseJournalStream;

TEST_CASE("Parse JOURNAL_STREAM", "[util][logging]") {
  SECTION("device and inode") {
    auto stream = parseJournalStream("8:1234");
    REQUIRE(stream.has_value());
    REQUIRE(stream->first == 8);
    REQUIRE(stream->second == 1234);
  }
  SECTION("missing separator") {
    REQUIRE_FALSE(parseJournalStream("8").has_value());
    REQUIRE_FALSE(parseJournalStream("8;1234").has_value());
  }
  SECTION("missing numbers") {
    REQUIRE_FALSE(parseJournalStream("").has_value());
    REQUIRE_FALSE(parseJournalStream("8:").has_value());
    REQUIRE_FALSE(parseJournalStream(":1234").has_value());
    REQUIRE_FALSE(parseJournalStream("a:b").has_value());
  }
  SECTION("trailing garbage") {
    REQUIRE_FALSE(parseJournalStream("8:12x").has_value());
    REQUIRE_FALSE(parseJournalStream("8:12:3").has_value());
  }
}

TEST_CASE("Set the log level by name", "[util][logging]") {
  auto previous = spdlog::get_level();
  sysdmon::util::setLogLevel("warn");
  REQUIRE(spdlog::get_level() == spdlog::level::warn);
  REQUIRE_THROWS_AS(sysdmon::util::setLogLevel("loud"), std::invalid_argument);
  REQUIRE(spdlog::get_level() == spdlog::level::warn);
  spdlog::set_level(previous);
}
