#pragma once

#include <string>

#include "filter.hpp"

namespace sysdmon {

struct ListOptions {
  bool show_help = false;
  bool user = false;
  bool desc_file = false;
  SortKey sort_key = SortKey::NONE;
  FilterSpec filters;
  std::string log_level;
};

struct WatchOptions {
  bool show_help = false;
  bool user = false;
  std::string config;
  std::string log_level;
};

/* Throws UsageError for a malformed command line, InvalidFilterValue for a bad flag value */
ListOptions parseListOptions(int argc, const char *const *argv);
WatchOptions parseWatchOptions(int argc, const char *const *argv);

std::string listUsage(const std::string &program);
std::string watchUsage(const std::string &program);

}  // namespace sysdmon
