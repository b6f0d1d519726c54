#include "cli.hpp"

#include <clara.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <utility>
#include <vector>

#include "errors.hpp"

namespace sysdmon {

namespace {

using FilterArgs = std::vector<std::pair<std::string, std::string>>;

const char *LOG_LEVELS = "trace|debug|info|warning|error|critical|off";

clara::detail::Opt filterOpt(FilterArgs &filter_args, const std::string &flag,
                             const std::string &hint, const std::string &description) {
  return clara::detail::Opt(
      [&filter_args, flag](const std::string &value) { filter_args.emplace_back(flag, value); },
      hint)["--" + flag](description);
}

clara::detail::Parser listParser(ListOptions &options, FilterArgs &filter_args,
                                 std::string &sort_by) {
  return clara::detail::Help(options.show_help) |
         clara::detail::Opt(options.user)["--user"]("Show session units") |
         clara::detail::Opt(options.desc_file)["--desc-file"]("Show unit description and file") |
         clara::detail::Opt(sort_by, "SORT_KEY")["--sort-by"]("Sort column") |
         filterOpt(filter_args, "type", "TYPE", "Types") |
         filterOpt(filter_args, "loaded", "LOADED", "Loaded states") |
         filterOpt(filter_args, "active", "ACTIVE", "Active states") |
         filterOpt(filter_args, "sub-active", "SUB_ACTIVE", "Sub-active states") |
         filterOpt(filter_args, "file-state", "STATE", "File states") |
         filterOpt(filter_args, "file-preset", "PRESET", "File presets") |
         clara::detail::Opt(options.log_level, LOG_LEVELS)["-l"]["--log-level"]("Log level");
}

clara::detail::Parser watchParser(WatchOptions &options) {
  return clara::detail::Help(options.show_help) |
         clara::detail::Opt(options.user)["--user"]("Watch session units") |
         clara::detail::Opt(options.config, "config")["-c"]["--config"]("Config path") |
         clara::detail::Opt(options.log_level, LOG_LEVELS)["-l"]["--log-level"]("Log level");
}

std::string renderUsage(const std::string &program, const clara::detail::Parser &parser) {
  auto out = fmt::format("\nUsage:\n\t{} [OPTIONS]\n\nOptions:\n", program);
  for (const auto &column : parser.getHelpColumns()) {
    out += fmt::format("\t{:<36}{}\n", column.left, column.right);
  }
  return out;
}

template <typename EnumType>
std::string names() {
  std::vector<std::string> keys;
  for (const auto &[name, value] : stateNames<EnumType>()) {
    keys.push_back(name);
  }
  return fmt::format("{}", fmt::join(keys, ", "));
}

void throwIfFailed(const clara::detail::InternalParseResult &result) {
  if (!result) {
    throw UsageError(result.errorMessage());
  }
}

}  // namespace

ListOptions parseListOptions(int argc, const char *const *argv) {
  ListOptions options;
  FilterArgs filter_args;
  std::string sort_by;

  auto cli = listParser(options, filter_args, sort_by);
  throwIfFailed(cli.parse(clara::detail::Args(argc, argv)));
  if (options.show_help) {
    return options;
  }

  if (!sort_by.empty()) {
    options.sort_key = parseSortKey(sort_by);
  }
  for (const auto &[flag, value] : filter_args) {
    options.filters.set(flag, value);
  }
  return options;
}

WatchOptions parseWatchOptions(int argc, const char *const *argv) {
  WatchOptions options;
  auto cli = watchParser(options);
  throwIfFailed(cli.parse(clara::detail::Args(argc, argv)));
  return options;
}

std::string listUsage(const std::string &program) {
  ListOptions options;
  FilterArgs filter_args;
  std::string sort_by;
  auto out = renderUsage(program, listParser(options, filter_args, sort_by));

  std::vector<std::string> sort_keys;
  for (const auto &[name, key] : sortKeyNames()) {
    if (key != SortKey::NONE) sort_keys.push_back(name);
  }

  auto section = [&out](const std::string &name, const std::string &values) {
    out += fmt::format("\n\t{}:\n\t\t{}\n", name, values);
  };
  section("SORT_KEY", fmt::format("{}", fmt::join(sort_keys, ", ")));
  out += "\n\tAll filters are comma-separated lists.\n";
  section("TYPE", "all, " + names<UnitType>());
  section("LOADED", names<LoadState>());
  section("ACTIVE", names<ActiveState>());
  section("SUB_ACTIVE",
          "abandoned, active, dead, exited, failed, listening, mounted, plugged, running, "
          "waiting, ... (not checked, depends on the unit type)");
  section("STATE", names<UnitFileState>());
  section("PRESET", names<UnitFilePreset>());
  return out + "\n";
}

std::string watchUsage(const std::string &program) {
  WatchOptions options;
  auto out = renderUsage(program, watchParser(options));
  out += "\n\tSIGUSR1 reloads the configuration, SIGINT, SIGTERM, SIGHUP and SIGQUIT exit.\n\n";
  return out;
}

}  // namespace sysdmon
