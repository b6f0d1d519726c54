#include <giomm/init.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <unistd.h>

#include <algorithm>
#include <iostream>
#include <iterator>

#include "cli.hpp"
#include "errors.hpp"
#include "filter.hpp"
#include "systemd/manager.hpp"
#include "table.hpp"
#include "util/logging.hpp"

namespace {

const int EXIT_BUS_ERROR = 1;
const int EXIT_USAGE = 2;

int run(const sysdmon::ListOptions &options) {
  using sysdmon::systemd::BusScope;

  sysdmon::systemd::Manager manager(options.user ? BusScope::USER : BusScope::SYSTEM);
  // File state is one round trip per unit, skip it for units already filtered out
  auto records = manager.listUnits(options.desc_file, [&options](const auto &record) {
    return sysdmon::matchesListed(sysdmon::normalize(record), options.filters);
  });

  std::vector<sysdmon::Unit> units;
  units.reserve(records.size());
  std::transform(records.begin(), records.end(), std::back_inserter(units), sysdmon::normalize);

  auto shown = sysdmon::select(units, options.filters, options.sort_key);

  std::cout << sysdmon::renderTable(shown, {options.desc_file});
  std::cout.flush();
  std::cerr << sysdmon::renderSummary(units, shown, isatty(STDERR_FILENO) != 0);
  return 0;
}

}  // namespace

int main(int argc, char *argv[]) {
  // Standard output carries the table only
  spdlog::set_default_logger(spdlog::stderr_color_mt("sysdmon-list"));

  const std::string program = argc > 0 ? argv[0] : "sysdmon-list";

  sysdmon::ListOptions options;
  try {
    options = sysdmon::parseListOptions(argc, argv);
  } catch (const sysdmon::InvalidFilterValue &e) {
    spdlog::error("{}", e.what());
    std::cerr << sysdmon::listUsage(program);
    return EXIT_USAGE;
  } catch (const sysdmon::UsageError &e) {
    spdlog::error("{}", e.what());
    std::cerr << sysdmon::listUsage(program);
    return EXIT_USAGE;
  }

  if (options.show_help) {
    std::cout << sysdmon::listUsage(program);
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
    return run(options);
  } catch (const sysdmon::PermissionError &e) {
    spdlog::error("{}", e.what());
    return EXIT_BUS_ERROR;
  } catch (const sysdmon::ConnectionError &e) {
    spdlog::error("{}", e.what());
    return EXIT_BUS_ERROR;
  } catch (const Glib::Exception &e) {
    spdlog::error("{}", static_cast<std::string>(e.what()));
    return EXIT_BUS_ERROR;
  }
}
