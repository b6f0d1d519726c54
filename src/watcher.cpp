#include "watcher.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <utility>

#include "errors.hpp"
#include "util/string.hpp"

namespace sysdmon {

namespace {

const std::string ANY = "*";

bool matchesPart(const std::string &pattern, const std::string &value) {
  return pattern == ANY || pattern == value;
}

}  // namespace

const char *toString(FailState state) {
  switch (state) {
    case FailState::OK:
      return "ok";
    case FailState::FAILED:
      return "failed";
    case FailState::UNKNOWN:
      break;
  }
  return "unknown";
}

bool shouldNotify(FailState prior, FailState next) {
  return next == FailState::FAILED && prior != FailState::FAILED;
}

StatePattern StatePattern::parse(const std::string &pattern) {
  auto parts = util::split(pattern, "/");
  if (parts.size() != 2) {
    throw ConfigError(fmt::format("Invalid state pattern '{}', expected <active>/<sub>", pattern));
  }
  StatePattern result{util::trim(parts[0]), util::trim(parts[1])};
  if (result.active.empty() || result.sub.empty()) {
    throw ConfigError(fmt::format("Invalid state pattern '{}', use '*' for any state", pattern));
  }
  return result;
}

bool StatePattern::matches(const std::string &active_state, const std::string &sub_state) const {
  return matchesPart(active, active_state) && matchesPart(sub, sub_state);
}

FailurePredicate::FailurePredicate()
    : table_{{ANY, {StatePattern{"failed", ANY}, StatePattern{"active", "failed"}}}} {}

FailurePredicate::FailurePredicate(Table table) : table_(std::move(table)) {}

FailState FailurePredicate::classify(const std::string &unit_name,
                                     const std::string &active_state,
                                     const std::string &sub_state) const {
  auto rules = table_.find(util::suffix(unit_name));
  if (rules == table_.end()) {
    rules = table_.find(ANY);
  }
  if (rules == table_.end()) {
    return FailState::OK;
  }
  for (const auto &pattern : rules->second) {
    if (pattern.matches(active_state, sub_state)) {
      return FailState::FAILED;
    }
  }
  return FailState::OK;
}

void IgnoreList::addRegex(const std::string &expression) {
  try {
    regexes_.emplace_back(expression);
  } catch (const std::regex_error &e) {
    throw ConfigError(fmt::format("Invalid ignore regex '{}': {}", expression, e.what()));
  }
}

bool IgnoreList::contains(const std::string &unit_name) const {
  if (names_.count(unit_name) > 0) return true;
  for (const auto &regex : regexes_) {
    if (std::regex_match(unit_name, regex)) return true;
  }
  return false;
}

FailureWatcher::FailureWatcher(INotifier &notifier, WatcherSettings settings)
    : notifier_(notifier), settings_(std::move(settings)) {}

void FailureWatcher::reconfigure(WatcherSettings settings) {
  settings_ = std::move(settings);
  spdlog::info("Watcher reconfigured, {} ignore rules", settings_.ignore.size());
}

std::string FailureWatcher::describe(const UnitStateChange &change) const {
  auto msg = fmt::format("{} becomes {}", change.unit_name, change.active_state);
  if (change.sub_state != change.active_state) {
    msg += fmt::format(" ({})", change.sub_state);
  }
  return msg;
}

bool FailureWatcher::handleChange(const UnitStateChange &change) {
  auto next =
      settings_.predicate.classify(change.unit_name, change.active_state, change.sub_state);

  auto &entry = entries_[change.unit_name];
  auto prior = entry.state;
  entry.state = next;
  entry.active_state = change.active_state;
  entry.sub_state = change.sub_state;

  if (!shouldNotify(prior, next)) {
    spdlog::debug("{}: {} -> {}", describe(change), toString(prior), toString(next));
    return false;
  }

  auto msg = describe(change);
  if (settings_.ignore.contains(change.unit_name)) {
    spdlog::info("Ignoring: {}", msg);
    return false;
  }

  spdlog::info("{}", msg);
  try {
    notifier_.notify(settings_.summary, msg, change.unit_name);
  } catch (const NotifyError &e) {
    spdlog::warn("Failed to notify about {}: {}", change.unit_name, e.what());
  }
  return true;
}

}  // namespace sysdmon
