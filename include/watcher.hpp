#pragma once

#include <map>
#include <regex>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "interfaces/INotifier.hpp"
#include "unit.hpp"

namespace sysdmon {

enum class FailState { UNKNOWN, OK, FAILED };

const char *toString(FailState state);

/*
 * Edge trigger: notify on ok -> failed and unknown -> failed only.
 * failed -> failed is the same incident, failed -> ok re-arms silently.
 */
bool shouldNotify(FailState prior, FailState next);

/* "active/sub" with '*' matching anything on either side. */
struct StatePattern {
  std::string active;
  std::string sub;

  /* Throws ConfigError */
  static StatePattern parse(const std::string &pattern);

  bool matches(const std::string &active_state, const std::string &sub_state) const;
};

/*
 * Which (active, sub) combinations count as failed, per unit type.
 * The "*" entry applies to types without an entry of their own.
 */
class FailurePredicate {
 public:
  using Table = std::map<std::string, std::vector<StatePattern>>;

  FailurePredicate();
  explicit FailurePredicate(Table table);

  FailState classify(const std::string &unit_name, const std::string &active_state,
                     const std::string &sub_state) const;

  const Table &table() const { return table_; }

 private:
  Table table_;
};

/* Units which never raise a notification, by exact name or by full-match regex. */
class IgnoreList {
 public:
  IgnoreList() = default;

  void addName(const std::string &name) { names_.insert(name); }
  /* Throws ConfigError on a malformed expression */
  void addRegex(const std::string &expression);

  bool contains(const std::string &unit_name) const;
  size_t size() const { return names_.size() + regexes_.size(); }

 private:
  std::set<std::string> names_;
  std::vector<std::regex> regexes_;
};

struct WatcherSettings {
  FailurePredicate predicate;
  IgnoreList ignore;
  std::string summary = "Unit failed";
};

/* Last observed state of one unit. */
struct WatchEntry {
  FailState state = FailState::UNKNOWN;
  std::string active_state;
  std::string sub_state;
};

class FailureWatcher {
 public:
  FailureWatcher(INotifier &notifier, WatcherSettings settings);

  /*
   * Record the new state of a unit and notify if it just entered the failed state.
   * Returns true when a notification was attempted. Notification errors are logged only.
   */
  bool handleChange(const UnitStateChange &change);

  /* Swap ignore list and predicates, known unit states are kept. */
  void reconfigure(WatcherSettings settings);

  const std::unordered_map<std::string, WatchEntry> &entries() const { return entries_; }

 private:
  std::string describe(const UnitStateChange &change) const;

  INotifier &notifier_;
  WatcherSettings settings_;
  std::unordered_map<std::string, WatchEntry> entries_;
};

}  // namespace sysdmon
