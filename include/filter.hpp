#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>

#include "unit.hpp"

namespace sysdmon {

enum class SortKey { NONE, LOADED, ACTIVE, SUB, FILE_STATE, FILE_PRESET };

/*
 * Allowed values per field, compared against the manager's string.
 * An empty set doesn't filter that field.
 */
struct FilterSpec {
  // Set by `--type=all`, overrides `types`
  bool all_types = false;
  std::set<std::string> types;
  std::set<std::string> loaded;
  std::set<std::string> active;
  std::set<std::string> sub;
  std::set<std::string> file_state;
  std::set<std::string> file_preset;

  /*
   * Parse a comma-separated list given to the CLI flag `flag` (without leading dashes) and
   * store it in the matching field. Throws InvalidFilterValue on a value outside the field's
   * known set; sub states are not checked since the manager defines them per unit type.
   */
  void set(const std::string &flag, const std::string &csv);
};

const std::map<std::string, SortKey> &sortKeyNames();
SortKey parseSortKey(const std::string &name);

/* String representation of the field `key` sorts by, empty for an absent field. */
const std::string &sortValue(const Unit &unit, SortKey key);

/*
 * The filters answerable from the ListUnits reply alone (type, load, active and sub state).
 * Units failing these don't need their file state read at all.
 */
bool matchesListed(const Unit &unit, const FilterSpec &filters);

bool matches(const Unit &unit, const FilterSpec &filters);

std::vector<Unit> select(const std::vector<Unit> &units, const FilterSpec &filters, SortKey key);

}  // namespace sysdmon
