#include "filter.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <stdexcept>

#include "errors.hpp"
#include "util/enum.hpp"
#include "util/string.hpp"

namespace sysdmon {

namespace {

const std::string EMPTY;

template <typename EnumType>
std::set<std::string> parseEnumValues(const std::string &flag,
                                      const std::vector<std::string> &values) {
  std::set<std::string> result;
  util::EnumParser<EnumType> parser(stateNames<EnumType>());
  for (const auto &value : values) {
    if (!parser.tryParse(value)) {
      throw InvalidFilterValue(flag, value);
    }
    result.insert(util::toLower(value));
  }
  return result;
}

template <typename EnumType>
bool contains(const std::set<std::string> &allowed, const State<EnumType> &state) {
  return allowed.empty() || allowed.count(state.str()) > 0;
}

template <typename EnumType>
bool contains(const std::set<std::string> &allowed, const std::optional<State<EnumType>> &state) {
  if (allowed.empty()) return true;
  return state && allowed.count(state->str()) > 0;
}

}  // namespace

void FilterSpec::set(const std::string &flag, const std::string &csv) {
  std::vector<std::string> values;
  for (const auto &item : util::split(csv, ",")) {
    auto value = util::trim(item);
    if (value.empty()) {
      throw InvalidFilterValue(flag, item);
    }
    values.push_back(value);
  }

  if (flag == "type") {
    auto all = std::remove_if(values.begin(), values.end(),
                              [](const std::string &v) { return util::toLower(v) == "all"; });
    all_types = all != values.end();
    values.erase(all, values.end());
    types = parseEnumValues<UnitType>(flag, values);
  } else if (flag == "loaded") {
    loaded = parseEnumValues<LoadState>(flag, values);
  } else if (flag == "active") {
    active = parseEnumValues<ActiveState>(flag, values);
  } else if (flag == "sub-active") {
    sub = std::set<std::string>(values.begin(), values.end());
  } else if (flag == "file-state") {
    file_state = parseEnumValues<UnitFileState>(flag, values);
  } else if (flag == "file-preset") {
    file_preset = parseEnumValues<UnitFilePreset>(flag, values);
  } else {
    throw std::invalid_argument("Unknown filter flag: " + flag);
  }
}

const std::map<std::string, SortKey> &sortKeyNames() {
  static const std::map<std::string, SortKey> names = {
      {"none", SortKey::NONE},         {"loaded", SortKey::LOADED},
      {"active", SortKey::ACTIVE},     {"sub-active", SortKey::SUB},
      {"file-state", SortKey::FILE_STATE}, {"file-preset", SortKey::FILE_PRESET}};
  return names;
}

SortKey parseSortKey(const std::string &name) {
  auto it = sortKeyNames().find(util::toLower(util::trim(name)));
  if (it == sortKeyNames().end()) {
    throw InvalidFilterValue("sort-by", name);
  }
  return it->second;
}

const std::string &sortValue(const Unit &unit, SortKey key) {
  switch (key) {
    case SortKey::LOADED:
      return unit.loaded.str();
    case SortKey::ACTIVE:
      return unit.active.str();
    case SortKey::SUB:
      return unit.sub.str();
    case SortKey::FILE_STATE:
      return unit.file_state ? unit.file_state->str() : EMPTY;
    case SortKey::FILE_PRESET:
      return unit.file_preset ? unit.file_preset->str() : EMPTY;
    case SortKey::NONE:
      break;
  }
  return EMPTY;
}

bool matchesListed(const Unit &unit, const FilterSpec &filters) {
  if (!filters.all_types && !contains(filters.types, unit.type)) return false;
  if (!contains(filters.loaded, unit.loaded)) return false;
  if (!contains(filters.active, unit.active)) return false;
  return filters.sub.empty() || filters.sub.count(unit.sub.str()) > 0;
}

bool matches(const Unit &unit, const FilterSpec &filters) {
  if (!matchesListed(unit, filters)) return false;
  if (!contains(filters.file_state, unit.file_state)) return false;
  return contains(filters.file_preset, unit.file_preset);
}

std::vector<Unit> select(const std::vector<Unit> &units, const FilterSpec &filters, SortKey key) {
  std::vector<Unit> result;
  std::copy_if(units.begin(), units.end(), std::back_inserter(result),
               [&filters](const Unit &unit) { return matches(unit, filters); });

  spdlog::debug("{} of {} units pass the filters", result.size(), units.size());

  if (key != SortKey::NONE) {
    std::stable_sort(result.begin(), result.end(), [key](const Unit &a, const Unit &b) {
      return sortValue(a, key) < sortValue(b, key);
    });
  }
  return result;
}

}  // namespace sysdmon
