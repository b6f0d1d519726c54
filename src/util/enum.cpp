#include "util/enum.hpp"

#include <algorithm>
#include <iterator>

#include "notifier.hpp"
#include "unit.hpp"
#include "util/string.hpp"

namespace sysdmon::util {

template <typename EnumType>
EnumParser<EnumType>::EnumParser(const Names& names) {
  // Manager strings are lowercase, user input may not be
  std::transform(names.begin(), names.end(),
                 std::inserter(lowercase_names_, lowercase_names_.end()),
                 [](const auto& pair) { return std::make_pair(toLower(pair.first), pair.second); });
}

template <typename EnumType>
EnumParser<EnumType>::~EnumParser() = default;

template <typename EnumType>
std::optional<EnumType> EnumParser<EnumType>::tryParse(const std::string& str) const {
  auto it = lowercase_names_.find(toLower(str));
  if (it == lowercase_names_.end()) return std::nullopt;
  return it->second;
}

template <typename EnumType>
EnumType EnumParser<EnumType>::parse(const std::string& str) const {
  if (auto value = tryParse(str)) return *value;
  throw std::invalid_argument("Invalid string representation for enum: " + str);
}

template class EnumParser<UnitType>;
template class EnumParser<LoadState>;
template class EnumParser<ActiveState>;
template class EnumParser<UnitFileState>;
template class EnumParser<UnitFilePreset>;
template class EnumParser<Urgency>;

}  // namespace sysdmon::util
