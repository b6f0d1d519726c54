#pragma once

#include <map>
#include <optional>
#include <stdexcept>
#include <string>

namespace sysdmon::util {

/* Case-insensitive string -> enum lookup over a name table. */
template <typename EnumType>
class EnumParser {
 public:
  using Names = std::map<std::string, EnumType>;

  explicit EnumParser(const Names& names);
  ~EnumParser();

  std::optional<EnumType> tryParse(const std::string& str) const;

  /* Throws std::invalid_argument when `str` is not in the table */
  EnumType parse(const std::string& str) const;

 private:
  Names lowercase_names_;
};

}  // namespace sysdmon::util
