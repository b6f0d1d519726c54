#include "systemd/bus_label.hpp"

#include <fmt/format.h>

#include <cctype>

namespace sysdmon::systemd {

namespace {

int hexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

}  // namespace

std::string escapeBusLabel(const std::string &label) {
  // The manager uses "_" for the empty label
  if (label.empty()) return "_";

  std::string result;
  for (size_t i = 0; i < label.size(); i++) {
    auto c = static_cast<unsigned char>(label[i]);
    if (std::isalpha(c) || (i > 0 && std::isdigit(c))) {
      result += static_cast<char>(c);
    } else {
      result += fmt::format("_{:02x}", c);
    }
  }
  return result;
}

std::string unescapeBusLabel(const std::string &label) {
  if (label == "_") return "";

  std::string result;
  for (size_t i = 0; i < label.size(); i++) {
    if (label[i] == '_' && i + 2 < label.size() && hexValue(label[i + 1]) >= 0 &&
        hexValue(label[i + 2]) >= 0) {
      result += static_cast<char>(hexValue(label[i + 1]) << 4 | hexValue(label[i + 2]));
      i += 2;
    } else {
      result += label[i];
    }
  }
  return result;
}

std::string unitObjectPath(const std::string &unit_name) {
  return UNIT_PATH_PREFIX + escapeBusLabel(unit_name);
}

std::optional<std::string> unitNameFromPath(const std::string &object_path) {
  if (object_path.compare(0, UNIT_PATH_PREFIX.size(), UNIT_PATH_PREFIX) != 0) {
    return std::nullopt;
  }
  auto label = object_path.substr(UNIT_PATH_PREFIX.size());
  if (label.empty() || label.find('/') != std::string::npos) {
    return std::nullopt;
  }
  return unescapeBusLabel(label);
}

}  // namespace sysdmon::systemd
