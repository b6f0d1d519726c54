#pragma once

#include <optional>
#include <string>

namespace sysdmon::systemd {

inline const std::string SERVICE = "org.freedesktop.systemd1";
inline const std::string MANAGER_PATH = "/org/freedesktop/systemd1";
inline const std::string MANAGER_INTERFACE = "org.freedesktop.systemd1.Manager";
inline const std::string UNIT_INTERFACE = "org.freedesktop.systemd1.Unit";
inline const std::string UNIT_PATH_PREFIX = "/org/freedesktop/systemd1/unit/";
inline const std::string PROPERTIES_INTERFACE = "org.freedesktop.DBus.Properties";

/*
 * Object path elements may only contain [A-Za-z0-9_], the manager escapes every other byte
 * of a unit name as "_xx" (lowercase hex), and a leading digit as well.
 */
std::string escapeBusLabel(const std::string &label);
std::string unescapeBusLabel(const std::string &label);

std::string unitObjectPath(const std::string &unit_name);

/* Unit name of a ".../systemd1/unit/<label>" path, nullopt for any other path. */
std::optional<std::string> unitNameFromPath(const std::string &object_path);

}  // namespace sysdmon::systemd
