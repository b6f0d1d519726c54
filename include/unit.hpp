#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace sysdmon {

// https://www.freedesktop.org/software/systemd/man/org.freedesktop.systemd1.html

enum class UnitType {
  SERVICE,
  SOCKET,
  DEVICE,
  MOUNT,
  AUTOMOUNT,
  SWAP,
  TARGET,
  TIMER,
  PATH,
  SLICE,
  SCOPE,
  UNKNOWN
};

enum class LoadState { LOADED, NOT_FOUND, BAD_SETTING, ERROR, MASKED, UNKNOWN };

enum class ActiveState { ACTIVE, RELOADING, INACTIVE, FAILED, ACTIVATING, DEACTIVATING, UNKNOWN };

enum class UnitFileState {
  ENABLED,
  ENABLED_RUNTIME,
  LINKED,
  LINKED_RUNTIME,
  MASKED,
  MASKED_RUNTIME,
  STATIC,
  DISABLED,
  INVALID,
  INDIRECT,
  GENERATED,
  TRANSIENT,
  ALIAS,
  UNKNOWN
};

enum class UnitFilePreset { ENABLED, DISABLED, UNKNOWN };

/* Manager string -> enum value, for every known value of the enum. */
template <typename EnumType>
const std::map<std::string, EnumType> &stateNames();

template <>
const std::map<std::string, UnitType> &stateNames<UnitType>();
template <>
const std::map<std::string, LoadState> &stateNames<LoadState>();
template <>
const std::map<std::string, ActiveState> &stateNames<ActiveState>();
template <>
const std::map<std::string, UnitFileState> &stateNames<UnitFileState>();
template <>
const std::map<std::string, UnitFilePreset> &stateNames<UnitFilePreset>();

/*
 * A manager-reported enum value.
 * The manager may grow new values at any time, so a string we don't know is kept as
 * UNKNOWN together with the raw text instead of being rejected.
 */
template <typename EnumType>
struct State {
  EnumType value = EnumType::UNKNOWN;
  std::string raw;

  bool known() const { return value != EnumType::UNKNOWN; }
  const std::string &str() const { return raw; }

  bool operator==(EnumType other) const { return value == other; }
  bool operator!=(EnumType other) const { return value != other; }
};

template <typename EnumType>
State<EnumType> decodeState(const std::string &raw);

/* Sub states are defined per unit type by the manager and are passed through untouched. */
struct SubState {
  std::string value;

  const std::string &str() const { return value; }
  bool operator==(const std::string &other) const { return value == other; }
  bool operator!=(const std::string &other) const { return value != other; }
};

/* One element of Manager.ListUnits plus the per-unit properties read afterwards. */
struct RawUnitRecord {
  std::string name;
  std::string description;
  std::string load_state;
  std::string active_state;
  std::string sub_state;
  std::string followed;
  std::string object_path;
  uint32_t job_id = 0;
  std::string job_type;
  std::string job_path;

  // Empty when not read or not reported.
  std::string unit_file_state;
  std::string unit_file_preset;
  std::string fragment_path;
};

struct Unit {
  std::string name;
  State<UnitType> type;
  State<LoadState> loaded;
  State<ActiveState> active;
  SubState sub;
  std::string description;
  std::optional<State<UnitFileState>> file_state;
  std::optional<State<UnitFilePreset>> file_preset;
  std::string file_path;
  std::string object_path;
};

/* Active and sub state of a unit right after the manager reported a change. */
struct UnitStateChange {
  std::string unit_name;
  std::string object_path;
  std::string active_state;
  std::string sub_state;
};

/* Type of a unit from its name suffix, e.g. "nginx.service" -> service. */
State<UnitType> unitTypeOf(const std::string &name);

Unit normalize(const RawUnitRecord &raw);

}  // namespace sysdmon
