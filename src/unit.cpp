#include "unit.hpp"

#include <spdlog/spdlog.h>

#include "util/enum.hpp"
#include "util/string.hpp"

namespace sysdmon {

template <>
const std::map<std::string, UnitType> &stateNames<UnitType>() {
  static const std::map<std::string, UnitType> names = {
      {"service", UnitType::SERVICE}, {"socket", UnitType::SOCKET},
      {"device", UnitType::DEVICE},   {"mount", UnitType::MOUNT},
      {"automount", UnitType::AUTOMOUNT}, {"swap", UnitType::SWAP},
      {"target", UnitType::TARGET},   {"timer", UnitType::TIMER},
      {"path", UnitType::PATH},       {"slice", UnitType::SLICE},
      {"scope", UnitType::SCOPE}};
  return names;
}

template <>
const std::map<std::string, LoadState> &stateNames<LoadState>() {
  static const std::map<std::string, LoadState> names = {{"loaded", LoadState::LOADED},
                                                         {"not-found", LoadState::NOT_FOUND},
                                                         {"bad-setting", LoadState::BAD_SETTING},
                                                         {"error", LoadState::ERROR},
                                                         {"masked", LoadState::MASKED}};
  return names;
}

template <>
const std::map<std::string, ActiveState> &stateNames<ActiveState>() {
  static const std::map<std::string, ActiveState> names = {
      {"active", ActiveState::ACTIVE},         {"reloading", ActiveState::RELOADING},
      {"inactive", ActiveState::INACTIVE},     {"failed", ActiveState::FAILED},
      {"activating", ActiveState::ACTIVATING}, {"deactivating", ActiveState::DEACTIVATING}};
  return names;
}

template <>
const std::map<std::string, UnitFileState> &stateNames<UnitFileState>() {
  static const std::map<std::string, UnitFileState> names = {
      {"enabled", UnitFileState::ENABLED},
      {"enabled-runtime", UnitFileState::ENABLED_RUNTIME},
      {"linked", UnitFileState::LINKED},
      {"linked-runtime", UnitFileState::LINKED_RUNTIME},
      {"masked", UnitFileState::MASKED},
      {"masked-runtime", UnitFileState::MASKED_RUNTIME},
      {"static", UnitFileState::STATIC},
      {"disabled", UnitFileState::DISABLED},
      {"invalid", UnitFileState::INVALID},
      {"indirect", UnitFileState::INDIRECT},
      {"generated", UnitFileState::GENERATED},
      {"transient", UnitFileState::TRANSIENT},
      {"alias", UnitFileState::ALIAS}};
  return names;
}

template <>
const std::map<std::string, UnitFilePreset> &stateNames<UnitFilePreset>() {
  static const std::map<std::string, UnitFilePreset> names = {
      {"enabled", UnitFilePreset::ENABLED}, {"disabled", UnitFilePreset::DISABLED}};
  return names;
}

template <typename EnumType>
State<EnumType> decodeState(const std::string &raw) {
  State<EnumType> state;
  state.raw = raw;
  static const util::EnumParser<EnumType> parser(stateNames<EnumType>());
  if (auto value = parser.tryParse(raw)) {
    state.value = *value;
  } else {
    spdlog::trace("Unknown manager value '{}'", raw);
  }
  return state;
}

template State<UnitType> decodeState<UnitType>(const std::string &);
template State<LoadState> decodeState<LoadState>(const std::string &);
template State<ActiveState> decodeState<ActiveState>(const std::string &);
template State<UnitFileState> decodeState<UnitFileState>(const std::string &);
template State<UnitFilePreset> decodeState<UnitFilePreset>(const std::string &);

State<UnitType> unitTypeOf(const std::string &name) {
  return decodeState<UnitType>(util::suffix(name));
}

Unit normalize(const RawUnitRecord &raw) {
  Unit unit;
  unit.name = raw.name;
  unit.type = unitTypeOf(raw.name);
  unit.loaded = decodeState<LoadState>(raw.load_state);
  unit.active = decodeState<ActiveState>(raw.active_state);
  unit.sub = SubState{raw.sub_state};
  unit.description = raw.description;
  if (!raw.unit_file_state.empty()) {
    unit.file_state = decodeState<UnitFileState>(raw.unit_file_state);
  }
  if (!raw.unit_file_preset.empty()) {
    unit.file_preset = decodeState<UnitFilePreset>(raw.unit_file_preset);
  }
  unit.file_path = raw.fragment_path;
  unit.object_path = raw.object_path;
  return unit;
}

}  // namespace sysdmon
