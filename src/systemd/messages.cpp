#include "systemd/messages.hpp"

#include <fmt/format.h>
#include <gio/gio.h>
#include <spdlog/spdlog.h>

#include <map>

#include "errors.hpp"
#include "systemd/bus_label.hpp"

namespace sysdmon::systemd {

namespace {

using StringDict = std::map<Glib::ustring, Glib::VariantBase>;

const char *NO_SUCH_UNIT = "org.freedesktop.systemd1.NoSuchUnit";

std::optional<std::string> stringValue(const Glib::VariantBase &value) {
  if (value && value.is_of_type(Glib::VARIANT_TYPE_STRING)) {
    return Glib::VariantBase::cast_dynamic<Glib::Variant<Glib::ustring>>(value).get();
  }
  return std::nullopt;
}

bool isStateProperty(const Glib::ustring &property) {
  return property == "ActiveState" || property == "SubState";
}

}  // namespace

std::vector<RawUnitRecord> decodeListUnits(const Glib::VariantContainerBase &reply) {
  if (!reply.gobj() || !reply.is_of_type(Glib::VariantType("(a(ssssssouso))"))) {
    throw ConnectionError(fmt::format("Unexpected ListUnits reply type {}",
                                      reply.gobj() ? std::string(reply.get_type_string())
                                                   : std::string("(none)")));
  }

  std::vector<RawUnitRecord> units;

  GVariantIter *iter = nullptr;
  g_variant_get(const_cast<GVariant *>(reply.gobj()), "(a(ssssssouso))", &iter);

  const gchar *name, *description, *load_state, *active_state, *sub_state, *followed;
  const gchar *object_path, *job_type, *job_path;
  guint32 job_id;
  while (g_variant_iter_loop(iter, "(&s&s&s&s&s&s&ou&s&o)", &name, &description, &load_state,
                             &active_state, &sub_state, &followed, &object_path, &job_id,
                             &job_type, &job_path)) {
    RawUnitRecord unit;
    unit.name = name;
    unit.description = description;
    unit.load_state = load_state;
    unit.active_state = active_state;
    unit.sub_state = sub_state;
    unit.followed = followed;
    unit.object_path = object_path;
    unit.job_id = job_id;
    unit.job_type = job_type;
    unit.job_path = job_path;
    units.push_back(std::move(unit));
  }
  g_variant_iter_free(iter);

  return units;
}

std::string decodeStringProperty(const Glib::VariantContainerBase &reply) {
  if (!reply.gobj() || !reply.is_of_type(Glib::VariantType("(v)"))) {
    throw ConnectionError(fmt::format("Unexpected Properties.Get reply type {}",
                                      reply.gobj() ? std::string(reply.get_type_string())
                                                   : std::string("(none)")));
  }
  Glib::Variant<Glib::VariantBase> boxed;
  reply.get_child(boxed, 0);
  return stringValue(boxed.get()).value_or("");
}

std::optional<UnitStateUpdate> decodePropertiesChanged(
    const std::string &object_path, const Glib::VariantContainerBase &parameters) {
  if (!parameters.gobj() || !parameters.is_of_type(Glib::VariantType("(sa{sv}as)"))) {
    spdlog::warn("Bad PropertiesChanged signal on {}", object_path);
    return std::nullopt;
  }

  Glib::Variant<Glib::ustring> changed_interface;
  parameters.get_child(changed_interface, 0);
  if (changed_interface.get() != UNIT_INTERFACE) return std::nullopt;

  auto unit_name = unitNameFromPath(object_path);
  if (!unit_name) {
    spdlog::debug("Ignoring PropertiesChanged on {}", object_path);
    return std::nullopt;
  }

  Glib::Variant<StringDict> changed;
  parameters.get_child(changed, 1);
  Glib::Variant<std::vector<Glib::ustring>> invalidated;
  parameters.get_child(invalidated, 2);

  std::optional<std::string> active_state, sub_state;
  bool state_touched = false;
  for (const auto &[property, value] : changed.get()) {
    if (property == "ActiveState") {
      active_state = stringValue(value);
      state_touched = true;
    } else if (property == "SubState") {
      sub_state = stringValue(value);
      state_touched = true;
    }
  }
  for (const auto &property : invalidated.get()) {
    if (isStateProperty(property)) state_touched = true;
  }
  if (!state_touched) return std::nullopt;

  UnitStateUpdate update;
  update.change = {*unit_name, object_path, active_state.value_or(""), sub_state.value_or("")};
  update.complete = active_state.has_value() && sub_state.has_value();
  return update;
}

bool isUnitGoneError(const Glib::Error &error) {
  const GError *gerror = error.gobj();
  if (gerror == nullptr) return false;
  if (g_error_matches(gerror, G_DBUS_ERROR, G_DBUS_ERROR_UNKNOWN_OBJECT) ||
      g_error_matches(gerror, G_DBUS_ERROR, G_DBUS_ERROR_UNKNOWN_METHOD) ||
      g_error_matches(gerror, G_DBUS_ERROR, G_DBUS_ERROR_UNKNOWN_INTERFACE) ||
      g_error_matches(gerror, G_DBUS_ERROR, G_DBUS_ERROR_UNKNOWN_PROPERTY)) {
    return true;
  }
  // systemd's own error names are not registered with GDBus and arrive as remote errors
  if (g_dbus_error_is_remote_error(gerror)) {
    gchar *remote = g_dbus_error_get_remote_error(gerror);
    bool gone = remote != nullptr && std::string(remote) == NO_SUCH_UNIT;
    g_free(remote);
    return gone;
  }
  return false;
}

}  // namespace sysdmon::systemd
