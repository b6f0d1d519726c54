#include "systemd/manager.hpp"

#include <fmt/format.h>
#include <gio/gio.h>
#include <spdlog/spdlog.h>

#include <optional>
#include <tuple>

#include "errors.hpp"
#include "systemd/bus_label.hpp"
#include "systemd/messages.hpp"

namespace sysdmon::systemd {

namespace {

using PropertyGetArgs = Glib::Variant<std::tuple<Glib::ustring, Glib::ustring>>;

const char *scopeName(BusScope scope) { return scope == BusScope::USER ? "session" : "system"; }

bool isPermissionDenied(const Glib::Error &e) {
  const GError *error = e.gobj();
  return error != nullptr && (g_error_matches(error, G_DBUS_ERROR, G_DBUS_ERROR_ACCESS_DENIED) ||
                              g_error_matches(error, G_DBUS_ERROR, G_DBUS_ERROR_AUTH_FAILED) ||
                              g_error_matches(error, G_IO_ERROR, G_IO_ERROR_PERMISSION_DENIED));
}

/* Translate a giomm error into our own taxonomy. */
[[noreturn]] void rethrow(const Glib::Error &e, const std::string &context) {
  auto message = fmt::format("{}: {}", context, std::string(e.what()));
  if (isPermissionDenied(e)) {
    throw PermissionError(message + " (try again with sudo)");
  }
  throw ConnectionError(message);
}

}  // namespace

Manager::Manager(BusScope scope) : scope_(scope) {
  try {
    connection_ = Gio::DBus::Connection::get_sync(scope == BusScope::USER
                                                      ? Gio::DBus::BusType::BUS_TYPE_SESSION
                                                      : Gio::DBus::BusType::BUS_TYPE_SYSTEM);
  } catch (const Glib::Error &e) {
    rethrow(e, fmt::format("Unable to connect to the {} bus", scopeName(scope)));
  }
  if (!connection_) {
    throw ConnectionError(fmt::format("Unable to connect to the {} bus", scopeName(scope)));
  }

  // A closed bus must reach us, not terminate the process behind our back
  connection_->set_exit_on_close(false);
  connection_->signal_closed().connect(sigc::mem_fun(*this, &Manager::onClosed));

  spdlog::debug("Connected to the {} bus as {}", scopeName(scope),
                std::string(connection_->get_unique_name()));
}

Manager::~Manager() = default;

Glib::VariantContainerBase Manager::call(const std::string &object_path,
                                         const std::string &interface, const std::string &method,
                                         const Glib::VariantContainerBase &parameters) {
  try {
    return connection_->call_sync(object_path, interface, method, parameters, SERVICE);
  } catch (const Glib::Error &e) {
    rethrow(e, fmt::format("{}.{} on {} failed", interface, method, object_path));
  }
}

static Glib::VariantContainerBase propertyGetArgs(const std::string &property) {
  return PropertyGetArgs::create(
      std::make_tuple(Glib::ustring(UNIT_INTERFACE), Glib::ustring(property)));
}

std::string Manager::getUnitProperty(const std::string &object_path,
                                     const std::string &property) {
  return decodeStringProperty(
      call(object_path, PROPERTIES_INTERFACE, "Get", propertyGetArgs(property)));
}

std::optional<std::string> Manager::tryGetUnitProperty(const std::string &object_path,
                                                       const std::string &property) {
  Glib::VariantContainerBase reply;
  try {
    reply = connection_->call_sync(object_path, PROPERTIES_INTERFACE, "Get",
                                   propertyGetArgs(property), SERVICE);
  } catch (const Glib::Error &e) {
    if (!isUnitGoneError(e)) {
      rethrow(e, fmt::format("Reading {} of {} failed", property, object_path));
    }
    spdlog::debug("No {} for {}: {}", property, object_path, std::string(e.what()));
    return std::nullopt;
  }
  return decodeStringProperty(reply);
}

std::vector<RawUnitRecord> Manager::listUnits(bool with_fragment_path,
                                              const UnitPredicate &wanted) {
  auto units = decodeListUnits(
      call(MANAGER_PATH, MANAGER_INTERFACE, "ListUnits", Glib::VariantContainerBase()));

  size_t detailed = 0;
  for (auto &unit : units) {
    if (wanted && !wanted(unit)) continue;
    detailed++;
    unit.unit_file_state = tryGetUnitProperty(unit.object_path, "UnitFileState").value_or("");
    unit.unit_file_preset = tryGetUnitProperty(unit.object_path, "UnitFilePreset").value_or("");
    if (with_fragment_path) {
      unit.fragment_path = tryGetUnitProperty(unit.object_path, "FragmentPath").value_or("");
    }
  }

  spdlog::debug("Manager reported {} units, read file properties of {}", units.size(),
                detailed);
  return units;
}

std::pair<std::string, std::string> Manager::getUnitState(const std::string &object_path) {
  return {getUnitProperty(object_path, "ActiveState"),
          getUnitProperty(object_path, "SubState")};
}

std::unique_ptr<Subscription> Manager::subscribe() {
  return std::make_unique<Subscription>(*this);
}

void Manager::onClosed(bool remote_peer_vanished, const Glib::Error &error) {
  std::string reason = error.gobj() != nullptr ? std::string(error.what())
                       : remote_peer_vanished  ? "remote peer vanished"
                                               : "closed";
  spdlog::error("Lost connection to the {} bus: {}", scopeName(scope_), reason);
  signal_connection_lost_.emit(reason);
}

Subscription::Subscription(Manager &manager) : manager_(manager) {
  // Without Subscribe the manager doesn't emit unit signals at all
  manager_.call(MANAGER_PATH, MANAGER_INTERFACE, "Subscribe", Glib::VariantContainerBase());

  subscription_id_ = manager_.connection_->signal_subscribe(
      sigc::mem_fun(*this, &Subscription::onPropertiesChanged), SERVICE, PROPERTIES_INTERFACE,
      "PropertiesChanged", "", UNIT_INTERFACE);

  spdlog::debug("Subscribed to unit changes, match id {}", subscription_id_);
}

Subscription::~Subscription() {
  if (subscription_id_ > 0u) {
    manager_.connection_->signal_unsubscribe(subscription_id_);
    subscription_id_ = 0u;
  }
  if (manager_.connection_->is_closed()) {
    return;
  }
  try {
    manager_.call(MANAGER_PATH, MANAGER_INTERFACE, "Unsubscribe", Glib::VariantContainerBase());
  } catch (const std::exception &e) {
    spdlog::warn("Failed to unsubscribe from the manager: {}", e.what());
  }
}

void Subscription::onPropertiesChanged(const Glib::RefPtr<Gio::DBus::Connection> &connection,
                                       const Glib::ustring &sender_name,
                                       const Glib::ustring &object_path,
                                       const Glib::ustring &interface_name,
                                       const Glib::ustring &signal_name,
                                       const Glib::VariantContainerBase &parameters) {
  auto update = decodePropertiesChanged(object_path, parameters);
  if (!update) return;

  auto &change = update->change;
  if (!update->complete) {
    try {
      std::tie(change.active_state, change.sub_state) = manager_.getUnitState(object_path);
    } catch (const std::exception &e) {
      spdlog::debug("Can't read the state of {}: {}", change.unit_name, e.what());
      return;
    }
  }

  spdlog::trace("{}: {}/{}", change.unit_name, change.active_state, change.sub_state);
  signal_unit_changed_.emit(change);
}

}  // namespace sysdmon::systemd
