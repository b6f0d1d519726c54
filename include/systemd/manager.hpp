#pragma once

#include <giomm/dbusconnection.h>
#include <glibmm/variant.h>
#include <sigc++/signal.h>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "unit.hpp"

namespace sysdmon::systemd {

enum class BusScope { SYSTEM, USER };

class Manager;

/*
 * PropertiesChanged subscription for all units of one manager.
 * Lives as long as the object: destroying it drops the match rule and tells the manager
 * we are no longer interested in signals.
 */
class Subscription {
 public:
  using SignalUnitChanged = sigc::signal<void(const UnitStateChange &)>;

  explicit Subscription(Manager &manager);
  ~Subscription();

  Subscription(const Subscription &) = delete;
  Subscription &operator=(const Subscription &) = delete;

  /* Emitted once per signal, in bus order, from the main context of the connection. */
  SignalUnitChanged &signal_unit_changed() { return signal_unit_changed_; }

 private:
  void onPropertiesChanged(const Glib::RefPtr<Gio::DBus::Connection> &connection,
                           const Glib::ustring &sender_name, const Glib::ustring &object_path,
                           const Glib::ustring &interface_name, const Glib::ustring &signal_name,
                           const Glib::VariantContainerBase &parameters);

  Manager &manager_;
  guint subscription_id_{0u};
  SignalUnitChanged signal_unit_changed_;
};

/* Connection to org.freedesktop.systemd1 on the system or session bus. */
class Manager {
 public:
  using SignalConnectionLost = sigc::signal<void(const std::string &)>;
  using UnitPredicate = std::function<bool(const RawUnitRecord &)>;

  /* Throws ConnectionError or PermissionError */
  explicit Manager(BusScope scope);
  ~Manager();

  Manager(const Manager &) = delete;
  Manager &operator=(const Manager &) = delete;

  /*
   * All units currently known to the manager. UnitFileState and UnitFilePreset (and
   * FragmentPath when `with_fragment_path` is set) are only read for units accepted by
   * `wanted`, or for every unit without one. A unit vanishing in between leaves its fields
   * empty; any other bus error is thrown.
   */
  std::vector<RawUnitRecord> listUnits(bool with_fragment_path,
                                       const UnitPredicate &wanted = nullptr);

  /* ActiveState and SubState of the unit at `object_path`. */
  std::pair<std::string, std::string> getUnitState(const std::string &object_path);

  std::unique_ptr<Subscription> subscribe();

  /* Emitted when the bus connection closes under us. */
  SignalConnectionLost &signal_connection_lost() { return signal_connection_lost_; }

 private:
  friend class Subscription;

  Glib::VariantContainerBase call(const std::string &object_path, const std::string &interface,
                                  const std::string &method,
                                  const Glib::VariantContainerBase &parameters);
  std::string getUnitProperty(const std::string &object_path, const std::string &property);
  /* nullopt when the unit or property is gone, see isUnitGoneError() */
  std::optional<std::string> tryGetUnitProperty(const std::string &object_path,
                                                const std::string &property);
  void onClosed(bool remote_peer_vanished, const Glib::Error &error);

  BusScope scope_;
  Glib::RefPtr<Gio::DBus::Connection> connection_;
  SignalConnectionLost signal_connection_lost_;
};

}  // namespace sysdmon::systemd
