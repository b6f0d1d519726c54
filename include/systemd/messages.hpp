#pragma once

#include <glibmm/error.h>
#include <glibmm/variant.h>

#include <optional>
#include <string>
#include <vector>

#include "unit.hpp"

namespace sysdmon::systemd {

/* Manager.ListUnits reply, `(a(ssssssouso))`. Throws ConnectionError on any other type. */
std::vector<RawUnitRecord> decodeListUnits(const Glib::VariantContainerBase &reply);

/* Properties.Get reply, `(v)`. A non-string value decodes as empty. Throws ConnectionError. */
std::string decodeStringProperty(const Glib::VariantContainerBase &reply);

struct UnitStateUpdate {
  UnitStateChange change;
  // Both ActiveState and SubState were carried by the signal itself
  bool complete = false;
};

/*
 * PropertiesChanged `(sa{sv}as)` emitted on a unit object.
 * nullopt when the signal is not about the Unit interface, the path is not a unit path, or
 * neither ActiveState nor SubState changed or got invalidated.
 */
std::optional<UnitStateUpdate> decodePropertiesChanged(const std::string &object_path,
                                                       const Glib::VariantContainerBase &parameters);

/*
 * True for errors about a single unit object (it vanished, or doesn't have the property),
 * as opposed to errors about the connection itself.
 */
bool isUnitGoneError(const Glib::Error &error);

}  // namespace sysdmon::systemd
