#include "notifier.hpp"

#include <glibmm/variant.h>
#include <spdlog/spdlog.h>

#include <tuple>
#include <utility>
#include <vector>

#include "errors.hpp"

namespace sysdmon {

namespace {

const Glib::ustring NOTIFICATIONS_NAME = "org.freedesktop.Notifications";
const Glib::ustring NOTIFICATIONS_PATH = "/org/freedesktop/Notifications";

using Hints = std::map<Glib::ustring, Glib::VariantBase>;
// app name, replaces id, icon, summary, body, actions, hints, expire timeout
using NotifyArgs = Glib::Variant<std::tuple<Glib::ustring, guint32, Glib::ustring, Glib::ustring,
                                            Glib::ustring, std::vector<Glib::ustring>, Hints,
                                            gint32>>;

}  // namespace

const std::map<std::string, Urgency> &urgencyNames() {
  static const std::map<std::string, Urgency> names = {
      {"low", Urgency::LOW}, {"normal", Urgency::NORMAL}, {"critical", Urgency::CRITICAL}};
  return names;
}

DesktopNotifier::DesktopNotifier(NotificationSettings settings) : settings_(std::move(settings)) {}

Glib::RefPtr<Gio::DBus::Connection> &DesktopNotifier::connection() {
  // Connect lazily, the session bus may come up after us
  if (!connection_ || connection_->is_closed()) {
    try {
      connection_ = Gio::DBus::Connection::get_sync(Gio::DBus::BusType::BUS_TYPE_SESSION);
      connection_->set_exit_on_close(false);
    } catch (const Glib::Error &e) {
      connection_.reset();
      throw NotifyError("Unable to connect to the session bus: " + std::string(e.what()));
    }
  }
  return connection_;
}

auto DesktopNotifier::notify(const std::string &title, const std::string &body,
                             const std::string &tag) -> void {
  guint32 replaces_id = 0;
  if (auto it = replace_ids_.find(tag); !tag.empty() && it != replace_ids_.end()) {
    replaces_id = it->second;
  }

  Hints hints{{"urgency", Glib::Variant<guchar>::create(static_cast<guchar>(settings_.urgency))}};
  auto args = NotifyArgs::create(std::make_tuple(
      Glib::ustring(settings_.app_name), replaces_id, Glib::ustring(settings_.icon),
      Glib::ustring(title), Glib::ustring(body), std::vector<Glib::ustring>{}, hints,
      static_cast<gint32>(settings_.expire_timeout)));

  Glib::VariantContainerBase reply;
  try {
    reply = connection()->call_sync(NOTIFICATIONS_PATH, NOTIFICATIONS_NAME, "Notify", args,
                                    NOTIFICATIONS_NAME, settings_.call_timeout);
  } catch (const Glib::Error &e) {
    throw NotifyError("Notify failed: " + std::string(e.what()));
  }

  if (reply.is_of_type(Glib::VariantType("(u)"))) {
    Glib::Variant<guint32> id;
    reply.get_child(id, 0);
    if (!tag.empty()) replace_ids_[tag] = id.get();
    spdlog::debug("Notification {} shown for '{}'", id.get(), tag);
  }
}

}  // namespace sysdmon
