#pragma once

#include <giomm/dbusconnection.h>

#include <map>
#include <string>

#include "interfaces/INotifier.hpp"

namespace sysdmon {

// https://specifications.freedesktop.org/notification-spec/latest/urgency-levels.html
enum class Urgency { LOW = 0, NORMAL = 1, CRITICAL = 2 };

const std::map<std::string, Urgency> &urgencyNames();

struct NotificationSettings {
  std::string app_name = "sysdmon";
  std::string icon = "text-x-systemd-unit";
  Urgency urgency = Urgency::CRITICAL;
  // Milliseconds on screen, 0 keeps it until dismissed, -1 leaves it to the server
  int expire_timeout = 0;
  // Upper bound for the Notify round trip, so a stuck server can't stall the watcher
  int call_timeout = 5000;
};

/* org.freedesktop.Notifications client on the session bus. */
class DesktopNotifier : public INotifier {
 public:
  explicit DesktopNotifier(NotificationSettings settings);
  ~DesktopNotifier() override = default;

  auto notify(const std::string &title, const std::string &body, const std::string &tag)
      -> void override;

  void setSettings(const NotificationSettings &settings) { settings_ = settings; }

 private:
  Glib::RefPtr<Gio::DBus::Connection> &connection();

  NotificationSettings settings_;
  Glib::RefPtr<Gio::DBus::Connection> connection_;
  // Last notification id handed out by the server per tag
  std::map<std::string, guint32> replace_ids_;
};

}  // namespace sysdmon
