#pragma once

#include <json/json.h>

#include <optional>
#include <string>
#include <vector>

#include "notifier.hpp"
#include "watcher.hpp"

#ifndef SYSCONFDIR
#define SYSCONFDIR "/etc"
#endif

namespace sysdmon {

class Config {
 public:
  static const std::vector<std::string> CONFIG_DIRS;
  static const char *CONFIG_PATH_ENV;
  static const char *CONFIG_NAME;

  /* Try to find any of provided names in the supported set of config directories */
  static std::optional<std::string> findConfigPath(
      const std::vector<std::string> &names, const std::vector<std::string> &dirs = CONFIG_DIRS);

  static std::vector<std::string> tryExpandPath(const std::string &base,
                                                const std::string &filename);

  Config() = default;

  /*
   * Load `config`, or the first watcher.json found in CONFIG_DIRS when empty.
   * Not finding a default config is fine and leaves the built-in defaults.
   * Throws ConfigError.
   */
  void load(const std::string &config);

  /* Read the last loaded file again. */
  void reload();

  Json::Value &getConfig() { return config_; }
  const std::string &path() const { return config_file_; }

  /* Throws ConfigError on values of the wrong type */
  WatcherSettings watcherSettings() const;
  NotificationSettings notificationSettings() const;

 private:
  void setupConfig(const std::string &config_file);

  std::string config_file_;

  Json::Value config_;
};

}  // namespace sysdmon
