#include "config.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <unistd.h>
#include <wordexp.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "errors.hpp"
#include "util/enum.hpp"

namespace fs = std::filesystem;

namespace sysdmon {

const std::vector<std::string> Config::CONFIG_DIRS = {
    "$XDG_CONFIG_HOME/sysdmon/", "$HOME/.config/sysdmon/", "/etc/xdg/sysdmon/",
    SYSCONFDIR "/sysdmon/",      "./resources/",
};

const char *Config::CONFIG_PATH_ENV = "SYSDMON_CONFIG_DIR";

const char *Config::CONFIG_NAME = "watcher.json";

namespace {

std::vector<std::string> stringList(const Json::Value &value, const std::string &key) {
  std::vector<std::string> result;
  if (value.isNull()) return result;
  if (value.isString()) {
    result.push_back(value.asString());
    return result;
  }
  if (!value.isArray()) {
    throw ConfigError(fmt::format("'{}' must be a string or an array of strings", key));
  }
  for (const auto &item : value) {
    if (!item.isString()) {
      throw ConfigError(fmt::format("'{}' must only contain strings", key));
    }
    result.push_back(item.asString());
  }
  return result;
}

int intValue(const Json::Value &value, const std::string &key, int fallback) {
  if (value.isNull()) return fallback;
  if (!value.isInt()) {
    throw ConfigError(fmt::format("'{}' must be an integer", key));
  }
  return value.asInt();
}

std::string stringValue(const Json::Value &value, const std::string &key,
                        const std::string &fallback) {
  if (value.isNull()) return fallback;
  if (!value.isString()) {
    throw ConfigError(fmt::format("'{}' must be a string", key));
  }
  return value.asString();
}

}  // namespace

std::vector<std::string> Config::tryExpandPath(const std::string &base,
                                               const std::string &filename) {
  fs::path path;

  if (!filename.empty()) {
    path = fs::path(base) / fs::path(filename);
  } else {
    path = fs::path(base);
  }

  spdlog::debug("Try expanding: {}", path.string());

  std::vector<std::string> results;
  wordexp_t p;
  if (wordexp(path.c_str(), &p, 0) == 0) {
    for (size_t i = 0; i < p.we_wordc; i++) {
      if (access(p.we_wordv[i], F_OK) == 0) {
        results.emplace_back(p.we_wordv[i]);
        spdlog::debug("Found config file: {}", p.we_wordv[i]);
      }
    }
    wordfree(&p);
  }

  return results;
}

std::optional<std::string> Config::findConfigPath(const std::vector<std::string> &names,
                                                  const std::vector<std::string> &dirs) {
  if (const char *dir = std::getenv(Config::CONFIG_PATH_ENV)) {
    for (const auto &name : names) {
      if (auto res = tryExpandPath(dir, name); !res.empty()) {
        return res.front();
      }
    }
  }

  for (const auto &dir : dirs) {
    for (const auto &name : names) {
      if (auto res = tryExpandPath(dir, name); !res.empty()) {
        return res.front();
      }
    }
  }
  return std::nullopt;
}

void Config::setupConfig(const std::string &config_file) {
  std::ifstream file(config_file);
  if (!file.is_open()) {
    throw ConfigError("Can't open config file " + config_file);
  }

  Json::CharReaderBuilder builder;
  Json::Value root;
  std::string errs;
  if (!Json::parseFromStream(builder, file, &root, &errs)) {
    throw ConfigError(fmt::format("Error parsing {}: {}", config_file, errs));
  }
  if (!root.isObject()) {
    throw ConfigError(fmt::format("{} must contain a JSON object", config_file));
  }
  config_ = root;
}

void Config::load(const std::string &config) {
  auto file = config.empty() ? findConfigPath({CONFIG_NAME}) : config;
  config_ = Json::Value(Json::objectValue);
  if (!file) {
    spdlog::info("No {} found, using defaults", CONFIG_NAME);
    config_file_.clear();
    return;
  }
  config_file_ = file.value();
  spdlog::info("Using configuration file {}", config_file_);
  setupConfig(config_file_);
}

void Config::reload() {
  if (config_file_.empty()) {
    spdlog::info("No configuration file to reload");
    return;
  }
  spdlog::info("Reloading {}", config_file_);
  setupConfig(config_file_);
}

WatcherSettings Config::watcherSettings() const {
  WatcherSettings settings;

  for (const auto &name : stringList(config_.get("ignore", Json::Value()), "ignore")) {
    settings.ignore.addName(name);
  }
  for (const auto &expression :
       stringList(config_.get("ignore-regex", Json::Value()), "ignore-regex")) {
    settings.ignore.addRegex(expression);
  }

  const auto &failure_states = config_.get("failure-states", Json::Value());
  if (!failure_states.isNull()) {
    if (!failure_states.isObject()) {
      throw ConfigError("'failure-states' must be an object");
    }
    // Types not listed keep falling back to the built-in "*" rules
    auto table = settings.predicate.table();
    for (const auto &type : failure_states.getMemberNames()) {
      std::vector<StatePattern> patterns;
      for (const auto &pattern : stringList(failure_states[type], "failure-states." + type)) {
        patterns.push_back(StatePattern::parse(pattern));
      }
      table[type] = std::move(patterns);
    }
    settings.predicate = FailurePredicate(std::move(table));
  }

  const auto &notification = config_.get("notification", Json::Value());
  if (!notification.isNull() && !notification.isObject()) {
    throw ConfigError("'notification' must be an object");
  }
  settings.summary =
      stringValue(notification.get("summary", Json::Value()), "notification.summary",
                  settings.summary);

  spdlog::debug("{} ignore rules, failure states for {} unit types", settings.ignore.size(),
                settings.predicate.table().size());
  return settings;
}

NotificationSettings Config::notificationSettings() const {
  NotificationSettings settings;

  const auto &notification = config_.get("notification", Json::Value());
  if (notification.isNull()) return settings;
  if (!notification.isObject()) {
    throw ConfigError("'notification' must be an object");
  }

  settings.app_name = stringValue(notification.get("app-name", Json::Value()),
                                  "notification.app-name", settings.app_name);
  settings.icon =
      stringValue(notification.get("icon", Json::Value()), "notification.icon", settings.icon);
  settings.expire_timeout = intValue(notification.get("expire-timeout", Json::Value()),
                                     "notification.expire-timeout", settings.expire_timeout);
  settings.call_timeout = intValue(notification.get("call-timeout", Json::Value()),
                                   "notification.call-timeout", settings.call_timeout);

  const auto &urgency = notification.get("urgency", Json::Value());
  if (!urgency.isNull()) {
    auto name = stringValue(urgency, "notification.urgency", "");
    auto parsed = util::EnumParser<Urgency>(urgencyNames()).tryParse(name);
    if (!parsed) {
      throw ConfigError(
          fmt::format("Invalid notification.urgency '{}', expected low, normal or critical",
                      name));
    }
    settings.urgency = *parsed;
  }
  return settings;
}

}  // namespace sysdmon
