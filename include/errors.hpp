#pragma once

#include <stdexcept>
#include <string>

namespace sysdmon {

/* The service manager bus can not be reached, or dropped the connection. */
class ConnectionError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/* The requested bus scope needs privileges the caller doesn't have. */
class PermissionError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class InvalidFilterValue : public std::runtime_error {
 public:
  InvalidFilterValue(const std::string &flag, const std::string &value)
      : std::runtime_error("Invalid value '" + value + "' for --" + flag),
        flag_(flag),
        value_(value) {}

  const std::string &flag() const { return flag_; }
  const std::string &value() const { return value_; }

 private:
  std::string flag_;
  std::string value_;
};

class NotifyError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/* Malformed command line, the caller prints usage. */
class UsageError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

}  // namespace sysdmon
