#pragma once

#include <string>

namespace sysdmon {

class INotifier {
 public:
  virtual ~INotifier() = default;

  /*
   * Show a desktop notification. A notification with the same non-empty `tag` as an
   * earlier one replaces it on screen. Throws NotifyError.
   */
  virtual auto notify(const std::string &title, const std::string &body, const std::string &tag)
      -> void = 0;
};

}  // namespace sysdmon
