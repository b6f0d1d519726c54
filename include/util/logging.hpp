#pragma once

#include <sys/types.h>

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace sysdmon::util {

/*
 * Switch the default logger to the native journal protocol when stderr is connected to
 * the journal, as described in https://systemd.io/JOURNAL_NATIVE_PROTOCOL
 * Does nothing unless built with libsystemd.
 */
void logToJournalIfRunAsService(const std::string &identifier);

/* `JOURNAL_STREAM` is "<device>:<inode>" in decimal; nullopt for anything else. */
std::optional<std::pair<dev_t, ino_t>> parseJournalStream(std::string_view value);

/* Throws std::invalid_argument for names spdlog doesn't know */
void setLogLevel(const std::string &level);

}  // namespace sysdmon::util
