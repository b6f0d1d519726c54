#include "util/logging.hpp"

#include <spdlog/spdlog.h>

#include <charconv>
#include <stdexcept>
#include <system_error>

#ifdef HAVE_LIBSYSTEMD
#include <spdlog/sinks/systemd_sink.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#endif

namespace sysdmon::util {

void logToJournalIfRunAsService(const std::string &identifier) {
#ifdef HAVE_LIBSYSTEMD
  char const *journal_stream = std::getenv("JOURNAL_STREAM");

  if (journal_stream != nullptr) {
    auto stream = parseJournalStream(journal_stream);
    if (!stream) {
      spdlog::warn("malformed JOURNAL_STREAM (\"{}\"), logging to console", journal_stream);
      return;
    }
    auto [device, inode] = *stream;

    struct stat f_stderr;

    if (fstat(STDERR_FILENO, &f_stderr) != 0) {
      spdlog::warn("unable to check stderr device and inode numbers: {}", strerror(errno));
    } else if (device == f_stderr.st_dev && inode == f_stderr.st_ino) {
      auto journald = spdlog::systemd_logger_st("native_journal", identifier, false);
      spdlog::set_default_logger(journald);
    } else {
      spdlog::debug("JOURNAL_STREAM does not point to stderr, logging to console");
    }
  } else {
    spdlog::debug("no JOURNAL_STREAM, logging to console");
  }
#else
  (void)identifier;
#endif
}

std::optional<std::pair<dev_t, ino_t>> parseJournalStream(std::string_view value) {
  const char *end = value.data() + value.size();
  dev_t device;
  ino_t inode;

  auto result = std::from_chars(value.data(), end, device);
  if (result.ec != std::errc{} || result.ptr == end || *result.ptr != ':') {
    return std::nullopt;
  }
  result = std::from_chars(result.ptr + 1, end, inode);
  if (result.ec != std::errc{} || result.ptr != end) {
    return std::nullopt;
  }
  return std::make_pair(device, inode);
}

void setLogLevel(const std::string &level) {
  auto parsed = spdlog::level::from_str(level);
  // from_str falls back to "off" for anything it doesn't know
  if (parsed == spdlog::level::off && level != "off") {
    throw std::invalid_argument("Unknown log level '" + level + "'");
  }
  spdlog::set_level(parsed);
}

}  // namespace sysdmon::util
