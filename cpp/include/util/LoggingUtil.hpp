#pragma once

#include <spdlog/fmt/ostr.h>  // Enables fallback to ostream <<
#include <spdlog/spdlog.h>

#include <string>

// Logging macros, in increasing order of severity:
//
// LOG_TRACE(), LOG_DEBUG(), LOG_INFO(), LOG_WARN(), LOG_ERROR()
//
// Each takes an fmt::format() format string followed by its arguments:
//
// LOG_INFO("x wins after {} moves", n);
//
// LOG_TRACE() and LOG_DEBUG() calls are compiled out unless the build was configured with
// -DTICTACTOE_ENABLE_DEBUG_LOGGING=ON. Everything else is filtered at runtime by --log-level.

#define LOG_TRACE(...)         \
  do {                         \
    SPDLOG_TRACE(__VA_ARGS__); \
  } while (0)

#define LOG_DEBUG(...)         \
  do {                         \
    SPDLOG_DEBUG(__VA_ARGS__); \
  } while (0)

#define LOG_INFO(...)         \
  do {                        \
    SPDLOG_INFO(__VA_ARGS__); \
  } while (0)

#define LOG_WARN(...)         \
  do {                        \
    SPDLOG_WARN(__VA_ARGS__); \
  } while (0)

#define LOG_ERROR(...)         \
  do {                         \
    SPDLOG_ERROR(__VA_ARGS__); \
  } while (0)

namespace util {

/*
 * Log lines are written to stderr, so that they never interleave with whatever a program prints
 * to stdout. If a log filename is given, they are also written there.
 */
struct Logging {
  struct Params {
    std::string log_filename;
    std::string log_level = "info";
    bool append_mode = false;
    bool omit_timestamps = false;

    auto make_options_description();
  };

  // Throws util::CleanException on an unknown log level, or if the log file cannot be opened.
  static void init(const Params&);
};

}  // namespace util

#include "inline/util/LoggingUtil.inl"
