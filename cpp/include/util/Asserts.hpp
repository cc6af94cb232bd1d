#pragma once

#include "util/CppUtil.hpp"
#include "util/Exceptions.hpp"

#include <fmt/format.h>

#include <source_location>

/*
 * Assertion macros that throw instead of aborting:
 *
 * RELEASE_ASSERT(cond, ...)  throws util::ReleaseAssertionError. For bugs.
 * CLEAN_ASSERT(cond, ...)    throws util::CleanAssertionError. For bad user input.
 * DEBUG_ASSERT(cond, ...)    throws util::DebugAssertionError. Checked only when DEBUG_BUILD=1,
 *                            but always compiled.
 *
 * The optional trailing arguments are an fmt format string and its arguments, formatted only if
 * the assertion fails. Without them, the message is the text of cond.
 */

#define UTIL_ASSERT_IMPL(EXCEPTION_T, COND, ...) \
  util::detail::assert_impl<EXCEPTION_T>(#COND, std::source_location::current(), COND, ##__VA_ARGS__)

#define DEBUG_ASSERT(COND, ...)                                         \
  do {                                                                  \
    if (IS_MACRO_ENABLED(DEBUG_BUILD)) {                                \
      UTIL_ASSERT_IMPL(util::DebugAssertionError, COND, ##__VA_ARGS__); \
    }                                                                   \
  } while (0)

#define RELEASE_ASSERT(COND, ...)                                       \
  do {                                                                  \
    UTIL_ASSERT_IMPL(util::ReleaseAssertionError, COND, ##__VA_ARGS__); \
  } while (0)

#define CLEAN_ASSERT(COND, ...)                                       \
  do {                                                                \
    UTIL_ASSERT_IMPL(util::CleanAssertionError, COND, ##__VA_ARGS__); \
  } while (0)

namespace util {
namespace detail {

template <typename ExceptionT>
[[noreturn]] void assert_fail(const std::source_location& loc, const std::string& msg) {
  throw ExceptionT("{} failed: {} [{}:{}]", ExceptionT::descr(), msg, loc.file_name(), loc.line());
}

template <typename ExceptionT>
inline void assert_impl(const char* cond_str, const std::source_location& loc, bool cond) {
  if (!cond) assert_fail<ExceptionT>(loc, cond_str);
}

template <typename ExceptionT, typename... Ts>
inline void assert_impl(const char*, const std::source_location& loc, bool cond,
                        fmt::format_string<Ts...> fmt, Ts&&... ts) {
  if (!cond) assert_fail<ExceptionT>(loc, fmt::format(fmt, std::forward<Ts>(ts)...));
}

}  // namespace detail
}  // namespace util
