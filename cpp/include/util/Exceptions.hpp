#pragma once

#include <fmt/format.h>

#include <exception>
#include <string>

namespace util {

/*
 * Base class of every exception thrown by this project. The message is built with fmt::format():
 *
 * throw util::Exception("bad tile ({}, {})", row, col);
 */
class Exception : public std::exception {
 public:
  Exception() = default;

  template <typename... Ts>
  Exception(fmt::format_string<Ts...> fmt, Ts&&... ts)
      : what_(fmt::format(fmt, std::forward<Ts>(ts)...)) {}

  const char* what() const noexcept override { return what_.c_str(); }

 private:
  std::string what_;
};

/*
 * Thrown for errors caused by the user rather than by a bug, such as a malformed command line.
 * main() catches these and prints just the message to stderr, without a stack trace or abort.
 */
class CleanException : public Exception {
 public:
  using Exception::Exception;
};

// The exception types thrown by the macros in util/Asserts.hpp. descr() names the macro.

class DebugAssertionError : public Exception {
 public:
  using Exception::Exception;
  static constexpr const char* descr() { return "DEBUG_ASSERT"; }
};

class ReleaseAssertionError : public Exception {
 public:
  using Exception::Exception;
  static constexpr const char* descr() { return "RELEASE_ASSERT"; }
};

class CleanAssertionError : public CleanException {
 public:
  using CleanException::CleanException;
  static constexpr const char* descr() { return "CLEAN_ASSERT"; }
};

}  // namespace util
