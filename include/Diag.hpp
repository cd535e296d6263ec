#pragma once

#include "TermColor.hpp"

#include <cstdint>
#include <cstdio>
#include <fmt/core.h>
#include <string_view>
#include <utility>

namespace trellis {

enum class DiagLevel : uint8_t {
  Off = 0, // --quiet, -q
  Error = 1,
  Warn = 2,
  Info = 3,        // default
  Verbose = 4,     // --verbose, -v
  VeryVerbose = 5, // -vv
};

void setDiagLevel(DiagLevel level) noexcept;
DiagLevel getDiagLevel() noexcept;

inline bool isVerbose() noexcept {
  return getDiagLevel() >= DiagLevel::Verbose;
}

struct Diag {
  template <typename... Args>
  static void error(fmt::format_string<Args...> fmt, Args&&... args) noexcept {
    if (getDiagLevel() < DiagLevel::Error) {
      return;
    }
    fmt::print(stderr, "{}{}\n", Bold(Red("Error: ")).toErrStr(),
               fmt::format(fmt, std::forward<Args>(args)...));
  }

  template <typename... Args>
  static void warn(fmt::format_string<Args...> fmt, Args&&... args) noexcept {
    if (getDiagLevel() < DiagLevel::Warn) {
      return;
    }
    fmt::print(stderr, "{}{}\n", Bold(Yellow("Warning: ")).toErrStr(),
               fmt::format(fmt, std::forward<Args>(args)...));
  }

  // Prints a status line with a right-aligned, 12-column header.
  template <typename... Args>
  static void info(const std::string_view header,
                   fmt::format_string<Args...> fmt, Args&&... args) noexcept {
    if (getDiagLevel() < DiagLevel::Info) {
      return;
    }
    fmt::print(stderr, "{} {}\n",
               Bold(Green(fmt::format("{:>12}", header))).toErrStr(),
               fmt::format(fmt, std::forward<Args>(args)...));
  }

  template <typename... Args>
  static void verbose(const std::string_view header,
                      fmt::format_string<Args...> fmt,
                      Args&&... args) noexcept {
    if (getDiagLevel() < DiagLevel::Verbose) {
      return;
    }
    fmt::print(stderr, "{} {}\n",
               Bold(Cyan(fmt::format("{:>12}", header))).toErrStr(),
               fmt::format(fmt, std::forward<Args>(args)...));
  }
};

} // namespace trellis
