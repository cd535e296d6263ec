#pragma once

#include <compare>
#include <cstdint>
#include <fmt/format.h>
#include <rs/result.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace trellis {

struct Version {
  uint64_t major{};
  uint64_t minor{};
  uint64_t patch{};
  // Dot-separated identifiers after `-`, e.g. `rc.1`.
  std::vector<std::string> pre;
  // Dot-separated identifiers after `+`; ignored by comparisons.
  std::vector<std::string> build;

  static rs::Result<Version> parse(std::string_view str);
  std::string toString() const;

  bool operator==(const Version& other) const noexcept;
  std::strong_ordering operator<=>(const Version& other) const noexcept;
};

} // namespace trellis

template <>
struct fmt::formatter<trellis::Version> : formatter<std::string> {
  auto format(const trellis::Version& version, format_context& ctx) const {
    return formatter<std::string>::format(version.toString(), ctx);
  }
};
