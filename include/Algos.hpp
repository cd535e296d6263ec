#pragma once

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace trellis {

std::string toMacroName(std::string_view name) noexcept;
std::string replaceAll(std::string str, std::string_view from,
                       std::string_view to) noexcept;

constexpr bool
matchesAny(const std::string_view str,
           const std::initializer_list<std::string_view> candidates) noexcept {
  for (const std::string_view candidate : candidates) {
    if (str == candidate) {
      return true;
    }
  }
  return false;
}

std::size_t levDistance(std::string_view lhs, std::string_view rhs) noexcept;

// Returns the candidate closest to `lhs` when it is close enough to be a
// plausible typo.
std::optional<std::string_view>
findSimilarStr(std::string_view lhs,
               std::span<const std::string_view> candidates) noexcept;

} // namespace trellis
