#pragma once

#include <cstdint>
#include <fmt/color.h>
#include <fmt/format.h>
#include <string>
#include <string_view>
#include <utility>

namespace trellis {

enum class ColorMode : uint8_t {
  Always,
  Auto,
  Never,
};

void setColorMode(ColorMode mode) noexcept;
void setColorMode(std::string_view str) noexcept;
ColorMode getColorMode() noexcept;

bool shouldColorStdout() noexcept;
bool shouldColorStderr() noexcept;

class ColorStr {
  std::string str;
  fmt::text_style style;

public:
  ColorStr(std::string str, const fmt::text_style style) noexcept
      : str(std::move(str)), style(style) {}

  std::string toStr(bool colored) const;
  std::string toErrStr() const { return toStr(shouldColorStderr()); }
  std::string toOutStr() const { return toStr(shouldColorStdout()); }

  friend ColorStr operator|(ColorStr lhs, const fmt::text_style style) {
    lhs.style |= style;
    return lhs;
  }
};

inline ColorStr Green(std::string str) noexcept {
  return { std::move(str), fmt::fg(fmt::terminal_color::green) };
}
inline ColorStr Red(std::string str) noexcept {
  return { std::move(str), fmt::fg(fmt::terminal_color::red) };
}
inline ColorStr Yellow(std::string str) noexcept {
  return { std::move(str), fmt::fg(fmt::terminal_color::yellow) };
}
inline ColorStr Cyan(std::string str) noexcept {
  return { std::move(str), fmt::fg(fmt::terminal_color::cyan) };
}
inline ColorStr Bold(std::string str) noexcept {
  return { std::move(str), fmt::emphasis::bold };
}
inline ColorStr Bold(ColorStr str) noexcept {
  return std::move(str) | fmt::emphasis::bold;
}

} // namespace trellis
