#include "TermColor.hpp"

#include <cstdio>
#include <cstdlib>
#include <fmt/color.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <unistd.h>

namespace trellis {

static bool isTerm(std::FILE* stream) noexcept {
  if (isatty(fileno(stream)) == 0) {
    return false;
  }
  const char* term = std::getenv("TERM");
  return term == nullptr || std::string_view(term) != "dumb";
}

static ColorMode getColorMode(const std::string_view str) noexcept {
  if (str == "always") {
    return ColorMode::Always;
  } else if (str == "auto") {
    return ColorMode::Auto;
  } else if (str == "never") {
    return ColorMode::Never;
  } else {
    spdlog::warn("unknown color mode `{}`; falling back to auto", str);
    return ColorMode::Auto;
  }
}

class ColorState {
public:
  void set(const ColorMode mode) noexcept {
    this->mode = mode;
    switch (mode) {
    case ColorMode::Always:
      stdoutColored = true;
      stderrColored = true;
      return;
    case ColorMode::Auto:
      stdoutColored = isTerm(stdout);
      stderrColored = isTerm(stderr);
      return;
    case ColorMode::Never:
      stdoutColored = false;
      stderrColored = false;
      return;
    }
  }

  ColorMode get() const noexcept { return mode; }
  bool stdoutEnabled() const noexcept { return stdoutColored; }
  bool stderrEnabled() const noexcept { return stderrColored; }

  static ColorState& instance() noexcept {
    static ColorState instance;
    return instance;
  }

private:
  ColorMode mode = ColorMode::Auto;
  bool stdoutColored = false;
  bool stderrColored = false;

  ColorState() noexcept {
    // `TRELLIS_TERM_COLOR` is the initial mode; `--color` overrides it.
    if (const char* color = std::getenv("TRELLIS_TERM_COLOR")) {
      set(getColorMode(color));
    } else {
      set(ColorMode::Auto);
    }
  }
};

void setColorMode(const ColorMode mode) noexcept {
  ColorState::instance().set(mode);
}

void setColorMode(const std::string_view str) noexcept {
  setColorMode(getColorMode(str));
}

ColorMode getColorMode() noexcept { return ColorState::instance().get(); }

bool shouldColorStdout() noexcept {
  return ColorState::instance().stdoutEnabled();
}

bool shouldColorStderr() noexcept {
  return ColorState::instance().stderrEnabled();
}

std::string ColorStr::toStr(const bool colored) const {
  if (!colored) {
    return str;
  }
  return fmt::format("{}", fmt::styled(str, style));
}

} // namespace trellis
