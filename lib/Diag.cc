#include "Diag.hpp"

#include <spdlog/spdlog.h>

namespace trellis {

static DiagLevel& diagLevel() noexcept {
  static DiagLevel level = DiagLevel::Info;
  return level;
}

void setDiagLevel(const DiagLevel level) noexcept {
  diagLevel() = level;

  switch (level) {
  case DiagLevel::Off:
    spdlog::set_level(spdlog::level::off);
    return;
  case DiagLevel::Error:
    spdlog::set_level(spdlog::level::err);
    return;
  case DiagLevel::Warn:
  case DiagLevel::Info:
    spdlog::set_level(spdlog::level::warn);
    return;
  case DiagLevel::Verbose:
    spdlog::set_level(spdlog::level::debug);
    return;
  case DiagLevel::VeryVerbose:
    spdlog::set_level(spdlog::level::trace);
    return;
  }
}

DiagLevel getDiagLevel() noexcept { return diagLevel(); }

} // namespace trellis
