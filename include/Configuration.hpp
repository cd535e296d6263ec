#pragma once

#include <cstdint>
#include <fmt/format.h>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace trellis {

// The build configuration passed to every external tool, e.g. `debug`.
class Configuration {
  friend struct fmt::formatter<Configuration>;

public:
  enum class Type : uint8_t {
    Debug,
    Release,
  };
  using enum Type;

private:
  std::variant<Type, std::string> type;

public:
  Configuration() : type(Type::Debug) {}
  Configuration(Type type) : type(type) {} // NOLINT
  explicit Configuration(std::string type) : type(std::move(type)) {}

  static Configuration fromString(const std::string_view str) {
    if (str == "debug") {
      return Debug;
    } else if (str == "release") {
      return Release;
    }
    return Configuration(std::string(str));
  }

  bool operator==(const Configuration& other) const {
    return type == other.type;
  }
};

} // namespace trellis

template <>
struct fmt::formatter<trellis::Configuration> {
  // NOLINTNEXTLINE(*-static)
  constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const trellis::Configuration& conf, FormatContext& ctx) const {
    if (std::holds_alternative<trellis::Configuration::Type>(conf.type)) {
      switch (std::get<trellis::Configuration::Type>(conf.type)) {
      case trellis::Configuration::Debug:
        return fmt::format_to(ctx.out(), "debug");
      case trellis::Configuration::Release:
        return fmt::format_to(ctx.out(), "release");
      }
      __builtin_unreachable();
    } else {
      return fmt::format_to(ctx.out(), "{}",
                            std::get<std::string>(conf.type));
    }
  }
};
