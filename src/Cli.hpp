#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <rs/result.hpp>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace trellis {

using CliArgsView = std::span<const std::string>;

template <typename Derived>
class CliBase {
protected:
  std::string_view name;
  std::string_view desc;

public:
  constexpr CliBase() noexcept = default;
  constexpr explicit CliBase(const std::string_view name) noexcept
      : name(name) {}

  constexpr Derived& setDesc(const std::string_view desc) noexcept {
    this->desc = desc;
    return static_cast<Derived&>(*this);
  }
};

template <typename Derived>
class ShortAndHidden {
protected:
  std::string_view shortName;
  bool isHidden = false;

public:
  constexpr Derived& setShort(const std::string_view shortName) noexcept {
    this->shortName = shortName;
    return static_cast<Derived&>(*this);
  }
  constexpr Derived& setHidden(const bool isHidden) noexcept {
    this->isHidden = isHidden;
    return static_cast<Derived&>(*this);
  }
};

class Opt : public CliBase<Opt>, public ShortAndHidden<Opt> {
  friend class Subcmd;
  friend class Cli;

  std::string_view placeholder;
  std::string_view defaultVal;
  bool isGlobal = false;

public:
  using CliBase::CliBase;

  constexpr Opt& setPlaceholder(const std::string_view placeholder) noexcept {
    this->placeholder = placeholder;
    return *this;
  }
  constexpr Opt& setDefault(const std::string_view defaultVal) noexcept {
    this->defaultVal = defaultVal;
    return *this;
  }
  constexpr Opt& setGlobal(const bool isGlobal) noexcept {
    this->isGlobal = isGlobal;
    return *this;
  }

  // `-c, --configuration <NAME>`
  std::string leftColumn() const;
  void print(std::size_t maxOffset) const;
};

class Arg : public CliBase<Arg> {
  friend class Subcmd;

  bool required = true;
  bool variadic = false;

public:
  using CliBase::CliBase;

  constexpr Arg& setRequired(const bool required) noexcept {
    this->required = required;
    return *this;
  }
  constexpr Arg& setVariadic(const bool variadic) noexcept {
    this->variadic = variadic;
    return *this;
  }

  // `<NAME>`, `[NAME]`, or `[NAME]...`
  std::string usage() const;
};

class Subcmd : public CliBase<Subcmd>, public ShortAndHidden<Subcmd> {
  friend class Cli;

  std::vector<Opt> localOpts;
  std::optional<Arg> arg;
  std::function<rs::Result<void>(CliArgsView)> mainFn;

public:
  using CliBase::CliBase;

  Subcmd& addOpt(Opt opt);
  Subcmd& setArg(Arg arg);
  Subcmd& setMainFn(std::function<rs::Result<void>(CliArgsView)> mainFn);

  std::string_view getName() const noexcept { return name; }
  std::string_view getShort() const noexcept { return shortName; }
  std::string_view getDesc() const noexcept { return desc; }

  static rs::Result<void> missingOptArgumentFor(std::string_view arg);
  rs::Result<void> noSuchArg(std::string_view arg) const;

  void printHelp(const std::vector<Opt>& globalOpts) const;
};

class Cli : public CliBase<Cli> {
  std::map<std::string_view, Subcmd> subcmds;
  std::vector<Opt> globalOpts;
  std::vector<Opt> localOpts;

public:
  enum class ControlFlow : uint8_t {
    Return,
    Continue,
    Fallthrough,
  };
  using enum ControlFlow;

  using CliBase::CliBase;

  Cli& addSubcmd(const Subcmd& subcmd);
  Cli& addOpt(Opt opt);

  bool hasSubcmd(std::string_view name) const noexcept;
  const Subcmd* findSubcmd(std::string_view name) const noexcept;

  rs::Result<void> parseArgs(CliArgsView args) const;
  rs::Result<void> exec(std::string_view subcmd, CliArgsView args) const;

  void printMainHelp() const;
  rs::Result<void> printHelp(CliArgsView args) const;

  // Handles the options every subcommand accepts.  `itr` is advanced past
  // an option argument when the option takes one.
  static rs::Result<ControlFlow>
  handleGlobalOpts(CliArgsView::iterator& itr, CliArgsView::iterator end,
                   std::string_view subcmd = "");

  // Splits `-vq` into `-v -q` and `--opt=value` into `--opt value`.
  static std::vector<std::string> expandOpts(std::span<const char* const> args);

private:
  std::size_t calcMaxOffset() const;
};

const Cli& getCli() noexcept;

} // namespace trellis
