#pragma once

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fmt/format.h>
#include <optional>
#include <ostream>
#include <rs/result.hpp>
#include <string>
#include <string_view>
#include <sys/types.h>
#include <utility>
#include <vector>

namespace trellis {

namespace fs = std::filesystem;

class ExitStatus {
  int rawStatus{ EXIT_SUCCESS };

public:
  ExitStatus() noexcept = default;
  explicit ExitStatus(const int rawStatus) noexcept : rawStatus(rawStatus) {}

  bool exitedNormally() const noexcept;
  bool killedBySignal() const noexcept;
  bool stoppedBySignal() const noexcept;
  int exitCode() const noexcept;
  int termSignal() const noexcept;
  int stopSignal() const noexcept;
  bool coreDumped() const noexcept;

  bool success() const noexcept;
  std::string toString() const;
};

struct CommandOutput {
  ExitStatus exitStatus;
  std::string stdOut;
  std::string stdErr;
};

class Child {
  pid_t pid;
  int stdOutFd;
  int stdErrFd;

  Child(const pid_t pid, const int stdOutFd, const int stdErrFd) noexcept
      : pid(pid), stdOutFd(stdOutFd), stdErrFd(stdErrFd) {}

  friend struct Command;

public:
  rs::Result<ExitStatus> wait() const noexcept;
  rs::Result<CommandOutput> waitWithOutput() const noexcept;
};

struct Command {
  enum class IOConfig : uint8_t {
    Null,
    Inherit,
    Piped,
  };

  std::string command;
  std::vector<std::string> arguments;
  fs::path workingDirectory;
  std::vector<std::pair<std::string, std::string>> envVars;
  IOConfig stdOutConfig = IOConfig::Inherit;
  IOConfig stdErrConfig = IOConfig::Inherit;

  explicit Command(std::string_view cmd) : command(cmd) {}
  Command(std::string_view cmd, std::vector<std::string> args)
      : command(cmd), arguments(std::move(args)) {}

  Command& addArg(const std::string_view arg) {
    arguments.emplace_back(arg);
    return *this;
  }
  Command& addArgs(const std::vector<std::string>& args) {
    arguments.insert(arguments.end(), args.begin(), args.end());
    return *this;
  }
  Command& setStdOutConfig(const IOConfig config) noexcept {
    stdOutConfig = config;
    return *this;
  }
  Command& setStdErrConfig(const IOConfig config) noexcept {
    stdErrConfig = config;
    return *this;
  }
  Command& setWorkingDirectory(fs::path dir) {
    workingDirectory = std::move(dir);
    return *this;
  }
  Command& setEnv(std::string name, std::string value) {
    envVars.emplace_back(std::move(name), std::move(value));
    return *this;
  }

  std::string toString() const;

  rs::Result<Child> spawn() const noexcept;
  rs::Result<CommandOutput> output() const noexcept;
};

std::ostream& operator<<(std::ostream& os, const ExitStatus& status);
std::ostream& operator<<(std::ostream& os, const Command& cmd);

// Searches `PATH` for an executable named `name`.  A name that contains a
// slash is checked as a path as-is.
std::optional<fs::path> findExecutable(std::string_view name) noexcept;

} // namespace trellis

template <>
struct fmt::formatter<trellis::ExitStatus> : formatter<std::string> {
  auto format(const trellis::ExitStatus& status, format_context& ctx) const {
    return formatter<std::string>::format(status.toString(), ctx);
  }
};

template <>
struct fmt::formatter<trellis::Command> : formatter<std::string> {
  auto format(const trellis::Command& cmd, format_context& ctx) const {
    return formatter<std::string>::format(cmd.toString(), ctx);
  }
};
