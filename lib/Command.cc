#include "Command.hpp"

#include <array>
#include <cerrno>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <optional>
#include <ostream>
#include <poll.h>
#include <rs/result.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>
#include <vector>

namespace trellis {

constexpr std::size_t BUFFER_SIZE = 128;

bool ExitStatus::exitedNormally() const noexcept {
  return WIFEXITED(rawStatus);
}
bool ExitStatus::killedBySignal() const noexcept {
  return WIFSIGNALED(rawStatus);
}
bool ExitStatus::stoppedBySignal() const noexcept {
  return WIFSTOPPED(rawStatus);
}
int ExitStatus::exitCode() const noexcept {
  if (!exitedNormally()) {
    return -1;
  }
  return WEXITSTATUS(rawStatus);
}
int ExitStatus::termSignal() const noexcept {
  if (!killedBySignal()) {
    return -1;
  }
  return WTERMSIG(rawStatus);
}
int ExitStatus::stopSignal() const noexcept {
  if (!stoppedBySignal()) {
    return -1;
  }
  return WSTOPSIG(rawStatus);
}
bool ExitStatus::coreDumped() const noexcept {
  if (!killedBySignal()) {
    return false;
  }
#ifdef WCOREDUMP
  return WCOREDUMP(rawStatus);
#else
  return false;
#endif
}

bool ExitStatus::success() const noexcept {
  return exitedNormally() && exitCode() == EXIT_SUCCESS;
}

std::string ExitStatus::toString() const {
  if (exitedNormally()) {
    return fmt::format("exited with code {}", exitCode());
  } else if (killedBySignal()) {
    return fmt::format("killed by signal {}{}", termSignal(),
                       coreDumped() ? " (core dumped)" : "");
  } else if (stoppedBySignal()) {
    return fmt::format("stopped by signal {}", stopSignal());
  }
  return "unknown status";
}

std::ostream& operator<<(std::ostream& os, const ExitStatus& status) {
  return os << status.toString();
}

static std::string quoteArg(const std::string_view arg) {
  if (!arg.empty()
      && arg.find_first_of(" \t\n\"'\\$`") == std::string_view::npos) {
    return std::string(arg);
  }

  std::string quoted = "'";
  for (const char c : arg) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted += c;
    }
  }
  quoted += '\'';
  return quoted;
}

std::string Command::toString() const {
  std::string res = quoteArg(command);
  for (const std::string& arg : arguments) {
    res += ' ';
    res += quoteArg(arg);
  }
  return res;
}

std::ostream& operator<<(std::ostream& os, const Command& cmd) {
  return os << cmd.toString();
}

static void readPipe(const int fd, std::string& out, bool& open) noexcept {
  std::array<char, BUFFER_SIZE> buffer{};
  const ssize_t count = read(fd, buffer.data(), buffer.size());
  if (count > 0) {
    out.append(buffer.data(), static_cast<std::size_t>(count));
  } else if (count == 0 || (errno != EINTR && errno != EAGAIN)) {
    close(fd);
    open = false;
  }
}

rs::Result<ExitStatus> Child::wait() const noexcept {
  int status{};
  while (waitpid(pid, &status, 0) == -1) {
    if (errno == EINTR) {
      continue;
    }
    rs_bail("waitpid() failed: {}", std::strerror(errno));
  }

  if (stdOutFd != -1) {
    close(stdOutFd);
  }
  if (stdErrFd != -1) {
    close(stdErrFd);
  }
  return rs::Ok(ExitStatus(status));
}

rs::Result<CommandOutput> Child::waitWithOutput() const noexcept {
  std::string stdOutOutput;
  std::string stdErrOutput;

  bool stdOutOpen = stdOutFd != -1;
  bool stdErrOpen = stdErrFd != -1;
  while (stdOutOpen || stdErrOpen) {
    std::array<pollfd, 2> fds{};
    nfds_t numFds = 0;
    if (stdOutOpen) {
      fds[numFds++] = pollfd{ .fd = stdOutFd, .events = POLLIN, .revents = 0 };
    }
    if (stdErrOpen) {
      fds[numFds++] = pollfd{ .fd = stdErrFd, .events = POLLIN, .revents = 0 };
    }

    if (poll(fds.data(), numFds, -1) == -1) {
      if (errno == EINTR) {
        continue;
      }
      rs_bail("poll() failed: {}", std::strerror(errno));
    }

    for (nfds_t i = 0; i < numFds; ++i) {
      if (fds[i].revents == 0) {
        continue;
      }
      if (fds[i].fd == stdOutFd) {
        readPipe(stdOutFd, stdOutOutput, stdOutOpen);
      } else {
        readPipe(stdErrFd, stdErrOutput, stdErrOpen);
      }
    }
  }

  int status{};
  while (waitpid(pid, &status, 0) == -1) {
    if (errno == EINTR) {
      continue;
    }
    rs_bail("waitpid() failed: {}", std::strerror(errno));
  }

  return rs::Ok(CommandOutput{
      .exitStatus = ExitStatus(status),
      .stdOut = std::move(stdOutOutput),
      .stdErr = std::move(stdErrOutput),
  });
}

// Redirects `targetFd` of the child according to `config`.  `pipeFds` is
// only used for `Piped`.
static void setupChildFd(const Command::IOConfig config, const int targetFd,
                         const std::array<int, 2>& pipeFds) noexcept {
  switch (config) {
  case Command::IOConfig::Null: {
    const int nullFd = open("/dev/null", O_WRONLY);
    if (nullFd != -1) {
      dup2(nullFd, targetFd);
      close(nullFd);
    }
    return;
  }
  case Command::IOConfig::Piped:
    close(pipeFds[0]);
    dup2(pipeFds[1], targetFd);
    close(pipeFds[1]);
    return;
  case Command::IOConfig::Inherit:
    return;
  }
}

rs::Result<Child> Command::spawn() const noexcept {
  std::array<int, 2> stdOutPipe{ -1, -1 };
  std::array<int, 2> stdErrPipe{ -1, -1 };

  if (stdOutConfig == IOConfig::Piped && pipe(stdOutPipe.data()) == -1) {
    rs_bail("pipe() failed: {}", std::strerror(errno));
  }
  if (stdErrConfig == IOConfig::Piped && pipe(stdErrPipe.data()) == -1) {
    rs_bail("pipe() failed: {}", std::strerror(errno));
  }

  // Everything the child needs is prepared before fork().
  std::vector<char*> args;
  args.reserve(arguments.size() + 2);
  args.push_back(const_cast<char*>(command.c_str()));
  for (const std::string& arg : arguments) {
    args.push_back(const_cast<char*>(arg.c_str()));
  }
  args.push_back(nullptr);

  const pid_t pid = fork();
  if (pid == -1) {
    rs_bail("fork() failed: {}", std::strerror(errno));
  } else if (pid == 0) {
    setupChildFd(stdOutConfig, STDOUT_FILENO, stdOutPipe);
    setupChildFd(stdErrConfig, STDERR_FILENO, stdErrPipe);

    if (!workingDirectory.empty()
        && chdir(workingDirectory.c_str()) == -1) {
      fmt::print(stderr, "chdir({}) failed: {}\n", workingDirectory.string(),
                 std::strerror(errno));
      _exit(127);
    }
    for (const auto& [name, value] : envVars) {
      setenv(name.c_str(), value.c_str(), 1);
    }

    execvp(command.c_str(), args.data());
    fmt::print(stderr, "failed to execute `{}`: {}\n", command,
               std::strerror(errno));
    _exit(127);
  }

  int stdOutFd = -1;
  if (stdOutConfig == IOConfig::Piped) {
    close(stdOutPipe[1]);
    stdOutFd = stdOutPipe[0];
  }
  int stdErrFd = -1;
  if (stdErrConfig == IOConfig::Piped) {
    close(stdErrPipe[1]);
    stdErrFd = stdErrPipe[0];
  }
  return rs::Ok(Child(pid, stdOutFd, stdErrFd));
}

rs::Result<CommandOutput> Command::output() const noexcept {
  Command cmd = *this;
  if (cmd.stdOutConfig == IOConfig::Inherit) {
    cmd.stdOutConfig = IOConfig::Piped;
  }
  if (cmd.stdErrConfig == IOConfig::Inherit) {
    cmd.stdErrConfig = IOConfig::Piped;
  }
  return rs_try(cmd.spawn()).waitWithOutput();
}

static bool isExecutableFile(const fs::path& path) noexcept {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    return false;
  }
  return access(path.c_str(), X_OK) == 0;
}

std::optional<fs::path> findExecutable(const std::string_view name) noexcept {
  if (name.empty()) {
    return std::nullopt;
  }
  if (name.contains('/')) {
    const fs::path path(name);
    if (isExecutableFile(path)) {
      return path;
    }
    return std::nullopt;
  }

  const char* pathEnv = std::getenv("PATH");
  if (pathEnv == nullptr) {
    return std::nullopt;
  }

  std::string_view dirs(pathEnv);
  while (!dirs.empty()) {
    const std::size_t sep = dirs.find(':');
    const std::string_view dir = dirs.substr(0, sep);
    dirs = sep == std::string_view::npos ? std::string_view()
                                         : dirs.substr(sep + 1);

    // An empty entry means the current directory.
    const fs::path candidate = fs::path(dir.empty() ? "." : dir) / name;
    if (isExecutableFile(candidate)) {
      return candidate;
    }
  }
  return std::nullopt;
}

} // namespace trellis

#ifdef TRELLIS_TEST

#  include <rs/tests.hpp>

namespace trellis {

static void testExitStatus() {
  tests::assertTrue(ExitStatus().success());
  tests::assertTrue(ExitStatus(0).exitedNormally());

  const CommandOutput failed =
      Command("sh", { "-c", "exit 3" }).output().unwrap();
  tests::assertFalse(failed.exitStatus.success());
  tests::assertEq(failed.exitStatus.exitCode(), 3);
  tests::assertEq(failed.exitStatus.toString(), "exited with code 3");

  tests::pass();
}

static void testOutput() {
  const CommandOutput output =
      Command("sh", { "-c", "echo out; echo err 1>&2" }).output().unwrap();
  tests::assertTrue(output.exitStatus.success());
  tests::assertEq(output.stdOut, "out\n");
  tests::assertEq(output.stdErr, "err\n");

  Command env("sh", { "-c", "printf %s \"$TRELLIS_PROBE\"" });
  env.setEnv("TRELLIS_PROBE", "probe");
  tests::assertEq(env.output().unwrap().stdOut, "probe");

  Command pwd("pwd");
  pwd.setWorkingDirectory("/");
  tests::assertEq(pwd.output().unwrap().stdOut, "/\n");

  tests::assertFalse(Command("false").output().unwrap().exitStatus.success());

  tests::pass();
}

static void testToString() {
  Command cmd("dotnet");
  cmd.addArg("build").addArg("my project").addArg("it's");
  tests::assertEq(cmd.toString(), R"(dotnet build 'my project' 'it'\''s')");
  tests::assertEq(Command("tool", { "" }).toString(), "tool ''");

  tests::pass();
}

static void testFindExecutable() {
  tests::assertTrue(findExecutable("sh").has_value());
  tests::assertTrue(findExecutable("/bin/sh").has_value());
  tests::assertFalse(findExecutable("trellis-definitely-missing-tool").has_value());
  tests::assertFalse(findExecutable("").has_value());

  tests::pass();
}

} // namespace trellis

int main() {
  trellis::testExitStatus();
  trellis::testOutput();
  trellis::testToString();
  trellis::testFindExecutable();
}

#endif
