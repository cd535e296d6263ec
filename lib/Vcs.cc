#include "Vcs.hpp"

#include "Git2.hpp"

#include <filesystem>
#include <memory>
#include <rs/result.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <system_error>
#include <utility>

namespace trellis {

rs::Result<CommitInfo> readHeadCommit(const fs::path& dir) {
  git2::ensureInitialized();

  git2::Repository repo;
  try {
    repo.discover(dir.string());
  } catch (const git2::Exception& e) {
    spdlog::debug("Opening a repository at {}: {}", dir.string(), e.what());
    rs_bail("not a git repository");
  }

  try {
    const git2::Oid oid = repo.refNameToId("HEAD");
    git2::Commit commit;
    commit.lookup(repo, oid);

    std::string hash = oid.toString();
    std::string shortHash = hash.substr(0, 7);
    return rs::Ok(CommitInfo{ .hash = std::move(hash),
                              .shortHash = std::move(shortHash),
                              .date = commit.time().toDateString() });
  } catch (const git2::Exception& e) {
    rs_bail("failed to read the HEAD commit: {}", e.what());
  }
}

IgnoreMatcher::IgnoreMatcher(const fs::path& dir) {
  git2::ensureInitialized();

  auto candidate = std::make_unique<git2::Repository>();
  try {
    candidate->discover(dir.string());
  } catch (const git2::Exception& e) {
    spdlog::debug("No repository at {}; nothing is ignored: {}", dir.string(),
                  e.what());
    return;
  }
  workdir = candidate->workdir();
  if (workdir.empty()) {
    return; // bare repository
  }
  repo = std::move(candidate);
}

IgnoreMatcher::~IgnoreMatcher() = default;

bool IgnoreMatcher::isIgnored(const fs::path& path) const {
  if (repo == nullptr) {
    return false;
  }

  std::error_code ec;
  const fs::path rel = fs::relative(path, workdir, ec);
  if (ec || rel.empty() || rel.native().starts_with("..")) {
    return false;
  }
  std::string query = rel.generic_string();
  if (fs::is_directory(path, ec)) {
    query += '/';
  }
  try {
    return repo->isIgnored(query);
  } catch (const git2::Exception& e) {
    spdlog::debug("Checking ignore rules for {}: {}", rel.string(), e.what());
    return false;
  }
}

} // namespace trellis

#ifdef TRELLIS_TEST

#  include "Command.hpp"

#  include <cstdlib>
#  include <fstream>
#  include <rs/tests.hpp>
#  include <stdexcept>
#  include <vector>

namespace trellis {

static fs::path makeTempDir() {
  std::string tmpl = (fs::temp_directory_path() / "trellis-vcs-XXXXXX").string();
  if (mkdtemp(tmpl.data()) == nullptr) {
    throw std::runtime_error("mkdtemp failed");
  }
  return tmpl;
}

static void testOutsideRepository() {
  const fs::path dir = makeTempDir();
  // A temp dir may still sit inside a checkout on some hosts.
  git2::ensureInitialized();
  git2::Repository probe;
  bool inRepo = true;
  try {
    probe.discover(dir.string());
  } catch (const git2::Exception&) {
    inRepo = false;
  }

  if (!inRepo) {
    tests::assertEq(readHeadCommit(dir).unwrap_err()->what(),
                    "not a git repository");
    const IgnoreMatcher matcher(dir);
    tests::assertFalse(matcher.inRepository());
    tests::assertFalse(matcher.isIgnored(dir / "bin"));
  }
  fs::remove_all(dir);

  tests::pass();
}

// Runs git in `dir` with a fixed identity and commit date.
static std::string git(const fs::path& dir, std::vector<std::string> args) {
  Command cmd("git", std::move(args));
  cmd.setWorkingDirectory(dir)
      .setEnv("GIT_AUTHOR_NAME", "trellis")
      .setEnv("GIT_AUTHOR_EMAIL", "trellis@example.com")
      .setEnv("GIT_AUTHOR_DATE", "2024-03-05T12:00:00Z")
      .setEnv("GIT_COMMITTER_NAME", "trellis")
      .setEnv("GIT_COMMITTER_EMAIL", "trellis@example.com")
      .setEnv("GIT_COMMITTER_DATE", "2024-03-05T12:00:00Z");
  const CommandOutput output = cmd.output().unwrap();
  if (!output.exitStatus.success()) {
    throw std::runtime_error("git failed: " + output.stdErr);
  }
  return output.stdOut;
}

static void testInsideRepository() {
  if (!findExecutable("git").has_value()) {
    tests::pass();
    return;
  }

  const fs::path dir = makeTempDir();
  git(dir, { "init", "-q" });
  std::ofstream(dir / ".gitignore") << "vendor/\n";
  fs::create_directories(dir / "vendor/lib");
  fs::create_directories(dir / "src");
  git(dir, { "-c", "commit.gpgsign=false", "commit", "-q", "--allow-empty",
             "-m", "init" });
  const std::string head = git(dir, { "rev-parse", "HEAD" });

  const CommitInfo info = readHeadCommit(dir / "src").unwrap();
  tests::assertEq(info.hash + "\n", head);
  tests::assertEq(info.shortHash, info.hash.substr(0, 7));
  tests::assertEq(info.date, "2024-03-05");

  const IgnoreMatcher matcher(dir);
  tests::assertTrue(matcher.inRepository());
  tests::assertTrue(matcher.isIgnored(dir / "vendor"));
  tests::assertTrue(matcher.isIgnored(dir / "vendor/lib"));
  tests::assertFalse(matcher.isIgnored(dir / "src"));
  fs::remove_all(dir);

  tests::pass();
}

static void testDateString() {
  tests::assertEq(git2::Time{ 0 }.toDateString(), "1970-01-01");
  tests::assertEq(git2::Time{ 1700000000 }.toDateString(), "2023-11-14");

  tests::pass();
}

} // namespace trellis

int main() {
  trellis::testOutsideRepository();
  trellis::testInsideRepository();
  trellis::testDateString();
}

#endif
