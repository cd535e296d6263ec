#include "Version.hpp"

#include "Cli.hpp"
#include "Diag.hpp"
#include "Git2.hpp"

#include <fmt/format.h>
#include <rs/result.hpp>
#include <string>
#include <string_view>

#ifndef TRELLIS_PKG_VERSION
#  error "TRELLIS_PKG_VERSION is not defined"
#endif
#ifndef TRELLIS_COMMIT_HASH
#  define TRELLIS_COMMIT_HASH ""
#endif
#ifndef TRELLIS_COMMIT_SHORT_HASH
#  define TRELLIS_COMMIT_SHORT_HASH ""
#endif
#ifndef TRELLIS_COMMIT_DATE
#  define TRELLIS_COMMIT_DATE ""
#endif

namespace trellis {

static rs::Result<void> versionMain(CliArgsView args);

const Subcmd VERSION_CMD = //
    Subcmd{ "version" }
        .setDesc("Show version information")
        .setMainFn(versionMain);

static std::string compilerVersion() {
#if defined(__clang__)
  return fmt::format("clang {}.{}.{}", __clang_major__, __clang_minor__,
                     __clang_patchlevel__);
#elif defined(__GNUC__)
  return fmt::format("gcc {}.{}.{}", __GNUC__, __GNUC_MINOR__,
                     __GNUC_PATCHLEVEL__);
#else
  return "unknown";
#endif
}

static rs::Result<void> versionMain(const CliArgsView args) {
  // Parse args
  for (auto itr = args.begin(); itr != args.end(); ++itr) {
    const std::string_view arg = *itr;

    const auto control =
        rs_try(Cli::handleGlobalOpts(itr, args.end(), "version"));
    if (control == Cli::Return) {
      return rs::Ok();
    } else if (control == Cli::Continue) {
      continue;
    } else {
      return VERSION_CMD.noSuchArg(arg);
    }
  }

  constexpr std::string_view shortHash = TRELLIS_COMMIT_SHORT_HASH;
  constexpr std::string_view commitDate = TRELLIS_COMMIT_DATE;
  if (shortHash.empty()) {
    fmt::print("trellis {}\n", TRELLIS_PKG_VERSION);
  } else {
    fmt::print("trellis {} ({} {})\n", TRELLIS_PKG_VERSION, shortHash,
               commitDate);
  }

  if (isVerbose()) {
    fmt::print("release: {}\n", TRELLIS_PKG_VERSION);
    if (!shortHash.empty()) {
      fmt::print("commit-hash: {}\n", TRELLIS_COMMIT_HASH);
      fmt::print("commit-date: {}\n", commitDate);
    }
    fmt::print("compiler: {}\n", compilerVersion());
    fmt::print("libgit2: {}\n", git2::Version().toString());
  }
  return rs::Ok();
}

} // namespace trellis
