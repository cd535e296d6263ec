#include "Init.hpp"

#include "Cli.hpp"
#include "Diag.hpp"
#include "Manifest.hpp"
#include "Vcs.hpp"

#include <algorithm>
#include <filesystem>
#include <fmt/format.h>
#include <fstream>
#include <rs/result.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace trellis {

static rs::Result<void> initMain(CliArgsView args);

const Subcmd INIT_CMD = //
    Subcmd{ "init" }
        .setDesc("Create a trellis workspace in an existing directory")
        .setMainFn(initMain);

// Directories below `root` that hold a project manifest, relative to `root`.
static rs::Result<std::vector<std::string>>
discoverProjects(const fs::path& root) {
  const IgnoreMatcher ignore(root);
  const WorkspaceSection defaults;

  std::vector<std::string> members;
  std::error_code ec;
  fs::recursive_directory_iterator itr(
      root, fs::directory_options::skip_permission_denied, ec);
  rs_ensure(!ec, "failed to read {}: {}", root.string(), ec.message());

  for (; itr != fs::recursive_directory_iterator(); itr.increment(ec)) {
    rs_ensure(!ec, "failed to read {}: {}", root.string(), ec.message());
    if (!itr->is_directory()) {
      continue;
    }

    const fs::path& dir = itr->path();
    const std::string dirName = dir.filename().string();
    if (dirName.starts_with('.') || dir == root / defaults.artifacts
        || ignore.isIgnored(dir)) {
      spdlog::debug("Skipping {}", dir.string());
      itr.disable_recursion_pending();
      continue;
    }
    if (fs::is_regular_file(dir / ProjectManifest::FILE_NAME)) {
      members.push_back(dir.lexically_relative(root).generic_string());
    }
  }

  std::ranges::sort(members);
  return rs::Ok(members);
}

static std::string createTrellisToml(const std::string_view name,
                                     const std::vector<std::string>& members) {
  std::string memberLines;
  for (const std::string& member : members) {
    memberLines += fmt::format("  \"{}\",\n", member);
  }
  return fmt::format(R"([workspace]
name = "{}"
version = "0.1.0"
members = [
{}]

[tools]
# build = "dotnet"

[actions]
# restore = ["{{build}}", "restore", "{{project_dir}}"]
# compile = ["{{build}}", "build", "{{project_dir}}", "-c", "{{configuration}}"]
# test = ["{{build}}", "test", "{{project_dir}}", "-c", "{{configuration}}"]
)",
                     name, memberLines);
}

static rs::Result<void> initMain(const CliArgsView args) {
  // Parse args
  for (auto itr = args.begin(); itr != args.end(); ++itr) {
    const std::string_view arg = *itr;

    const auto control = rs_try(Cli::handleGlobalOpts(itr, args.end(), "init"));
    if (control == Cli::Return) {
      return rs::Ok();
    } else if (control == Cli::Continue) {
      continue;
    } else {
      return INIT_CMD.noSuchArg(arg);
    }
  }

  rs_ensure(!fs::exists(WorkspaceManifest::FILE_NAME),
            "cannot initialize an existing trellis workspace");

  const fs::path root = fs::current_path();
  const std::string name = root.filename().string();
  rs_try(validateProjectName(name, "workspace name"));

  const std::vector<std::string> members = rs_try(discoverProjects(root));
  if (members.empty()) {
    Diag::warn("no `{}` found below {}", ProjectManifest::FILE_NAME,
               root.string());
  }

  std::ofstream ofs(root / WorkspaceManifest::FILE_NAME);
  ofs << createTrellisToml(name, members);
  rs_ensure(ofs.good(), "failed to write {}", WorkspaceManifest::FILE_NAME);

  Diag::info("Created", "workspace `{}` with {} project(s)", name,
             members.size());
  return rs::Ok();
}

} // namespace trellis
