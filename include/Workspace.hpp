#pragma once

#include "Manifest.hpp"

#include <cstddef>
#include <filesystem>
#include <rs/result.hpp>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace trellis {

namespace fs = std::filesystem;

struct Project {
  fs::path rootPath;
  fs::path relPath; // relative to the workspace root
  ProjectManifest manifest;
  ProjectKind kind = ProjectKind::Library;
  bool packable = false;
  // Names of the members this project depends on by path.
  std::vector<std::string> memberDeps;

  const std::string& name() const noexcept { return manifest.name; }
  bool matches(ProjectFilter filter) const noexcept;
};

ProjectKind classifyProject(const ProjectManifest& manifest,
                            const fs::path& relPath) noexcept;

class Workspace {
  WorkspaceManifest manifest_;
  std::vector<Project> members_;     // sorted by relative path
  std::vector<std::size_t> order;    // indices into members_, deps first

  explicit Workspace(WorkspaceManifest manifest)
      : manifest_(std::move(manifest)) {}

  rs::Result<void> loadMembers();
  rs::Result<void> computeBuildOrder();

public:
  static rs::Result<Workspace> load(WorkspaceManifest manifest);

  const WorkspaceManifest& manifest() const noexcept { return manifest_; }
  fs::path rootDir() const { return manifest_.rootDir(); }
  fs::path artifactsDir() const {
    return rootDir() / manifest_.workspace.artifacts;
  }

  const std::vector<Project>& members() const noexcept { return members_; }
  std::vector<const Project*> buildOrder() const;
  std::vector<const Project*> membersOf(ProjectFilter filter) const;
  const Project* find(std::string_view name) const noexcept;
};

// Member directories named by `members` globs, minus `exclude`, relative to
// `root` and sorted.
rs::Result<std::vector<fs::path>>
expandMembers(const fs::path& root, const std::vector<std::string>& members,
              const std::vector<std::string>& exclude);

} // namespace trellis
