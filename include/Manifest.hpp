#pragma once

#include "Dependency.hpp"
#include "Semver.hpp"

#include <array>
#include <cstdint>
#include <filesystem>
#include <fmt/format.h>
#include <map>
#include <optional>
#include <rs/result.hpp>
#include <string>
#include <string_view>
#include <toml.hpp>
#include <utility>
#include <vector>

namespace trellis {

namespace fs = std::filesystem;

enum class ProjectKind : uint8_t {
  Library,
  Executable,
  Test,
};

rs::Result<ProjectKind> parseProjectKind(std::string_view str) noexcept;
std::string_view toString(ProjectKind kind) noexcept;

// Which members a per-project task runs over.
enum class ProjectFilter : uint8_t {
  All,
  Library,
  Executable,
  Test,
  Packable,
};

rs::Result<ProjectFilter> parseProjectFilter(std::string_view str) noexcept;
std::string_view toString(ProjectFilter filter) noexcept;

// A command line whose elements may contain `{placeholder}` fields.
using CommandTemplate = std::vector<std::string>;

inline constexpr std::array<std::string_view, 3> TOOL_ROLES = {
  "build", "package", "coverage"
};
inline constexpr std::array<std::string_view, 6> ACTION_NAMES = {
  "restore", "compile", "test", "coverage", "pack", "publish"
};

struct ProjectManifest {
  static constexpr const char* FILE_NAME = "project.toml";

  fs::path path;
  std::string name;
  std::optional<ProjectKind> kind;
  std::optional<bool> packable;
  std::vector<Dependency> dependencies;

  static rs::Result<ProjectManifest> tryParse(fs::path path) noexcept;
  static rs::Result<ProjectManifest> tryFromToml(const toml::value& data,
                                                 fs::path path) noexcept;
};

struct WorkspaceSection {
  std::string name;
  Version version;
  std::vector<std::string> members;
  std::vector<std::string> exclude;
  std::string artifacts = "trellis-out";
  std::string defaultTask = "default";
  std::vector<std::string> clean;

  static rs::Result<WorkspaceSection>
  tryFromToml(const toml::value& val) noexcept;
};

struct PublishSection {
  std::optional<std::string> feed;
  std::string apiKeyEnv = "TRELLIS_API_KEY";

  static rs::Result<PublishSection>
  tryFromToml(const toml::value& val) noexcept;
};

// `[tasks.<name>]`
struct CustomTask {
  std::string name;
  std::string description;
  std::vector<std::string> dependsOn;
  std::optional<CommandTemplate> run;
  std::optional<ProjectFilter> forEach;
};

struct WorkspaceManifest {
  static constexpr const char* FILE_NAME = "trellis.toml";

  fs::path path;
  WorkspaceSection workspace;
  std::map<std::string, std::string> tools;
  std::map<std::string, CommandTemplate> actions;
  PublishSection publish;
  std::vector<CustomTask> tasks; // sorted by name

  fs::path rootDir() const { return path.parent_path(); }

  static rs::Result<WorkspaceManifest>
  tryParse(fs::path path = fs::current_path() / FILE_NAME,
           bool findParents = true) noexcept;
  static rs::Result<WorkspaceManifest> tryFromToml(const toml::value& data,
                                                   fs::path path) noexcept;
  static rs::Result<fs::path> findPath(fs::path candidateDir) noexcept;
};

rs::Result<void> validateProjectName(std::string_view name,
                                     std::string_view what = "project name");

// toml11 keeps its color flag in a global; set it from one thread only.
void syncTomlColor() noexcept;

} // namespace trellis

template <>
struct fmt::formatter<trellis::ProjectKind> : formatter<std::string_view> {
  auto format(const trellis::ProjectKind kind, format_context& ctx) const {
    return formatter<std::string_view>::format(trellis::toString(kind), ctx);
  }
};

template <>
struct fmt::formatter<trellis::ProjectFilter> : formatter<std::string_view> {
  auto format(const trellis::ProjectFilter filter,
              format_context& ctx) const {
    return formatter<std::string_view>::format(trellis::toString(filter), ctx);
  }
};
