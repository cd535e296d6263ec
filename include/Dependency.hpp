#pragma once

#include <string>
#include <utility>
#include <variant>

namespace trellis {

// A package restored by the build tool, e.g. `"Serilog" = "3.1.1"`.
struct PackageDependency {
  std::string name;
  std::string versionReq;

  PackageDependency(std::string name, std::string versionReq)
      : name(std::move(name)), versionReq(std::move(versionReq)) {}
};

// Another workspace member, e.g. `acme-util = { path = "../util" }`.
struct PathDependency {
  std::string name;
  std::string path;

  PathDependency(std::string name, std::string path)
      : name(std::move(name)), path(std::move(path)) {}
};

using Dependency = std::variant<PackageDependency, PathDependency>;

inline const std::string& depName(const Dependency& dep) noexcept {
  return std::visit(
      [](const auto& d) -> const std::string& { return d.name; }, dep);
}

} // namespace trellis
