#pragma once

#include "Git2/Oid.hpp"

#include <filesystem>
#include <git2/repository.h>
#include <string>

namespace git2 {

struct Repository {
  git_repository* raw = nullptr;

  Repository() = default;
  ~Repository();

  Repository(const Repository&) = delete;
  Repository(Repository&&) noexcept = delete;
  Repository& operator=(const Repository&) = delete;
  Repository& operator=(Repository&&) noexcept = delete;

  // Opens the repository containing `path`, searching its parents.
  Repository& discover(const std::string& path);

  std::filesystem::path workdir() const;
  Oid refNameToId(const std::string& refname) const;
  // `path` is relative to the working directory.
  bool isIgnored(const std::string& path) const;
};

} // namespace git2
