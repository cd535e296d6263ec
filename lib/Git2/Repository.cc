#include "Git2/Repository.hpp"

#include "Git2/Exception.hpp"
#include "Git2/Oid.hpp"

#include <filesystem>
#include <git2/ignore.h>
#include <git2/refs.h>
#include <git2/repository.h>
#include <string>

namespace git2 {

Repository::~Repository() { git_repository_free(raw); }

Repository& Repository::discover(const std::string& path) {
  git_repository_free(raw);
  raw = nullptr;
  git2Throw(git_repository_open_ext(&raw, path.c_str(), 0, nullptr));
  return *this;
}

std::filesystem::path Repository::workdir() const {
  const char* dir = git_repository_workdir(raw);
  return dir != nullptr ? std::filesystem::path(dir) : std::filesystem::path();
}

Oid Repository::refNameToId(const std::string& refname) const {
  Oid oid;
  git2Throw(git_reference_name_to_id(oid.raw(), raw, refname.c_str()));
  return oid;
}

bool Repository::isIgnored(const std::string& path) const {
  int ignored = 0;
  git2Throw(git_ignore_path_is_ignored(&ignored, raw, path.c_str()));
  return ignored == 1;
}

} // namespace git2
