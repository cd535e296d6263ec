#include "Git2/Version.hpp"

#include "Git2/Exception.hpp"

#include <fmt/format.h>
#include <git2/common.h>
#include <string>

namespace git2 {

Version::Version() {
  git2Throw(git_libgit2_version(&major, &minor, &revision));
}

std::string Version::toString() const {
  return fmt::format("{}.{}.{}", major, minor, revision);
}

} // namespace git2
