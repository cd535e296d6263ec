#include "Git2/Oid.hpp"

#include <array>
#include <git2/oid.h>
#include <string>

namespace git2 {

std::string Oid::toString() const {
  std::array<char, GIT_OID_HEXSZ + 1> buf{};
  git_oid_tostr(buf.data(), buf.size(), &oid);
  return buf.data();
}

} // namespace git2
