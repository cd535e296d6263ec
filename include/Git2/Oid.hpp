#pragma once

#include <git2/oid.h>
#include <string>

namespace git2 {

class Oid {
  git_oid oid{};

public:
  Oid() = default;
  explicit Oid(const git_oid& oid) : oid(oid) {}

  git_oid* raw() noexcept { return &oid; }
  const git_oid* raw() const noexcept { return &oid; }

  std::string toString() const;
};

} // namespace git2
