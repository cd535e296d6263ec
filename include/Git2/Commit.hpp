#pragma once

#include "Git2/Oid.hpp"
#include "Git2/Repository.hpp"
#include "Git2/Time.hpp"

#include <git2/commit.h>

namespace git2 {

struct Commit {
  git_commit* raw = nullptr;

  Commit() = default;
  ~Commit();

  Commit(const Commit&) = delete;
  Commit(Commit&&) noexcept = delete;
  Commit& operator=(const Commit&) = delete;
  Commit& operator=(Commit&&) noexcept = delete;

  Commit& lookup(const Repository& repo, const Oid& oid);
  Time time() const;
};

} // namespace git2
