#include "Git2/Commit.hpp"

#include "Git2/Exception.hpp"
#include "Git2/Oid.hpp"
#include "Git2/Repository.hpp"
#include "Git2/Time.hpp"

#include <git2/commit.h>

namespace git2 {

Commit::~Commit() { git_commit_free(raw); }

Commit& Commit::lookup(const Repository& repo, const Oid& oid) {
  git_commit_free(raw);
  raw = nullptr;
  git2Throw(git_commit_lookup(&raw, repo.raw, oid.raw()));
  return *this;
}

Time Commit::time() const { return { git_commit_time(raw) }; }

} // namespace git2
