#pragma once

#include <filesystem>
#include <memory>
#include <rs/result.hpp>
#include <string>

namespace git2 {
struct Repository;
} // namespace git2

namespace trellis {

namespace fs = std::filesystem;

struct CommitInfo {
  std::string hash;
  std::string shortHash;
  std::string date; // YYYY-MM-DD, UTC
};

// HEAD of the repository containing `dir`.
rs::Result<CommitInfo> readHeadCommit(const fs::path& dir);

// Answers .gitignore queries for paths below `dir`; outside a repository
// nothing is ignored.
class IgnoreMatcher {
  std::unique_ptr<git2::Repository> repo;
  fs::path workdir;

public:
  explicit IgnoreMatcher(const fs::path& dir);
  ~IgnoreMatcher();

  IgnoreMatcher(const IgnoreMatcher&) = delete;
  IgnoreMatcher& operator=(const IgnoreMatcher&) = delete;

  bool inRepository() const noexcept { return repo != nullptr; }
  bool isIgnored(const fs::path& path) const;
};

} // namespace trellis
