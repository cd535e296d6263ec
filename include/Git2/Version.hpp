#pragma once

#include <string>

namespace git2 {

// The version of the linked libgit2.
struct Version {
  int major{};
  int minor{};
  int revision{};

  Version();
  std::string toString() const;
};

} // namespace git2
