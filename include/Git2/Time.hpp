#pragma once

#include <git2/types.h>
#include <string>

namespace git2 {

struct Time {
  git_time_t time;

  // UTC date as `YYYY-MM-DD`.
  std::string toDateString() const;
};

} // namespace git2
