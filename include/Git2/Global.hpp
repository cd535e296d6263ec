#pragma once

namespace git2 {

struct GlobalState {
  GlobalState();
  ~GlobalState();

  GlobalState(const GlobalState&) = delete;
  GlobalState(GlobalState&&) noexcept = delete;
  GlobalState& operator=(const GlobalState&) = delete;
  GlobalState& operator=(GlobalState&&) noexcept = delete;
};

// Initializes libgit2 once for the lifetime of the process.
void ensureInitialized();

} // namespace git2
