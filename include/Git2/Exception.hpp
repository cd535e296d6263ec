#pragma once

#include <exception>
#include <git2/errors.h>
#include <string>

namespace git2 {

struct Exception final : public std::exception {
  explicit Exception(int code);

  const char* what() const noexcept override { return msg.c_str(); }
  int code() const noexcept { return errorCode; }
  git_error_t category() const noexcept { return cat; }

private:
  std::string msg;
  int errorCode;
  git_error_t cat{ GIT_ERROR_NONE };
};

// Throws git2::Exception when `res` is a libgit2 error code.
int git2Throw(int res);

template <typename T>
T* git2Throw(T* res) {
  if (res == nullptr) {
    throw Exception(GIT_ERROR);
  }
  return res;
}

} // namespace git2
