#include "Git2/Exception.hpp"

#include <git2/errors.h>

namespace git2 {

Exception::Exception(const int code) : errorCode(code) {
  if (const git_error* error = git_error_last();
      error != nullptr && error->message != nullptr) {
    msg = error->message;
    cat = static_cast<git_error_t>(error->klass);
  } else {
    msg = "unknown libgit2 error";
  }
}

int git2Throw(const int res) {
  if (res < GIT_OK) {
    throw Exception(res);
  }
  return res;
}

} // namespace git2
