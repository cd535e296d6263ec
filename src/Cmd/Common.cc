#include "Common.hpp"

#include "Parallelism.hpp"

#include <charconv>
#include <cstdint>
#include <rs/result.hpp>
#include <string_view>
#include <system_error>

namespace trellis {

rs::Result<void> parseJobs(const std::string_view arg) {
  uint64_t numThreads{};
  const auto [ptr, ec] = std::from_chars(arg.begin(), arg.end(), numThreads);
  rs_ensure(ec == std::errc() && ptr == arg.end() && numThreads > 0,
            "invalid number of threads: {}", arg);
  setParallelism(numThreads);
  return rs::Ok();
}

} // namespace trellis
