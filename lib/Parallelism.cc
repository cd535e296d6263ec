#include "Parallelism.hpp"

#include <cstddef>
#include <memory>
#include <spdlog/spdlog.h>
#include <tbb/global_control.h>

namespace trellis {

static std::unique_ptr<tbb::global_control>& parallelism() noexcept {
  static std::unique_ptr<tbb::global_control> control;
  return control;
}

void setParallelism(const std::size_t numThreads) noexcept {
  const std::size_t allowed = numThreads == 0 ? 1 : numThreads;
  spdlog::debug("Setting parallelism to {}", allowed);
  parallelism() = std::make_unique<tbb::global_control>(
      tbb::global_control::max_allowed_parallelism, allowed);
}

std::size_t getParallelism() noexcept {
  return tbb::global_control::active_value(
      tbb::global_control::max_allowed_parallelism);
}

bool isParallel() noexcept { return getParallelism() > 1; }

} // namespace trellis
