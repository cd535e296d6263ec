#pragma once

#include <cstddef>

namespace trellis {

void setParallelism(std::size_t numThreads) noexcept;
std::size_t getParallelism() noexcept;
bool isParallel() noexcept;

} // namespace trellis
