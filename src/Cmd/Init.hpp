#pragma once

#include "Cli.hpp"

namespace trellis {

extern const Subcmd INIT_CMD;

} // namespace trellis
