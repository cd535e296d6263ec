#pragma once

#include "Cli.hpp"

namespace trellis {

extern const Subcmd VERSION_CMD;

} // namespace trellis
