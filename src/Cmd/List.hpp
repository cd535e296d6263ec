#pragma once

#include "Cli.hpp"

namespace trellis {

extern const Subcmd LIST_CMD;

} // namespace trellis
