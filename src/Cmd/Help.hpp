#pragma once

#include "Cli.hpp"

namespace trellis {

extern const Subcmd HELP_CMD;

} // namespace trellis
