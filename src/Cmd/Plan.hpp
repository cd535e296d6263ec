#pragma once

#include "Cli.hpp"

namespace trellis {

extern const Subcmd PLAN_CMD;

} // namespace trellis
