#pragma once

#include "Cli.hpp"

namespace trellis {

extern const Subcmd PROJECTS_CMD;

} // namespace trellis
