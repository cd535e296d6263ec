#pragma once

#include "Cli.hpp"

namespace trellis {

extern const Subcmd RUN_CMD;

} // namespace trellis
