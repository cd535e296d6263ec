#pragma once

#include "Git2/Commit.hpp"     // IWYU pragma: export
#include "Git2/Exception.hpp"  // IWYU pragma: export
#include "Git2/Global.hpp"     // IWYU pragma: export
#include "Git2/Oid.hpp"        // IWYU pragma: export
#include "Git2/Repository.hpp" // IWYU pragma: export
#include "Git2/Time.hpp"       // IWYU pragma: export
#include "Git2/Version.hpp"    // IWYU pragma: export
