#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <rs/result.hpp>
#include <string>
#include <string_view>

namespace trellis {

namespace fs = std::filesystem;

// Returns the variable's value unless it is unset or empty.
std::optional<std::string> getEnvVar(const char* name);

// `build` -> `TRELLIS_BUILD`
std::string toolEnvVar(std::string_view role);

// Locates the program for a tool role.  `TRELLIS_<ROLE>` wins over the
// `[tools]` entry; a value containing `/` is a path relative to `baseDir`,
// anything else is searched on `PATH`.
rs::Result<fs::path>
resolveTool(std::string_view role,
            const std::map<std::string, std::string>& configured,
            const fs::path& baseDir);

} // namespace trellis
