#pragma once

#include "Cli.hpp"

#include <rs/result.hpp>
#include <string_view>

namespace trellis {

inline const Opt OPT_RELEASE =
    Opt{ "--release" }.setShort("-r").setDesc(
        "Use the `release` configuration");
inline const Opt OPT_CONFIGURATION =
    Opt{ "--configuration" }
        .setShort("-c")
        .setDesc("Build configuration passed to the tools")
        .setPlaceholder("<NAME>")
        .setDefault("debug");
inline const Opt OPT_JOBS =
    Opt{ "--jobs" }
        .setShort("-j")
        .setDesc("Number of threads used to load the workspace")
        .setPlaceholder("<NUM>");
inline const Opt OPT_JSON =
    Opt{ "--json" }.setDesc("Print the output as JSON");

// Parses the argument of `-j` and applies it.
rs::Result<void> parseJobs(std::string_view arg);

} // namespace trellis
