#pragma once

#include "config.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace refit::cli {

    inline constexpr int usage_exit_code = 2;
    inline constexpr int failure_exit_code = 1;

    // Resolves defaults, the workspace config file and flags into cfg, and the
    // positional script text into script. Returns an exit code when the process
    // should stop right away (usage errors, --help, --version, --print-config).
    std::optional<int> parse_cli(int argc, char** argv, session_config& cfg, std::string& script);

    // Runs script over the workspace at cfg.root and reports the outcome.
    int run(const session_config& cfg, std::string_view script, std::ostream& out, std::ostream& err);

}  // namespace refit::cli
