#pragma once

#include "refit/snapshot.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace refit::internal::checks {

    // Unbalanced (), {}, [] and unterminated literals or block comments.
    std::unique_ptr<checker> make_balance_checker();

    // Runs argv followed by the materialized files whose extension is in check_extensions.
    std::unique_ptr<checker> make_command_checker(
            std::vector<std::string> argv, std::vector<std::string> check_extensions);

    // Built-in checks plus the external checker when cfg.checker is set.
    std::vector<std::unique_ptr<checker>> make_default_checkers(const session_config& cfg);

    // Collects "path:line[:col]: error: message" lines; paths below tree become tree-relative.
    std::vector<diagnostic> parse_checker_output(std::string_view output, const std::filesystem::path& tree);

}  // namespace refit::internal::checks
