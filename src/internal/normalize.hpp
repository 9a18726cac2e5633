#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace refit::internal::normalize {

    // Trailing blanks stripped, blank-line runs collapsed, exactly one final newline.
    std::string tidy_whitespace(std::string_view text);

    // Pipes text through argv + <path> and returns its stdout; throws std::runtime_error on failure.
    std::string run_formatter(const std::vector<std::string>& argv, std::string_view path, std::string_view text);

}  // namespace refit::internal::normalize
