#pragma once

#include "refit/snapshot.hpp"

#include <filesystem>
#include <string>

namespace refit::internal::diff {

    // Unified diff of every path whose text differs between before and after, in path order.
    // Created and removed files are diffed against /dev/null.
    std::string unified_diff(const std::filesystem::path& diff_tool, const file_map& before, const file_map& after);

}  // namespace refit::internal::diff
