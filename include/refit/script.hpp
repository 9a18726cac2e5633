#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace refit::script {

    struct command_line {
        std::string name{};
        std::string args{};
        // logical line after comment stripping; continuation joins keep their newlines
        std::string text{};
        // 1-based physical line the command starts on
        size_t line{};

        // First physical line of text, marked with " \ ..." when the command continues.
        std::string summary() const;
    };

    // Cuts line at a '#' comment outside quotes and trims surrounding whitespace.
    std::string trim_comments(std::string_view line);

    std::vector<command_line> tokenize(std::string_view script);

}  // namespace refit::script
