#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace refit::internal::scan {

    using namespace std::string_view_literals;

    enum class token_kind : uint8_t {
        identifier,
        number,
        punct,
        string,
        character,
    };

    struct token {
        token_kind kind{token_kind::punct};
        size_t begin{};
        size_t end{};
        std::string_view text{};

        bool is(char c) const noexcept { return kind == token_kind::punct && text.size() == 1U && text[0] == c; }
        bool is_ident(std::string_view name) const noexcept {
            return kind == token_kind::identifier && text == name;
        }
    };

    struct lex_error {
        size_t offset{};
        std::string message{};
    };

    struct lex_result {
        std::vector<token> tokens{};
        std::vector<lex_error> errors{};
    };

    // Code tokens of a C-family source; comments, whitespace and preprocessor lines are dropped.
    lex_result lex(std::string_view text);

    struct position {
        size_t line{1U};
        size_t column{1U};
    };

    position position_of(std::string_view text, size_t offset);

    // Offset of the first byte of the line containing offset.
    size_t line_start(std::string_view text, size_t offset);

    // Offset just past the newline ending the line containing offset (or text.size()).
    size_t line_end(std::string_view text, size_t offset);

}  // namespace refit::internal::scan
