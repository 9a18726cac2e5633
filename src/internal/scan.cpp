#include "scan.hpp"

#include "refit/utils.hpp"

#include <algorithm>
#include <array>
#include <optional>

namespace refit::internal::scan {

    namespace detail {

        static constexpr std::array<std::string_view, 5> raw_string_prefixes{"R"sv, "LR"sv, "uR"sv, "UR"sv, "u8R"sv};
        static constexpr std::array<std::string_view, 4> encoding_prefixes{"L"sv, "u"sv, "U"sv, "u8"sv};

        static constexpr bool is_blank(char c) noexcept {
            return c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v';
        }

        static constexpr bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

        template <size_t N>
        static constexpr bool one_of(std::string_view word, const std::array<std::string_view, N>& words) {
            return std::ranges::find(words, word) != words.end();
        }

        class lexer {
          public:
            explicit lexer(std::string_view text) : text_{text} {}

            lex_result run() {
                bool at_line_start = true;
                while (pos_ < text_.size()) {
                    auto c = text_[pos_];
                    if (c == '\n') {
                        at_line_start = true;
                        ++pos_;
                        continue;
                    }
                    if (is_blank(c)) {
                        ++pos_;
                        continue;
                    }
                    if (c == '#' && at_line_start) {
                        skip_directive();
                        continue;
                    }
                    at_line_start = false;

                    if (c == '/' && peek(1U) == '/') {
                        skip_line_comment();
                        continue;
                    }
                    if (c == '/' && peek(1U) == '*') {
                        skip_block_comment();
                        continue;
                    }
                    if (utils::is_ident_start(c)) {
                        lex_word();
                        continue;
                    }
                    if (is_digit(c) || (c == '.' && is_digit(peek(1U)))) {
                        lex_number();
                        continue;
                    }
                    if (c == '"') {
                        lex_quoted(pos_, pos_, '"', token_kind::string);
                        continue;
                    }
                    if (c == '\'') {
                        lex_quoted(pos_, pos_, '\'', token_kind::character);
                        continue;
                    }
                    push(token_kind::punct, pos_, pos_ + 1U);
                    ++pos_;
                }
                return std::move(result_);
            }

          private:
            char peek(size_t ahead) const noexcept {
                auto at = pos_ + ahead;
                return at < text_.size() ? text_[at] : '\0';
            }

            void push(token_kind kind, size_t begin, size_t end) {
                result_.tokens.push_back(
                        token{.kind = kind, .begin = begin, .end = end, .text = text_.substr(begin, end - begin)});
            }

            void error(size_t offset, std::string message) {
                result_.errors.push_back(lex_error{.offset = offset, .message = std::move(message)});
            }

            void skip_directive() {
                while (pos_ < text_.size()) {
                    auto c = text_[pos_];
                    if (c == '\\' && peek(1U) == '\n') {
                        pos_ += 2U;
                        continue;
                    }
                    if (c == '\n') {
                        return;
                    }
                    ++pos_;
                }
            }

            void skip_line_comment() {
                auto end = text_.find('\n', pos_);
                pos_ = end == std::string_view::npos ? text_.size() : end;
            }

            void skip_block_comment() {
                auto end = text_.find("*/"sv, pos_ + 2U);
                if (end == std::string_view::npos) {
                    error(pos_, "unterminated block comment");
                    pos_ = text_.size();
                    return;
                }
                pos_ = end + 2U;
            }

            void lex_word() {
                auto begin = pos_;
                auto end = pos_;
                while (end < text_.size() && utils::is_ident_char(text_[end])) {
                    ++end;
                }
                auto word = text_.substr(begin, end - begin);
                if (end < text_.size() && text_[end] == '"' && one_of(word, raw_string_prefixes)) {
                    lex_raw_string(begin, end);
                    return;
                }
                if (end < text_.size() && (text_[end] == '"' || text_[end] == '\'') &&
                    one_of(word, encoding_prefixes)) {
                    auto quote = text_[end];
                    lex_quoted(begin, end, quote, quote == '"' ? token_kind::string : token_kind::character);
                    return;
                }
                push(token_kind::identifier, begin, end);
                pos_ = end;
            }

            void lex_number() {
                auto begin = pos_;
                auto end = pos_ + 1U;
                while (end < text_.size()) {
                    auto c = text_[end];
                    auto prev = text_[end - 1U];
                    if (utils::is_ident_char(c) || c == '.') {
                        ++end;
                        continue;
                    }
                    // digit separators and signed exponents
                    if (c == '\'' && end + 1U < text_.size() && utils::is_ident_char(text_[end + 1U])) {
                        ++end;
                        continue;
                    }
                    if ((c == '+' || c == '-') && (prev == 'e' || prev == 'E' || prev == 'p' || prev == 'P')) {
                        ++end;
                        continue;
                    }
                    break;
                }
                push(token_kind::number, begin, end);
                pos_ = end;
            }

            void lex_quoted(size_t begin, size_t quote_pos, char quote, token_kind kind) {
                auto end = quote_pos + 1U;
                while (end < text_.size()) {
                    auto c = text_[end];
                    if (c == '\\') {
                        end += 2U;
                        continue;
                    }
                    if (c == quote) {
                        ++end;
                        push(kind, begin, end);
                        pos_ = end;
                        return;
                    }
                    if (c == '\n') {
                        break;
                    }
                    ++end;
                }
                end = std::min(end, text_.size());
                error(begin, kind == token_kind::string ? "unterminated string literal" : "unterminated character literal");
                push(kind, begin, end);
                pos_ = end;
            }

            void lex_raw_string(size_t begin, size_t quote_pos) {
                auto open = text_.find('(', quote_pos + 1U);
                if (open == std::string_view::npos || open - quote_pos > 17U) {
                    error(begin, "invalid raw string delimiter");
                    push(token_kind::string, begin, quote_pos + 1U);
                    pos_ = quote_pos + 1U;
                    return;
                }
                std::string closing{")"};
                closing.append(text_.substr(quote_pos + 1U, open - quote_pos - 1U));
                closing.push_back('"');

                auto close = text_.find(closing, open + 1U);
                if (close == std::string_view::npos) {
                    error(begin, "unterminated raw string literal");
                    push(token_kind::string, begin, text_.size());
                    pos_ = text_.size();
                    return;
                }
                auto end = close + closing.size();
                push(token_kind::string, begin, end);
                pos_ = end;
            }

            std::string_view text_;
            size_t pos_{0U};
            lex_result result_{};
        };

    }  // namespace detail

    lex_result lex(std::string_view text) {
        return detail::lexer{text}.run();
    }

    position position_of(std::string_view text, size_t offset) {
        position pos{};
        offset = std::min(offset, text.size());
        for (size_t i = 0U; i < offset; ++i) {
            if (text[i] == '\n') {
                ++pos.line;
                pos.column = 1U;
            }
            else {
                ++pos.column;
            }
        }
        return pos;
    }

    size_t line_start(std::string_view text, size_t offset) {
        offset = std::min(offset, text.size());
        if (offset == 0U) {
            return 0U;
        }
        auto nl = text.rfind('\n', offset - 1U);
        return nl == std::string_view::npos ? 0U : nl + 1U;
    }

    size_t line_end(std::string_view text, size_t offset) {
        auto nl = text.find('\n', offset);
        return nl == std::string_view::npos ? text.size() : nl + 1U;
    }

}  // namespace refit::internal::scan
