#pragma once

#include <algorithm>
#include <cctype>
#include <iostream>
#include <ranges>
#include <source_location>
#include <string>
#include <string_view>
#include <vector>

namespace refit {

// Debug logger; no-op on release builds
#ifndef NDEBUG
    constexpr std::string_view sloc_fname(const std::source_location& loc) {
        std::string_view sv{loc.file_name()};
        if (auto p = sv.rfind('/'); p != sv.npos)
            sv.remove_prefix(p + 1);
        return sv;
    }

    inline void prepend_location(std::ostream& os, const std::source_location& loc) {
        os << '[' << sloc_fname(loc) << ':' << loc.line() << "] ";
    }

    template <typename... Args>
    struct debug_log {
        constexpr explicit debug_log(
                Args&&... args, const std::source_location& loc = std::source_location::current()) {
            prepend_location(std::cerr, loc);
            (std::cerr << ... << std::forward<Args>(args)) << std::endl;
        }
    };
#else
    template <typename... Args>
    struct debug_log {
        constexpr explicit debug_log(Args&&...) {}
    };
#endif

    // deduction guide
    template <typename... Args>
    debug_log(Args&&...) -> debug_log<Args...>;

    namespace utils {
        constexpr char char_tolower(char c) {
            if (c >= 'A' && c <= 'Z') {
                return c + ('a' - 'A');
            }
            return c;
        }

        constexpr bool str_case_eq(std::string_view lhs, std::string_view rhs) {
            return std::ranges::equal(
                    lhs | std::views::transform(char_tolower), rhs | std::views::transform(char_tolower));
        }

        constexpr std::string_view trim_view(std::string_view value) {
            auto first = value.find_first_not_of(" \t\r\n");
            if (first == std::string_view::npos) {
                return {};
            }
            auto last = value.find_last_not_of(" \t\r\n");
            return value.substr(first, (last - first) + 1U);
        }

        constexpr bool is_ident_start(char c) noexcept {
            return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
        }

        constexpr bool is_ident_char(char c) noexcept {
            return is_ident_start(c) || (c >= '0' && c <= '9');
        }

        constexpr bool is_identifier(std::string_view text) noexcept {
            if (text.empty() || !is_ident_start(text.front())) {
                return false;
            }
            return std::ranges::all_of(text, is_ident_char);
        }

        inline std::vector<std::string_view> split_whitespace(std::string_view text) {
            std::vector<std::string_view> tokens{};
            size_t i = 0U;
            while (i < text.size()) {
                while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) {
                    ++i;
                }
                if (i >= text.size()) {
                    break;
                }
                auto start = i;
                while (i < text.size() && !std::isspace(static_cast<unsigned char>(text[i]))) {
                    ++i;
                }
                tokens.push_back(text.substr(start, i - start));
            }
            return tokens;
        }

        inline std::vector<std::string> split_args(std::string_view text) {
            std::vector<std::string> out{};
            for (auto token : split_whitespace(text)) {
                out.emplace_back(token);
            }
            return out;
        }

        inline std::string join_with_separator(const std::vector<std::string>& values, std::string_view separator) {
            if (values.empty()) {
                return {};
            }
            return values | std::views::join_with(separator) | std::ranges::to<std::string>();
        }

    }  // namespace utils

}  // namespace refit
