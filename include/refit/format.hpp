#pragma once

#include "utils.hpp"

#include <array>
#include <format>
#include <type_traits>

namespace refit {
    // Records that render through a member to_string(), e.g. diagnostics.
    template <typename T, typename U = std::remove_cvref_t<T>>
    concept to_string_formattable = U::to_string_formattable && requires(const U& a) {
        { a.to_string() } -> std::convertible_to<std::string_view>;
    };

    // Enums with a to_string overload found next to them.
    template <typename T, typename U = std::remove_cvref_t<T>>
    concept named_enum = std::is_enum_v<U> && requires(U v) {
        { to_string(v) } -> std::convertible_to<std::string_view>;
    };

    namespace detail {
        template <size_t N>
        struct string_literal {
            std::array<char, N> str;

            consteval string_literal(const char (&s)[N]) { std::ranges::copy(s, s + N, str.begin()); }
            constexpr std::string_view sv() const { return {str.data(), N - 1}; }
        };

        template <string_literal Format>
        struct format_wrapper {
            consteval format_wrapper() = default;

            template <typename... T>
            constexpr auto operator()(T&&... args) && {
                return std::format(Format.sv(), std::forward<T>(args)...);
            }
        };
    }  // namespace detail

    namespace literals {
        template <detail::string_literal Format>
        inline consteval auto operator""_format() {
            return detail::format_wrapper<Format>{};
        }
    }  // namespace literals
}  // namespace refit

namespace std {
    template <refit::to_string_formattable T>
    struct formatter<T, char> : formatter<std::string_view> {
        template <typename FormatContext>
        auto format(const T& val, FormatContext& ctx) const {
            return formatter<std::string_view>::format(val.to_string(), ctx);
        }
    };

    template <refit::named_enum T>
    struct formatter<T, char> : formatter<std::string_view> {
        template <typename FormatContext>
        auto format(T val, FormatContext& ctx) const {
            return formatter<std::string_view>::format(to_string(val), ctx);
        }
    };
}  // namespace std
