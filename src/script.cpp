#include "refit/script.hpp"

#include "refit/utils.hpp"

namespace refit::script {

    using namespace std::string_view_literals;

    namespace detail {

        struct cut_result {
            std::string_view before{};
            std::string_view after{};
            bool found{false};
        };

        static constexpr cut_result cut(std::string_view text, char sep) {
            auto pos = text.find(sep);
            if (pos == std::string_view::npos) {
                return cut_result{text, {}, false};
            }
            return cut_result{text.substr(0, pos), text.substr(pos + 1U), true};
        }

        static constexpr cut_result cut_any(std::string_view text, std::string_view seps) {
            auto pos = text.find_first_of(seps);
            if (pos == std::string_view::npos) {
                return cut_result{text, {}, false};
            }
            return cut_result{text.substr(0, pos), text.substr(pos + 1U), true};
        }

        static constexpr std::string_view trim_left(std::string_view value, std::string_view chars) {
            auto first = value.find_first_not_of(chars);
            if (first == std::string_view::npos) {
                return {};
            }
            return value.substr(first);
        }

    }  // namespace detail

    std::string command_line::summary() const {
        auto [first, rest, more] = detail::cut(text, '\n');
        std::string out{first};
        if (more) {
            out += " \\ ...";
        }
        return out;
    }

    std::string trim_comments(std::string_view line) {
        char quote = 0;
        for (size_t i = 0U; i < line.size(); ++i) {
            auto c = line[i];
            if (quote != 0 && c == quote) {
                quote = 0;
                continue;
            }
            switch (c) {
                case '\'':
                case '"':
                case '`':
                    if (quote == 0) {
                        quote = c;
                    }
                    break;
                case '\\':
                    if (quote == '\'' || quote == '"') {
                        ++i;
                    }
                    break;
                case '#':
                    if (quote == 0) {
                        line = line.substr(0, i);
                    }
                    break;
                default:
                    break;
            }
        }
        return std::string{utils::trim_view(line)};
    }

    std::vector<command_line> tokenize(std::string_view script) {
        std::vector<command_line> commands{};
        auto text = script;
        size_t next_line = 1U;

        while (!text.empty()) {
            auto start_line = next_line;
            auto [raw, rest, has_newline] = detail::cut(text, '\n');
            text = rest;
            ++next_line;

            auto line = trim_comments(raw);
            // a trailing backslash on the last line of the script stays literal
            while (line.ends_with('\\') && !text.empty()) {
                auto [cont, cont_rest, cont_newline] = detail::cut(text, '\n');
                text = cont_rest;
                ++next_line;
                line.pop_back();
                line.push_back('\n');
                line.append(cont);
                line = trim_comments(line);
            }

            auto logical = detail::trim_left(line, " \t\n"sv);
            if (logical.empty()) {
                continue;
            }

            auto [name, args, has_args] = detail::cut_any(logical, " \t"sv);
            commands.push_back(command_line{
                    .name = std::string{name},
                    .args = std::string{args},
                    .text = std::string{logical},
                    .line = start_line});
        }

        return commands;
    }

}  // namespace refit::script
