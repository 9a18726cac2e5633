#include "checker.hpp"

#include "process.hpp"
#include "scan.hpp"

#include "refit/format.hpp"
#include "refit/utils.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <optional>
#include <system_error>

using namespace refit::literals;

namespace refit::internal::checks {

    namespace fs = std::filesystem;

    namespace detail {

        static constexpr char closing_for(char open) {
            switch (open) {
                case '(':
                    return ')';
                case '[':
                    return ']';
                default:
                    return '}';
            }
        }

        static diagnostic make_diagnostic(std::string_view file, std::string_view text, size_t offset, std::string msg) {
            auto pos = scan::position_of(text, offset);
            return diagnostic{
                    .file = std::string{file}, .line = pos.line, .column = pos.column, .message = std::move(msg)};
        }

        class balance_checker final : public checker {
          public:
            std::vector<diagnostic> check(const file_map& files) const override {
                std::vector<diagnostic> out{};
                for (const auto& [path, text] : files) {
                    check_file(path, text, out);
                }
                return out;
            }

          private:
            static void check_file(std::string_view path, std::string_view text, std::vector<diagnostic>& out) {
                auto lexed = scan::lex(text);
                for (const auto& e : lexed.errors) {
                    out.push_back(make_diagnostic(path, text, e.offset, e.message));
                }

                std::vector<const scan::token*> open{};
                for (const auto& tok : lexed.tokens) {
                    if (tok.is('(') || tok.is('[') || tok.is('{')) {
                        open.push_back(&tok);
                        continue;
                    }
                    if (!(tok.is(')') || tok.is(']') || tok.is('}'))) {
                        continue;
                    }
                    if (open.empty()) {
                        out.push_back(make_diagnostic(path, text, tok.begin, "unexpected '{}'"_format(tok.text)));
                        continue;
                    }
                    auto expected = closing_for(open.back()->text[0]);
                    if (tok.text[0] != expected) {
                        out.push_back(make_diagnostic(
                                path, text, tok.begin, "mismatched '{}', expected '{}'"_format(tok.text, expected)));
                    }
                    open.pop_back();
                }
                for (const auto* tok : open) {
                    out.push_back(make_diagnostic(path, text, tok->begin, "unclosed '{}'"_format(tok->text)));
                }
            }
        };

        static std::optional<size_t> parse_number(std::string_view text) {
            size_t value{};
            auto result = std::from_chars(text.data(), text.data() + text.size(), value);
            if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
                return std::nullopt;
            }
            return value;
        }

        static std::string relative_to_tree(std::string_view path, const fs::path& tree) {
            auto prefix = tree.generic_string() + "/";
            if (path.starts_with(prefix)) {
                return std::string{path.substr(prefix.size())};
            }
            return std::string{path};
        }

        static std::optional<diagnostic> parse_error_line(std::string_view line, const fs::path& tree) {
            static constexpr std::array<std::string_view, 2> markers{": fatal error: "sv, ": error: "sv};

            for (auto marker : markers) {
                auto at = line.find(marker);
                if (at == std::string_view::npos) {
                    continue;
                }
                diagnostic diag{};
                diag.message = std::string{utils::trim_view(line.substr(at + marker.size()))};

                auto location = line.substr(0, at);
                // path[:line[:col]]
                auto last = location.rfind(':');
                if (last != std::string_view::npos) {
                    if (auto n = parse_number(location.substr(last + 1U))) {
                        auto head = location.substr(0, last);
                        auto prev = head.rfind(':');
                        std::optional<size_t> line_no{};
                        if (prev != std::string_view::npos) {
                            line_no = parse_number(head.substr(prev + 1U));
                        }
                        if (line_no) {
                            diag.line = *line_no;
                            diag.column = *n;
                            location = head.substr(0, prev);
                        }
                        else {
                            diag.line = *n;
                            location = head;
                        }
                    }
                }
                diag.file = relative_to_tree(location, tree);
                return diag;
            }
            return std::nullopt;
        }

        static std::vector<diagnostic> parse_output(std::string_view output, const fs::path& tree) {
            std::vector<diagnostic> out{};
            size_t begin = 0U;
            while (begin < output.size()) {
                auto end = output.find('\n', begin);
                if (end == std::string_view::npos) {
                    end = output.size();
                }
                if (auto diag = parse_error_line(output.substr(begin, end - begin), tree)) {
                    out.push_back(std::move(*diag));
                }
                begin = end + 1U;
            }
            return out;
        }

        static std::string first_line(std::string_view text) {
            auto trimmed = utils::trim_view(text);
            auto nl = trimmed.find('\n');
            return std::string{nl == std::string_view::npos ? trimmed : trimmed.substr(0, nl)};
        }

        class command_checker final : public checker {
          public:
            command_checker(std::vector<std::string> argv, std::vector<std::string> check_extensions)
                    : argv_{std::move(argv)}, check_extensions_{std::move(check_extensions)} {}

            std::vector<diagnostic> check(const file_map& files) const override {
                process::scratch_dir scratch{"refit_check"};
                auto tree = scratch.path() / "tree";

                auto args = argv_;
                for (const auto& [path, text] : files) {
                    auto dest = tree / path;
                    std::error_code ec{};
                    fs::create_directories(dest.parent_path(), ec);
                    if (ec) {
                        throw load_error("failed to create directory: {}"_format(dest.parent_path().string()));
                    }
                    process::write_text_file(dest, text);

                    auto ext = fs::path{path}.extension().string();
                    if (std::ranges::find(check_extensions_, ext) != check_extensions_.end()) {
                        args.push_back(dest.generic_string());
                    }
                }
                if (args.size() == argv_.size()) {
                    return {};
                }

                auto result = process::run_process(args, scratch.path());
                if (result.exit_code == process::exec_failed_exit_code) {
                    throw load_error("checker could not be run: {}"_format(argv_.front()));
                }

                auto out = parse_output(result.out, tree);
                for (auto& diag : parse_output(result.err, tree)) {
                    out.push_back(std::move(diag));
                }

                if (result.exit_code != 0 && out.empty()) {
                    throw load_error(
                            "checker {} failed with exit code {}: {}"_format(
                                    argv_.front(), result.exit_code, first_line(result.err)));
                }
                return out;
            }

          private:
            std::vector<std::string> argv_;
            std::vector<std::string> check_extensions_;
        };

    }  // namespace detail

    std::unique_ptr<checker> make_balance_checker() {
        return std::make_unique<detail::balance_checker>();
    }

    std::unique_ptr<checker> make_command_checker(
            std::vector<std::string> argv, std::vector<std::string> check_extensions) {
        if (argv.empty()) {
            throw std::invalid_argument("checker command is empty");
        }
        return std::make_unique<detail::command_checker>(std::move(argv), std::move(check_extensions));
    }

    std::vector<std::unique_ptr<checker>> make_default_checkers(const session_config& cfg) {
        std::vector<std::unique_ptr<checker>> out{};
        out.push_back(make_balance_checker());
        if (!cfg.checker.empty()) {
            out.push_back(make_command_checker(cfg.checker, cfg.check_extensions));
        }
        return out;
    }

    std::vector<diagnostic> parse_checker_output(std::string_view output, const fs::path& tree) {
        return detail::parse_output(output, tree);
    }

}  // namespace refit::internal::checks
