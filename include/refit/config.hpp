#pragma once

#include "utils.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace refit {

    using namespace std::string_view_literals;

    /*
     * Refit Run Config Options
     *
     * Workspace
     * - root: Directory scanned for source files; edits are written back below it.
     * - config_file: JSON file with per-workspace overrides (defaults to <root>/.refit.json).
     * - extensions: File extensions treated as workspace sources.
     * - exclude: Directory names skipped while scanning.
     *
     * Checking and formatting
     * - checker: External checker argv; workspace files with check_extensions are appended.
     * - check_extensions: Extensions of the files handed to the external checker.
     * - formatter: External formatter argv; the file path is appended and stdout is the result.
     * - diff_path: diff executable used to render unified diffs.
     *
     * Output
     * - show_diff: Print a unified diff instead of writing files.
     * - output: Shape of the final run report ("text" or "json").
     * - quiet/verbose: Coarse output verbosity knobs.
     *
     * Introspection flags (one-shot startup actions)
     * - print_config: Print resolved config and exit.
     */

    enum class output_mode { text, json };

    inline constexpr std::string_view to_string(output_mode mode) {
        switch (mode) {
            case output_mode::text:
                return "text"sv;
            case output_mode::json:
                return "json"sv;
        }
        return "text"sv;
    }

    inline constexpr bool try_parse_output_mode(std::string_view text, output_mode& out) {
        if (utils::str_case_eq(text, "text"sv)) {
            out = output_mode::text;
            return true;
        }
        if (utils::str_case_eq(text, "json"sv)) {
            out = output_mode::json;
            return true;
        }
        return false;
    }

    inline constexpr auto default_config_file_name = ".refit.json"sv;

#ifndef REFIT_DIFF_EXECUTABLE_PATH
#define REFIT_DIFF_EXECUTABLE_PATH "diff"
#endif

    struct session_config {
        std::filesystem::path root{"."};
        std::optional<std::filesystem::path> config_file{};
        std::vector<std::string> extensions{".c", ".cc", ".cpp", ".cxx", ".h", ".hh", ".hpp", ".hxx", ".ipp", ".inl"};
        std::vector<std::string> exclude{".git", "build"};

        std::vector<std::string> checker{};
        std::vector<std::string> check_extensions{".c", ".cc", ".cpp", ".cxx"};
        std::vector<std::string> formatter{};
        std::filesystem::path diff_path{REFIT_DIFF_EXECUTABLE_PATH};

        bool show_diff{false};
        output_mode output{output_mode::text};
        bool quiet{false};
        bool verbose{false};

        bool print_config{false};

        std::filesystem::path resolved_config_file() const {
            if (config_file) {
                return *config_file;
            }
            return root / default_config_file_name;
        }

        bool is_source_file(const std::filesystem::path& path) const {
            auto ext = path.extension().string();
            return std::ranges::find(extensions, ext) != extensions.end();
        }

        bool is_checked_file(const std::filesystem::path& path) const {
            auto ext = path.extension().string();
            return std::ranges::find(check_extensions, ext) != check_extensions.end();
        }
    };

    // Applies <root>/.refit.json (or config_file) on top of cfg. A missing file is ignored;
    // a malformed one throws std::runtime_error.
    void load_config_file(session_config& cfg);

    void print_config(const session_config& cfg, std::ostream& os);

}  // namespace refit
