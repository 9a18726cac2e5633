#pragma once

#include <glaze/glaze.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace refit::internal {

    // .refit.json; every key is optional and overrides the compiled default.
    struct persisted_config {
        int schema_version{1};
        std::optional<std::vector<std::string>> extensions{};
        std::optional<std::vector<std::string>> exclude{};
        std::optional<std::vector<std::string>> checker{};
        std::optional<std::vector<std::string>> check_extensions{};
        std::optional<std::vector<std::string>> formatter{};
        std::optional<std::string> diff_path{};
        std::optional<std::string> output{};
    };

    struct diagnostic_record {
        std::string file{};
        size_t line{};
        size_t column{};
        std::string message{};
    };

    struct run_report_record {
        bool success{true};
        std::string kind{};
        std::string command{};
        std::string message{};
        size_t commands{};
        size_t files_written{};
        bool diffed{false};
        std::vector<diagnostic_record> diagnostics{};
    };

}  // namespace refit::internal

namespace glz {

    template <>
    struct meta<refit::internal::persisted_config> {
        using T = refit::internal::persisted_config;
        static constexpr auto value =
                object("schema_version",
                       &T::schema_version,
                       "extensions",
                       &T::extensions,
                       "exclude",
                       &T::exclude,
                       "checker",
                       &T::checker,
                       "check_extensions",
                       &T::check_extensions,
                       "formatter",
                       &T::formatter,
                       "diff_path",
                       &T::diff_path,
                       "output",
                       &T::output);
    };

    template <>
    struct meta<refit::internal::diagnostic_record> {
        using T = refit::internal::diagnostic_record;
        static constexpr auto value = object("file", &T::file, "line", &T::line, "column", &T::column, "message", &T::message);
    };

    template <>
    struct meta<refit::internal::run_report_record> {
        using T = refit::internal::run_report_record;
        static constexpr auto value =
                object("success",
                       &T::success,
                       "kind",
                       &T::kind,
                       "command",
                       &T::command,
                       "message",
                       &T::message,
                       "commands",
                       &T::commands,
                       "files_written",
                       &T::files_written,
                       "diffed",
                       &T::diffed,
                       "diagnostics",
                       &T::diagnostics);
    };

}  // namespace glz
