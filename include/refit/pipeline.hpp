#pragma once

#include "commands.hpp"
#include "snapshot.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace refit {

    enum class pipeline_error_kind {
        load_failed,
        preexisting_errors,
        unknown_command,
        command_errors,
        handler_errors,
        final_validation_failed,
        write_failed,
    };

    inline constexpr std::string_view to_string(pipeline_error_kind kind) {
        switch (kind) {
            case pipeline_error_kind::load_failed:
                return "load_failed"sv;
            case pipeline_error_kind::preexisting_errors:
                return "preexisting_errors"sv;
            case pipeline_error_kind::unknown_command:
                return "unknown_command"sv;
            case pipeline_error_kind::command_errors:
                return "command_errors"sv;
            case pipeline_error_kind::handler_errors:
                return "handler_errors"sv;
            case pipeline_error_kind::final_validation_failed:
                return "final_validation_failed"sv;
            case pipeline_error_kind::write_failed:
                return "write_failed"sv;
        }
        return "load_failed"sv;
    }

    // Any abort of a script run. command names the attributed script command
    // (its summary line) when there is one.
    class pipeline_error : public std::runtime_error {
      public:
        pipeline_error(
                pipeline_error_kind kind,
                const std::string& message,
                std::string command = {},
                std::vector<diagnostic> diagnostics = {})
                : std::runtime_error{message},
                  kind_{kind},
                  command_{std::move(command)},
                  diagnostics_{std::move(diagnostics)} {}

        pipeline_error_kind kind() const { return kind_; }
        const std::string& command() const { return command_; }
        const std::vector<diagnostic>& diagnostics() const { return diagnostics_; }

      private:
        pipeline_error_kind kind_;
        std::string command_;
        std::vector<diagnostic> diagnostics_;
    };

    struct run_summary {
        size_t commands{};
        size_t files_written{};
        bool diffed{false};
    };

    // Runs script against the chain rooted at base. Each command is applied to a
    // freshly loaded snapshot; problems it introduces surface on the next load and
    // are attributed to it. Output goes to s; debug keys are honored whether they
    // were set on s or on the session of the snapshots base produces. Throws
    // pipeline_error on any abort.
    run_summary run_script(session& s, loader& base, const command_registry& commands, std::string_view script);

}  // namespace refit
