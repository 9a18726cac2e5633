#include "refit/pipeline.hpp"

#include "refit/format.hpp"
#include "refit/script.hpp"

#include <memory>

using namespace refit::literals;

namespace refit {

    namespace detail {

        static std::unique_ptr<snapshot> acquire(loader& base) {
            try {
                return base.load();
            } catch (const load_error& e) {
                throw pipeline_error(pipeline_error_kind::load_failed, e.what());
            }
        }

        static void print_diagnostics(const session& s, const std::vector<diagnostic>& diagnostics) {
            for (const auto& d : diagnostics) {
                *s.err << "{}\n"_format(d);
            }
        }

        // Debug keys set by a command live in the session of the snapshot it ran on.
        static bool tracing(const session& s, const snapshot* last) {
            return s.debugging("trace"sv) || (last != nullptr && last->session().debugging("trace"sv));
        }

        static void trace(const session& s, std::string_view text) {
            std::string shown{};
            for (auto c : text) {
                if (c == '\n') {
                    shown += "\\\n";
                    continue;
                }
                shown.push_back(c);
            }
            *s.err << "> " << shown << '\n';
        }

        // Emits what the failing command left behind before the run aborts.
        static void finalize_partial(const session& s, const snapshot& last) {
            try {
                if (s.config.show_diff) {
                    *s.out << last.diff();
                }
                else {
                    last.write();
                }
            } catch (const std::runtime_error& e) {
                if (!s.config.quiet) {
                    *s.err << "warning: " << e.what() << '\n';
                }
            }
        }

    }  // namespace detail

    run_summary run_script(session& s, loader& base, const command_registry& commands, std::string_view script) {
        run_summary summary{};
        auto lines = script::tokenize(script);

        loader* current = &base;
        std::unique_ptr<snapshot> last{};
        std::string last_cmd{};

        for (const auto& line : lines) {
            if (detail::tracing(s, last.get())) {
                detail::trace(s, line.text);
            }

            auto snap = detail::acquire(*current);
            if (snap->errors() > 0U) {
                detail::print_diagnostics(s, snap->diagnostics());
                if (last_cmd.empty()) {
                    throw pipeline_error(
                            pipeline_error_kind::preexisting_errors,
                            "errors found before executing script",
                            {},
                            snap->diagnostics());
                }
                detail::finalize_partial(s, *last);
                throw pipeline_error(
                        pipeline_error_kind::command_errors,
                        "errors found after executing: {}"_format(last_cmd),
                        last_cmd,
                        snap->diagnostics());
            }

            last_cmd = line.summary();

            const auto* handler = commands.find(line.name);
            if (handler == nullptr) {
                throw pipeline_error(
                        pipeline_error_kind::unknown_command, "unknown command {}"_format(line.name), line.name);
            }

            try {
                (*handler)(*snap, line.args);
            } catch (const std::exception& e) {
                snap->add_error(e.what());
            }
            if (snap->errors() > 0U) {
                detail::print_diagnostics(s, snap->diagnostics());
                throw pipeline_error(
                        pipeline_error_kind::handler_errors,
                        "errors found while executing: {}"_format(last_cmd),
                        last_cmd,
                        snap->diagnostics());
            }

            snap->normalize();
            last = std::move(snap);
            current = last.get();
            ++summary.commands;
        }

        if (!last) {
            return summary;
        }

        // diff first so it is available even when the final check fails
        if (s.config.show_diff) {
            try {
                *s.out << last->diff();
            } catch (const std::runtime_error& e) {
                throw pipeline_error(pipeline_error_kind::write_failed, "computing diff: {}"_format(e.what()), last_cmd);
            }
            summary.diffed = true;
        }

        std::unique_ptr<snapshot> checked{};
        try {
            checked = last->load();
        } catch (const load_error& e) {
            throw pipeline_error(
                    pipeline_error_kind::final_validation_failed,
                    "checking rewritten files: {}"_format(e.what()),
                    last_cmd);
        }
        if (checked->errors() > 0U) {
            detail::print_diagnostics(s, checked->diagnostics());
            throw pipeline_error(
                    pipeline_error_kind::final_validation_failed,
                    "checking rewritten files: errors found after executing: {}"_format(last_cmd),
                    last_cmd,
                    checked->diagnostics());
        }

        if (s.config.show_diff) {
            return summary;
        }

        try {
            summary.files_written = last->write();
        } catch (const std::runtime_error& e) {
            throw pipeline_error(pipeline_error_kind::write_failed, "writing files: {}"_format(e.what()), last_cmd);
        }
        return summary;
    }

}  // namespace refit
