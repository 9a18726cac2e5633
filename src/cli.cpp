#include "refit/cli.hpp"

#include "refit/commands.hpp"
#include "refit/format.hpp"
#include "refit/pipeline.hpp"
#include "refit/snapshot.hpp"

#include "internal/types.hpp"

#include <CLI/CLI.hpp>

#include <iostream>
#include <stdexcept>
#include <vector>

using namespace refit::literals;

namespace refit::cli {

    namespace detail {

        static constexpr auto usage_line = "usage: refit [--diff] script"sv;

        static void render_report_json(const internal::run_report_record& report, std::ostream& os) {
            std::string json{};
            auto ec = glz::write_json(report, json);
            if (ec) {
                throw std::runtime_error("failed to serialize run report");
            }
            os << json << '\n';
        }

        static internal::run_report_record make_report(const run_summary& summary) {
            internal::run_report_record report{};
            report.commands = summary.commands;
            report.files_written = summary.files_written;
            report.diffed = summary.diffed;
            return report;
        }

        static internal::run_report_record make_report(const pipeline_error& e) {
            internal::run_report_record report{};
            report.success = false;
            report.kind = "{}"_format(e.kind());
            report.command = e.command();
            report.message = e.what();
            for (const auto& d : e.diagnostics()) {
                report.diagnostics.push_back(
                        internal::diagnostic_record{
                                .file = d.file, .line = d.line, .column = d.column, .message = d.message});
            }
            return report;
        }

    }  // namespace detail

    std::optional<int> parse_cli(int argc, char** argv, session_config& cfg, std::string& script) {
        CLI::App app{"refit: apply a script of refactoring commands to a source tree"};

        bool show_version = false;
        std::string root_arg{cfg.root.string()};
        std::string config_arg{};
        std::vector<std::string> ext_args{};
        std::vector<std::string> exclude_args{};
        std::string checker_arg{};
        std::string formatter_arg{};
        std::string diff_tool_arg{};
        std::string output_arg{};

        app.add_flag("--version", show_version, "Print version and exit");
        app.add_flag("--diff", cfg.show_diff, "Show diff instead of writing files");
        app.add_option("-C,--dir", root_arg, "Workspace root directory");
        app.add_option("--config", config_arg, "Config file (default: <root>/.refit.json)");
        app.add_option("--ext", ext_args, "Source file extension (repeatable)")->allow_extra_args(false);
        app.add_option("--exclude", exclude_args, "Directory name to skip (repeatable)")->allow_extra_args(false);
        app.add_option("--checker", checker_arg, "External checker command line");
        app.add_option("--formatter", formatter_arg, "External formatter command line");
        app.add_option("--diff-tool", diff_tool_arg, "diff executable path");
        app.add_option("--output", output_arg, "Output mode: text|json");
        app.add_flag("--print-config", cfg.print_config, "Print resolved config and exit");
        app.add_flag("--quiet", cfg.quiet, "Suppress non-essential output");
        app.add_flag("--verbose", cfg.verbose, "Enable verbose output");
        app.add_option("script", script, "Script text (not a file name)");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            // --help exits 0; every other parse failure is a usage error
            auto code = app.exit(e);
            return std::optional<int>{code == 0 ? 0 : usage_exit_code};
        }

        if (cfg.quiet && cfg.verbose) {
            std::cerr << "--quiet and --verbose are mutually exclusive\n";
            return std::optional<int>{usage_exit_code};
        }

        if (show_version) {
            std::cout << "refit 0.1.0\n";
            return std::optional<int>{0};
        }

        cfg.root = root_arg;
        if (!config_arg.empty()) {
            cfg.config_file = config_arg;
        }
        load_config_file(cfg);

        if (!ext_args.empty()) {
            cfg.extensions = ext_args;
        }
        if (!exclude_args.empty()) {
            cfg.exclude = exclude_args;
        }
        if (app.get_option("--checker")->count() > 0U) {
            cfg.checker = utils::split_args(checker_arg);
        }
        if (app.get_option("--formatter")->count() > 0U) {
            cfg.formatter = utils::split_args(formatter_arg);
        }
        if (!diff_tool_arg.empty()) {
            cfg.diff_path = diff_tool_arg;
        }
        if (!output_arg.empty() && !try_parse_output_mode(output_arg, cfg.output)) {
            std::cerr << "invalid --output value: " << output_arg << " (expected text|json)\n";
            return std::optional<int>{usage_exit_code};
        }

        if (cfg.print_config) {
            print_config(cfg, std::cout);
            return std::optional<int>{0};
        }

        if (app.get_option("script")->count() == 0U) {
            std::cerr << detail::usage_line << '\n';
            return std::optional<int>{usage_exit_code};
        }

        return std::nullopt;
    }

    int run(const session_config& cfg, std::string_view script, std::ostream& out, std::ostream& err) {
        session s{};
        s.config = cfg;
        s.out = &out;
        s.err = &err;

        workspace ws{s};
        auto commands = default_commands();

        internal::run_report_record report{};
        int status = 0;
        try {
            auto summary = run_script(s, ws, commands, script);
            report = detail::make_report(summary);
            if (cfg.verbose && !cfg.show_diff) {
                err << "wrote {} files"_format(summary.files_written) << '\n';
            }
        } catch (const pipeline_error& e) {
            report = detail::make_report(e);
            if (cfg.output == output_mode::text) {
                err << "refit: " << e.what() << '\n';
            }
            status = failure_exit_code;
        }

        if (cfg.output == output_mode::json) {
            detail::render_report_json(report, out);
        }
        return status;
    }

}  // namespace refit::cli
