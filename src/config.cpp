#include "refit/config.hpp"

#include "refit/format.hpp"

#include "internal/process.hpp"
#include "internal/types.hpp"

#include <ostream>
#include <stdexcept>
#include <system_error>

using namespace refit::literals;

namespace refit {

    namespace detail {

        namespace fs = std::filesystem;

        static void validate_supported_schema_version(int schema_version, const fs::path& path) {
            constexpr int supported_schema_version = 1;
            if (schema_version > supported_schema_version) {
                throw std::runtime_error(
                        "unsupported schema_version in {}: {} > {}"_format(
                                path.string(), schema_version, supported_schema_version));
            }
        }

        static internal::persisted_config read_persisted_config(const fs::path& path) {
            internal::persisted_config value{};
            auto json = internal::process::read_text_file(path);
            auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(value, json);
            if (ec) {
                throw std::runtime_error("failed to parse json file {}"_format(path.string()));
            }
            validate_supported_schema_version(value.schema_version, path);
            return value;
        }

        static void apply_persisted_config(const internal::persisted_config& data, session_config& cfg) {
            if (data.extensions) {
                cfg.extensions = *data.extensions;
            }
            if (data.exclude) {
                cfg.exclude = *data.exclude;
            }
            if (data.checker) {
                cfg.checker = *data.checker;
            }
            if (data.check_extensions) {
                cfg.check_extensions = *data.check_extensions;
            }
            if (data.formatter) {
                cfg.formatter = *data.formatter;
            }
            if (data.diff_path && !data.diff_path->empty()) {
                cfg.diff_path = *data.diff_path;
            }
            if (data.output && !try_parse_output_mode(*data.output, cfg.output)) {
                throw std::runtime_error("invalid output in config file: " + *data.output);
            }
        }

        static std::string list_or_default(const std::vector<std::string>& values) {
            if (values.empty()) {
                return "<none>";
            }
            return utils::join_with_separator(values, " ");
        }

    }  // namespace detail

    void load_config_file(session_config& cfg) {
        auto path = cfg.resolved_config_file();
        std::error_code ec{};
        if (!std::filesystem::exists(path, ec)) {
            if (cfg.config_file) {
                throw std::runtime_error("config file not found: {}"_format(path.string()));
            }
            return;
        }
        detail::apply_persisted_config(detail::read_persisted_config(path), cfg);
    }

    void print_config(const session_config& cfg, std::ostream& os) {
        os << "root=" << cfg.root.string() << '\n';
        os << "config_file=" << cfg.resolved_config_file().string() << '\n';
        os << "extensions=" << detail::list_or_default(cfg.extensions) << '\n';
        os << "exclude=" << detail::list_or_default(cfg.exclude) << '\n';
        os << "checker=" << detail::list_or_default(cfg.checker) << '\n';
        os << "check_extensions=" << detail::list_or_default(cfg.check_extensions) << '\n';
        os << "formatter=" << detail::list_or_default(cfg.formatter) << '\n';
        os << "diff=" << cfg.diff_path.string() << '\n';
        os << "mode=" << (cfg.show_diff ? "diff" : "write") << '\n';
        os << "output={}\n"_format(cfg.output);
    }

}  // namespace refit
