#include "diff.hpp"

#include "process.hpp"

#include "refit/format.hpp"

#include <optional>
#include <set>

using namespace refit::literals;

namespace refit::internal::diff {

    namespace detail {

        static constexpr auto dev_null = "/dev/null"sv;

        static const std::string* lookup(const file_map& files, std::string_view path) {
            auto it = files.find(path);
            return it == files.end() ? nullptr : &it->second;
        }

        static std::string diff_one(
                const std::filesystem::path& diff_tool,
                const process::scratch_dir& scratch,
                std::string_view path,
                const std::string* old_text,
                const std::string* new_text) {
            auto old_path = scratch.path() / "old";
            auto new_path = scratch.path() / "new";
            process::write_text_file(old_path, old_text ? *old_text : std::string_view{});
            process::write_text_file(new_path, new_text ? *new_text : std::string_view{});

            std::vector<std::string> args{
                    diff_tool.string(),
                    "-u",
                    "--label",
                    old_text ? "a/{}"_format(path) : std::string{dev_null},
                    "--label",
                    new_text ? "b/{}"_format(path) : std::string{dev_null},
                    old_path.string(),
                    new_path.string()};

            auto result = process::run_process(args, scratch.path());
            // diff(1): 0 same, 1 different, anything else is trouble
            if (result.exit_code == 0 || result.exit_code == 1) {
                return result.out;
            }
            if (result.exit_code == process::exec_failed_exit_code) {
                throw std::runtime_error("diff tool could not be run: {}"_format(diff_tool.string()));
            }
            throw std::runtime_error(
                    "diff failed on {} with exit code {}: {}"_format(path, result.exit_code, result.err));
        }

    }  // namespace detail

    std::string unified_diff(const std::filesystem::path& diff_tool, const file_map& before, const file_map& after) {
        std::set<std::string_view> paths{};
        for (const auto& [path, _] : before) {
            paths.insert(path);
        }
        for (const auto& [path, _] : after) {
            paths.insert(path);
        }

        std::optional<process::scratch_dir> scratch{};
        std::string out{};
        for (auto path : paths) {
            const auto* old_text = detail::lookup(before, path);
            const auto* new_text = detail::lookup(after, path);
            if (old_text && new_text && *old_text == *new_text) {
                continue;
            }
            if (!scratch) {
                scratch.emplace("refit_diff");
            }
            out += detail::diff_one(diff_tool, *scratch, path, old_text, new_text);
        }
        return out;
    }

}  // namespace refit::internal::diff
