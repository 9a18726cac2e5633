#include "normalize.hpp"

#include "process.hpp"

#include "refit/format.hpp"
#include "refit/utils.hpp"

#include <system_error>

using namespace refit::literals;

namespace refit::internal::normalize {

    std::string tidy_whitespace(std::string_view text) {
        std::string out{};
        out.reserve(text.size() + 1U);

        size_t blank_run = 0U;
        bool seen_content = false;
        size_t begin = 0U;
        while (begin < text.size()) {
            auto end = text.find('\n', begin);
            if (end == std::string_view::npos) {
                end = text.size();
            }
            auto line = text.substr(begin, end - begin);
            auto last = line.find_last_not_of(" \t\r");
            line = last == std::string_view::npos ? std::string_view{} : line.substr(0, last + 1U);

            if (line.empty()) {
                ++blank_run;
            }
            else {
                if (blank_run > 0U && seen_content) {
                    out.push_back('\n');
                }
                blank_run = 0U;
                seen_content = true;
                out.append(line);
                out.push_back('\n');
            }
            begin = end + 1U;
        }
        return out;
    }

    std::string run_formatter(const std::vector<std::string>& argv, std::string_view path, std::string_view text) {
        if (argv.empty()) {
            throw std::invalid_argument("formatter command is empty");
        }
        process::scratch_dir scratch{"refit_format"};
        auto dest = scratch.path() / "tree" / std::string{path};

        std::error_code ec{};
        std::filesystem::create_directories(dest.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("failed to create directory: {}"_format(dest.parent_path().string()));
        }
        process::write_text_file(dest, text);

        auto args = argv;
        args.push_back(dest.string());
        auto result = process::run_process(args, scratch.path());
        if (result.exit_code == process::exec_failed_exit_code) {
            throw std::runtime_error("formatter could not be run: {}"_format(argv.front()));
        }
        if (result.exit_code != 0) {
            throw std::runtime_error(
                    "formatter {} failed on {} with exit code {}: {}"_format(
                            argv.front(), path, result.exit_code, utils::trim_view(result.err)));
        }
        return result.out;
    }

}  // namespace refit::internal::normalize
