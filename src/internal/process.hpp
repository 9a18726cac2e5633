#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace refit::internal::process {

    namespace fs = std::filesystem;

    inline constexpr int exec_failed_exit_code = 127;

    struct process_result {
        int exit_code{-1};
        std::string out{};
        std::string err{};
    };

    // Runs args[0] (PATH lookup) with stdout and stderr captured through files in work_dir.
    process_result run_process(const std::vector<std::string>& args, const fs::path& work_dir);

    std::string read_text_file(const fs::path& path);
    void write_text_file(const fs::path& path, std::string_view text);

    // Private temporary directory, removed with its contents on destruction.
    class scratch_dir {
      public:
        explicit scratch_dir(std::string_view prefix);
        ~scratch_dir();

        scratch_dir(const scratch_dir&) = delete;
        scratch_dir& operator=(const scratch_dir&) = delete;

        const fs::path& path() const { return path_; }

      private:
        fs::path path_{};
    };

}  // namespace refit::internal::process
