#pragma once

#include "refit.hpp"

#include <catch2/catch_test_macros.hpp>
#include <glaze/glaze.hpp>

#include "../src/internal/types.hpp"

extern "C" {
#include <sys/stat.h>
#include <unistd.h>
}

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace refit::test::detail {
    namespace fs = std::filesystem;

    struct temp_dir {
        fs::path path{};

        explicit temp_dir(std::string_view prefix) {
            static unsigned counter = 0U;
            auto now = std::chrono::system_clock::now().time_since_epoch().count();
            std::ostringstream dir_name{};
            dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now << "_" << counter++;
            path = fs::temp_directory_path() / dir_name.str();
            fs::create_directories(path);
        }

        ~temp_dir() {
            std::error_code ec{};
            fs::remove_all(path, ec);
        }
    };

    inline void write_text_file(const fs::path& path, std::string_view text) {
        std::error_code ec{};
        auto parent = path.parent_path();
        if (!parent.empty()) {
            fs::create_directories(parent, ec);
        }

        std::ofstream out{path, std::ios::binary | std::ios::trunc};
        REQUIRE(out.good());
        out << text;
        REQUIRE(out.good());
    }

    inline std::string read_text_file(const fs::path& path) {
        std::ifstream in{path, std::ios::binary};
        REQUIRE(in.good());
        std::ostringstream ss{};
        ss << in.rdbuf();
        return ss.str();
    }

    // Writes a bash script and marks it executable.
    inline fs::path write_script(const fs::path& path, std::string_view body) {
        write_text_file(path, "#!/usr/bin/env bash\n" + std::string{body});
        fs::permissions(
                path,
                fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec | fs::perms::others_read |
                        fs::perms::others_exec);
        return path;
    }

    // Session over dir with the built-in checks only; output is captured.
    struct test_session {
        std::ostringstream out{};
        std::ostringstream err{};
        session s{};

        explicit test_session(const fs::path& root) {
            s.config.root = root;
            s.out = &out;
            s.err = &err;
        }
    };

    inline size_t count_of(std::string_view text, std::string_view needle) {
        size_t n = 0U;
        for (auto pos = text.find(needle); pos != std::string_view::npos; pos = text.find(needle, pos + 1U)) {
            ++n;
        }
        return n;
    }

}  // namespace refit::test::detail
