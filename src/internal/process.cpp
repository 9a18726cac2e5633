#include "process.hpp"

#include "refit/format.hpp"
#include "refit/utils.hpp"

extern "C" {
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>
}

#include <atomic>
#include <chrono>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

using namespace refit::literals;

namespace refit::internal::process {

    namespace detail {

        static int open_write_file(const fs::path& path) {
            auto fd = ::open(path.c_str(), O_CREAT | O_WRONLY | O_TRUNC, 0644);
            if (fd < 0) {
                throw std::runtime_error("failed to open file for write: {}"_format(path.string()));
            }
            return fd;
        }

        static int spawn_and_wait(
                const std::vector<std::string>& args, const fs::path& stdout_path, const fs::path& stderr_path) {
            if (args.empty()) {
                throw std::invalid_argument("empty command line");
            }

            auto stdout_fd = open_write_file(stdout_path);
            auto stderr_fd = open_write_file(stderr_path);

            auto pid = ::fork();
            if (pid < 0) {
                ::close(stdout_fd);
                ::close(stderr_fd);
                throw std::runtime_error("fork failed");
            }

            if (pid == 0) {
                if (::dup2(stdout_fd, STDOUT_FILENO) < 0) {
                    _exit(exec_failed_exit_code);
                }
                if (::dup2(stderr_fd, STDERR_FILENO) < 0) {
                    _exit(exec_failed_exit_code);
                }

                ::close(stdout_fd);
                ::close(stderr_fd);

                std::vector<char*> argv{};
                argv.reserve(args.size() + 1U);
                for (const auto& arg : args) {
                    argv.push_back(const_cast<char*>(arg.c_str()));
                }
                argv.push_back(nullptr);

                ::execvp(argv[0], argv.data());
                _exit(exec_failed_exit_code);
            }

            ::close(stdout_fd);
            ::close(stderr_fd);

            int status = 0;
            if (::waitpid(pid, &status, 0) < 0) {
                throw std::runtime_error("waitpid failed");
            }

            if (WIFEXITED(status)) {
                return WEXITSTATUS(status);
            }
            if (WIFSIGNALED(status)) {
                return 128 + WTERMSIG(status);
            }
            return 1;
        }

    }  // namespace detail

    process_result run_process(const std::vector<std::string>& args, const fs::path& work_dir) {
        debug_log("exec: ", utils::join_with_separator(args, " "));

        auto stdout_path = work_dir / "stdout.txt";
        auto stderr_path = work_dir / "stderr.txt";

        process_result result{};
        result.exit_code = detail::spawn_and_wait(args, stdout_path, stderr_path);
        result.out = read_text_file(stdout_path);
        result.err = read_text_file(stderr_path);

        std::error_code ec{};
        fs::remove(stdout_path, ec);
        fs::remove(stderr_path, ec);
        return result;
    }

    std::string read_text_file(const fs::path& path) {
        std::ifstream in{path, std::ios::binary};
        if (!in) {
            throw std::runtime_error("failed to open {}"_format(path.string()));
        }
        std::ostringstream ss{};
        ss << in.rdbuf();
        if (!in.good() && !in.eof()) {
            throw std::runtime_error("failed to read {}"_format(path.string()));
        }
        return ss.str();
    }

    void write_text_file(const fs::path& path, std::string_view text) {
        std::ofstream out{path, std::ios::binary | std::ios::trunc};
        if (!out) {
            throw std::runtime_error("failed to open file for write: {}"_format(path.string()));
        }
        out << text;
        if (!out) {
            throw std::runtime_error("failed to write file: {}"_format(path.string()));
        }
    }

    scratch_dir::scratch_dir(std::string_view prefix) {
        static std::atomic<unsigned> counter{0U};
        auto now = std::chrono::system_clock::now().time_since_epoch().count();
        auto name = "{}_{}_{}_{}"_format(prefix, static_cast<long>(::getpid()), now, counter++);
        path_ = fs::temp_directory_path() / name;

        std::error_code ec{};
        fs::create_directories(path_, ec);
        if (ec) {
            throw std::runtime_error("failed to create directory: {}"_format(path_.string()));
        }
    }

    scratch_dir::~scratch_dir() {
        std::error_code ec{};
        fs::remove_all(path_, ec);
    }

}  // namespace refit::internal::process
