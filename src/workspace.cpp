#include "refit/snapshot.hpp"

#include "refit/format.hpp"

#include "internal/checker.hpp"
#include "internal/diff.hpp"
#include "internal/normalize.hpp"
#include "internal/process.hpp"

#include <algorithm>
#include <iterator>
#include <system_error>

using namespace refit::literals;

namespace refit {

    namespace fs = std::filesystem;

    namespace detail {

        static fs::path destination(const fs::path& root, std::string_view path) {
            try {
                return root / workspace_relative(path);
            } catch (const std::invalid_argument& e) {
                throw std::runtime_error("refusing to write {}: {}"_format(path, e.what()));
            }
        }

    }  // namespace detail

    workspace::workspace(session& s) : workspace{s, internal::checks::make_default_checkers(s.config)} {}

    workspace::workspace(session& s, std::vector<std::unique_ptr<checker>> checkers)
            : session_{&s}, checkers_{std::move(checkers)} {}

    std::unique_ptr<snapshot> workspace::load() {
        auto files = read_files();
        if (!loaded_) {
            original_ = files;
            loaded_ = true;
        }
        return make_snapshot(std::move(files));
    }

    std::unique_ptr<snapshot> workspace::make_snapshot(file_map files) {
        if (files.empty()) {
            throw load_error("no source files found in {}"_format(root().string()));
        }

        item_tree items{};
        for (const auto& [path, text] : files) {
            index_items(items, path, text);
        }

        std::vector<diagnostic> diagnostics{};
        for (const auto& c : checkers_) {
            std::vector<diagnostic> found{};
            try {
                found = c->check(files);
            } catch (const load_error&) {
                throw;
            } catch (const std::runtime_error& e) {
                throw load_error(e.what());
            }
            std::ranges::move(found, std::back_inserter(diagnostics));
        }

        if (session_->debugging("load"sv)) {
            *session_->err << "load: {} files, {} errors"_format(files.size(), diagnostics.size()) << '\n';
        }
        debug_log("loaded ", files.size(), " files with ", diagnostics.size(), " diagnostics");

        return std::make_unique<snapshot>(*this, std::move(files), std::move(items), std::move(diagnostics));
    }

    file_map workspace::read_files() const {
        const auto& cfg = session_->config;
        std::error_code ec{};
        if (!fs::is_directory(cfg.root, ec)) {
            throw load_error("workspace root is not a directory: {}"_format(cfg.root.string()));
        }

        file_map files{};
        try {
            fs::recursive_directory_iterator it{cfg.root}, end{};
            for (; it != end; ++it) {
                const auto& entry = *it;
                auto name = entry.path().filename().string();
                if (entry.is_directory()) {
                    if (std::ranges::find(cfg.exclude, name) != cfg.exclude.end()) {
                        it.disable_recursion_pending();
                    }
                    continue;
                }
                if (!entry.is_regular_file() || !cfg.is_source_file(entry.path())) {
                    continue;
                }
                auto rel = entry.path().lexically_relative(cfg.root).generic_string();
                files.emplace(std::move(rel), internal::process::read_text_file(entry.path()));
            }
        } catch (const std::runtime_error& e) {
            throw load_error("reading workspace: {}"_format(e.what()));
        }
        return files;
    }

    std::string workspace::format(std::string_view path, std::string text) const {
        const auto& cfg = session_->config;
        if (cfg.formatter.empty()) {
            return internal::normalize::tidy_whitespace(text);
        }
        try {
            return internal::normalize::run_formatter(cfg.formatter, path, text);
        } catch (const std::runtime_error& e) {
            if (!cfg.quiet) {
                *session_->err << "warning: " << e.what() << '\n';
            }
        }
        return text;
    }

    std::string workspace::diff(const file_map& current) const {
        return internal::diff::unified_diff(session_->config.diff_path, original_, current);
    }

    size_t workspace::write(const file_map& current) const {
        size_t touched = 0U;
        for (const auto& [path, text] : current) {
            auto it = original_.find(path);
            if (it != original_.end() && it->second == text) {
                continue;
            }
            auto dest = detail::destination(root(), path);
            if (dest.has_parent_path()) {
                fs::create_directories(dest.parent_path());
            }
            internal::process::write_text_file(dest, text);
            ++touched;
        }
        for (const auto& [path, _] : original_) {
            if (!current.contains(path)) {
                fs::remove(detail::destination(root(), path));
                ++touched;
            }
        }
        debug_log("wrote ", touched, " files");
        return touched;
    }

}  // namespace refit
