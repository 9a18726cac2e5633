#pragma once

#include "items.hpp"
#include "session.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace refit {

    // Workspace-relative path ('/' separated) -> file contents.
    using file_map = std::map<std::string, std::string, std::less<>>;

    struct diagnostic {
        static constexpr bool to_string_formattable = true;

        std::string file{};
        size_t line{};
        size_t column{};
        std::string message{};

        std::string to_string() const;
    };

    // The loader itself failed (I/O, checker could not run), independent of diagnostics.
    class load_error : public std::runtime_error {
      public:
        using std::runtime_error::runtime_error;
    };

    class edit_conflict : public std::runtime_error {
      public:
        using std::runtime_error::runtime_error;
    };

    // Pending replacements against an immutable base text. Offsets always
    // refer to the base, so independent edits compose in any order.
    class edit_buffer {
      public:
        explicit edit_buffer(std::string base) : base_{std::move(base)} {}

        void replace(size_t begin, size_t end, std::string_view text);
        void insert(size_t pos, std::string_view text) { replace(pos, pos, text); }
        void remove(size_t begin, size_t end) { replace(begin, end, {}); }

        // Drops pending edits in favor of one whole-text replacement.
        void assign(std::string_view text);

        bool empty() const { return edits_.empty(); }
        bool changed() const { return bytes() != base_; }
        const std::string& base() const { return base_; }
        std::string bytes() const;

      private:
        struct edit {
            size_t begin{};
            size_t end{};
            std::string text{};
        };

        std::string base_;
        std::vector<edit> edits_{};
    };

    // Normal '/'-separated form of a path below the workspace root; throws
    // std::invalid_argument for absolute paths and paths leaving the root.
    std::string workspace_relative(std::string_view path);

    class checker {
      public:
        virtual ~checker() = default;
        virtual std::vector<diagnostic> check(const file_map& files) const = 0;
    };

    class snapshot;

    // Anything that can produce the next snapshot of the chain: the pristine
    // workspace or a previous snapshot.
    class loader {
      public:
        virtual ~loader() = default;
        virtual std::unique_ptr<snapshot> load() = 0;
    };

    struct target_unit {
        std::string name{};
        std::vector<std::string> files{};

        bool empty() const { return files.empty(); }
    };

    class workspace;

    class snapshot final : public loader {
      public:
        snapshot(workspace& ws, file_map files, item_tree items, std::vector<diagnostic> diagnostics);

        // Applies the pending edits and re-checks them.
        std::unique_ptr<snapshot> load() override;

        size_t errors() const { return diagnostics_.size(); }
        const std::vector<diagnostic>& diagnostics() const { return diagnostics_; }
        void add_error(std::string message);
        void error_at(std::string_view file, size_t offset, std::string message);

        const target_unit& target() const { return target_; }
        const item_tree& items() const { return items_; }
        const file_map& files() const { return files_; }
        refit::session& session() const;
        workspace& owner() const { return *ws_; }

        // Text as loaded, before any pending edit.
        std::optional<std::string_view> text(std::string_view path) const;
        bool has_file(std::string_view path) const;

        void replace(std::string_view path, size_t begin, size_t end, std::string_view text);
        void insert(std::string_view path, size_t pos, std::string_view text) { replace(path, pos, pos, text); }
        void remove(std::string_view path, size_t begin, size_t end) { replace(path, begin, end, {}); }
        void append(std::string_view path, std::string_view text);
        void create_file(std::string_view path, std::string_view text);
        void remove_file(std::string_view path);

        bool modified() const;
        file_map current_files() const;

        // Formats every file touched by pending edits.
        void normalize();

        // Unified diff of the current files against the original workspace.
        std::string diff() const;

        // Writes changed files below the workspace root; returns how many were touched.
        size_t write() const;

      private:
        edit_buffer& buffer_for(std::string_view path);

        workspace* ws_;
        file_map files_;
        item_tree items_;
        std::vector<diagnostic> diagnostics_;
        target_unit target_{};
        std::map<std::string, edit_buffer, std::less<>> edits_{};
        std::set<std::string, std::less<>> created_{};
        std::set<std::string, std::less<>> removed_{};
    };

    class workspace final : public loader {
      public:
        // Uses the built-in checks plus the configured external checker.
        explicit workspace(session& s);
        workspace(session& s, std::vector<std::unique_ptr<checker>> checkers);

        // Reads the source files below the root; the first result is the original state.
        std::unique_ptr<snapshot> load() override;

        std::unique_ptr<snapshot> make_snapshot(file_map files);

        session& context() const { return *session_; }
        const std::filesystem::path& root() const { return session_->config.root; }
        const file_map& original() const { return original_; }

        std::string format(std::string_view path, std::string text) const;
        std::string diff(const file_map& current) const;
        size_t write(const file_map& current) const;

      private:
        file_map read_files() const;

        session* session_;
        std::vector<std::unique_ptr<checker>> checkers_;
        file_map original_{};
        bool loaded_{false};
    };

}  // namespace refit
