#include "refit/snapshot.hpp"

#include "refit/format.hpp"

#include "internal/scan.hpp"

#include <algorithm>

using namespace refit::literals;

namespace refit {

    namespace detail {

        static std::string root_name(const std::filesystem::path& root) {
            auto p = std::filesystem::absolute(root).lexically_normal();
            if (!p.has_filename()) {
                p = p.parent_path();
            }
            return p.filename().string();
        }

    }  // namespace detail

    std::string diagnostic::to_string() const {
        if (file.empty()) {
            return "error: {}"_format(message);
        }
        if (line == 0U) {
            return "{}: error: {}"_format(file, message);
        }
        if (column == 0U) {
            return "{}:{}: error: {}"_format(file, line, message);
        }
        return "{}:{}:{}: error: {}"_format(file, line, column, message);
    }

    void edit_buffer::replace(size_t begin, size_t end, std::string_view text) {
        if (begin > end || end > base_.size()) {
            throw std::out_of_range("edit [{}, {}) outside of text of size {}"_format(begin, end, base_.size()));
        }
        for (const auto& e : edits_) {
            if (e.begin == begin && e.end == end && begin != end) {
                if (e.text == text) {
                    return;
                }
                throw edit_conflict("conflicting edits of [{}, {})"_format(begin, end));
            }
            // inserts may sit on either edge of a replaced range, never inside it
            auto overlaps = begin == end ? (e.begin < begin && begin < e.end)
                          : e.begin == e.end ? (begin < e.begin && e.begin < end)
                                             : (begin < e.end && e.begin < end);
            if (overlaps) {
                throw edit_conflict(
                        "edit [{}, {}) overlaps pending edit [{}, {})"_format(begin, end, e.begin, e.end));
            }
        }
        edits_.push_back(edit{.begin = begin, .end = end, .text = std::string{text}});
    }

    void edit_buffer::assign(std::string_view text) {
        edits_.clear();
        edits_.push_back(edit{.begin = 0U, .end = base_.size(), .text = std::string{text}});
    }

    std::string edit_buffer::bytes() const {
        auto ordered = edits_;
        std::ranges::stable_sort(ordered, [](const edit& a, const edit& b) {
            return a.begin != b.begin ? a.begin < b.begin : a.end < b.end;
        });

        std::string out{};
        out.reserve(base_.size());
        size_t at = 0U;
        for (const auto& e : ordered) {
            out.append(base_, at, e.begin - at);
            out.append(e.text);
            at = e.end;
        }
        out.append(base_, at);
        return out;
    }

    std::string workspace_relative(std::string_view path) {
        std::filesystem::path p{path};
        auto normal = p.lexically_normal();
        if (p.empty() || p.has_root_path() || normal == "." || *normal.begin() == "..") {
            throw std::invalid_argument("{} is outside the workspace"_format(path));
        }
        return normal.generic_string();
    }

    snapshot::snapshot(workspace& ws, file_map files, item_tree items, std::vector<diagnostic> diagnostics)
            : ws_{&ws}, files_{std::move(files)}, items_{std::move(items)}, diagnostics_{std::move(diagnostics)} {
        target_.name = detail::root_name(ws.root());
        for (const auto& [path, _] : files_) {
            target_.files.push_back(path);
        }
    }

    std::unique_ptr<snapshot> snapshot::load() {
        return ws_->make_snapshot(current_files());
    }

    session& snapshot::session() const {
        return ws_->context();
    }

    void snapshot::add_error(std::string message) {
        diagnostics_.push_back(diagnostic{.message = std::move(message)});
    }

    void snapshot::error_at(std::string_view file, size_t offset, std::string message) {
        diagnostic diag{.file = std::string{file}, .message = std::move(message)};
        if (auto content = text(file)) {
            auto pos = internal::scan::position_of(*content, offset);
            diag.line = pos.line;
            diag.column = pos.column;
        }
        diagnostics_.push_back(std::move(diag));
    }

    std::optional<std::string_view> snapshot::text(std::string_view path) const {
        auto it = files_.find(path);
        if (it == files_.end()) {
            return std::nullopt;
        }
        return std::string_view{it->second};
    }

    bool snapshot::has_file(std::string_view path) const {
        if (created_.contains(path)) {
            return true;
        }
        return files_.contains(path) && !removed_.contains(path);
    }

    edit_buffer& snapshot::buffer_for(std::string_view path) {
        if (auto it = edits_.find(path); it != edits_.end()) {
            return it->second;
        }
        auto file = files_.find(path);
        if (file == files_.end()) {
            workspace_relative(path);
        }
        if (file == files_.end() || removed_.contains(path)) {
            throw std::invalid_argument("no such file: {}"_format(path));
        }
        return edits_.emplace(std::string{path}, edit_buffer{file->second}).first->second;
    }

    void snapshot::replace(std::string_view path, size_t begin, size_t end, std::string_view text) {
        buffer_for(path).replace(begin, end, text);
    }

    void snapshot::append(std::string_view path, std::string_view text) {
        auto& buf = buffer_for(path);
        buf.insert(buf.base().size(), text);
    }

    void snapshot::create_file(std::string_view name, std::string_view text) {
        auto path = workspace_relative(name);
        if (has_file(path)) {
            throw std::invalid_argument("file already exists: {}"_format(path));
        }
        if (auto it = removed_.find(path); it != removed_.end()) {
            // removed earlier in this step; recreate on top of the loaded text
            removed_.erase(it);
            auto& buf = buffer_for(path);
            buf.assign(text);
            return;
        }
        created_.emplace(path);
        auto& buf = edits_.emplace(std::string{path}, edit_buffer{std::string{}}).first->second;
        buf.insert(0U, text);
    }

    void snapshot::remove_file(std::string_view path) {
        if (auto it = created_.find(path); it != created_.end()) {
            created_.erase(it);
            edits_.erase(edits_.find(path));
            return;
        }
        if (!files_.contains(path) || removed_.contains(path)) {
            throw std::invalid_argument("no such file: {}"_format(path));
        }
        if (auto it = edits_.find(path); it != edits_.end()) {
            edits_.erase(it);
        }
        removed_.emplace(path);
    }

    bool snapshot::modified() const {
        if (!created_.empty() || !removed_.empty()) {
            return true;
        }
        return std::ranges::any_of(edits_, [](const auto& entry) { return entry.second.changed(); });
    }

    file_map snapshot::current_files() const {
        auto out = files_;
        for (const auto& [path, buf] : edits_) {
            out.insert_or_assign(path, buf.bytes());
        }
        for (const auto& path : removed_) {
            if (auto it = out.find(path); it != out.end()) {
                out.erase(it);
            }
        }
        return out;
    }

    void snapshot::normalize() {
        for (auto& [path, buf] : edits_) {
            if (!created_.contains(path) && !buf.changed()) {
                continue;
            }
            auto current = buf.bytes();
            auto formatted = ws_->format(path, current);
            if (formatted != current) {
                buf.assign(formatted);
            }
        }
    }

    std::string snapshot::diff() const {
        return ws_->diff(current_files());
    }

    size_t snapshot::write() const {
        return ws_->write(current_files());
    }

}  // namespace refit
