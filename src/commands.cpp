#include "refit/commands.hpp"

#include "refit/format.hpp"
#include "refit/utils.hpp"

#include "internal/scan.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>

using namespace refit::literals;

namespace refit {

    namespace detail {

        namespace scan = internal::scan;

        struct text_span {
            size_t begin{};
            size_t end{};
        };

        // Declaration span widened to whole lines when nothing else shares them.
        static text_span declaration_lines(std::string_view text, const item& node) {
            auto first = scan::line_start(text, node.begin);
            auto last = scan::line_end(text, node.end);
            auto before = text.substr(first, node.begin - first);
            auto after = text.substr(node.end, last - node.end);
            if (utils::trim_view(before).empty() && utils::trim_view(after).empty()) {
                return text_span{first, last};
            }
            return text_span{node.begin, node.end};
        }

        static std::string as_block(std::string_view text) {
            std::string out{text};
            if (!out.ends_with('\n')) {
                out.push_back('\n');
            }
            return out;
        }

        // Separator that puts appended text on a new paragraph.
        static std::string_view paragraph_break(std::optional<std::string_view> text) {
            if (!text || text->empty() || text->ends_with('\n')) {
                return "\n"sv;
            }
            return "\n\n"sv;
        }

        static std::vector<item_id> lookup(snapshot& snap, std::string_view name) {
            auto ids = snap.items().find_all(name);
            if (ids.empty()) {
                snap.add_error("unknown item {}"_format(name));
            }
            return ids;
        }

        static void append_paragraph(snapshot& snap, std::string_view path, std::string_view block) {
            std::string text{paragraph_break(snap.text(path))};
            text.append(block);
            snap.append(path, text);
        }

        static void add_after_item(snapshot& snap, item_id id, std::string_view block) {
            const auto& items = snap.items();
            const auto& node = items.at(items.top_item(id));
            auto text = snap.text(node.file);
            if (!text || !snap.has_file(node.file)) {
                snap.add_error("cannot add after {}: {} was removed"_format(items.qualified_name(id), node.file));
                return;
            }
            auto pos = scan::line_end(*text, node.end);
            std::string insertion{pos == text->size() ? paragraph_break(text) : "\n"sv};
            insertion.append(block);
            snap.insert(node.file, pos, insertion);
        }

        static void rename(snapshot& snap, std::string_view old_name, std::string_view new_name) {
            const auto& items = snap.items();
            auto ids = lookup(snap, old_name);
            if (ids.empty()) {
                return;
            }

            auto old_simple = items.at(ids.front()).name;
            auto dot = old_name.rfind('.');
            auto prefix = dot == std::string_view::npos ? std::string_view{} : old_name.substr(0, dot);
            if (auto new_dot = new_name.rfind('.'); new_dot != std::string_view::npos) {
                if (new_name.substr(0, new_dot) != prefix) {
                    snap.add_error("cannot rename {} to {}: different scope"_format(old_name, new_name));
                    return;
                }
                new_name = new_name.substr(new_dot + 1U);
            }
            if (!utils::is_identifier(new_name)) {
                snap.add_error("{} is not an identifier"_format(new_name));
                return;
            }
            if (new_name == old_simple) {
                return;
            }
            auto qualified = prefix.empty() ? std::string{new_name} : "{}.{}"_format(prefix, new_name);
            if (items.find(qualified)) {
                snap.add_error("cannot rename {} to {}: {} already declared"_format(old_name, new_name, qualified));
                return;
            }

            for (const auto& [path, text] : snap.files()) {
                if (!snap.has_file(path)) {
                    continue;
                }
                auto lexed = scan::lex(text);
                for (const auto& tok : lexed.tokens) {
                    if (tok.is_ident(old_simple)) {
                        snap.replace(path, tok.begin, tok.end, new_name);
                    }
                }
            }
        }

        static void move_to_file(snapshot& snap, const std::vector<std::string_view>& names, std::string_view dest) {
            const auto& items = snap.items();
            std::vector<item_id> moving{};
            bool failed = false;

            for (auto name : names) {
                auto ids = lookup(snap, name);
                if (ids.empty()) {
                    failed = true;
                    continue;
                }
                if (ids.size() > 1U) {
                    snap.add_error("cannot move {}: declared {} times"_format(name, ids.size()));
                    failed = true;
                    continue;
                }
                auto id = ids.front();
                const auto& node = items.at(id);
                if (node.outer != no_item) {
                    snap.add_error(
                            "cannot move {}: not a top-level declaration (inside {})"_format(
                                    name, items.qualified_name(items.top_item(id))));
                    failed = true;
                    continue;
                }
                if (node.file == dest) {
                    snap.add_error("cannot move {}: already in {}"_format(name, dest));
                    failed = true;
                    continue;
                }
                moving.push_back(id);
            }
            if (failed) {
                return;
            }

            std::string moved{};
            for (auto id : moving) {
                const auto& node = items.at(id);
                auto text = snap.text(node.file);
                if (!text || !snap.has_file(node.file)) {
                    snap.add_error("cannot move {}: {} was removed"_format(node.name, node.file));
                    return;
                }
                auto span = declaration_lines(*text, node);
                if (!moved.empty()) {
                    moved.push_back('\n');
                }
                moved += as_block(text->substr(span.begin, span.end - span.begin));
                snap.remove(node.file, span.begin, span.end);
            }

            if (snap.has_file(dest)) {
                append_paragraph(snap, dest, moved);
            }
            else {
                snap.create_file(dest, moved);
            }
        }

        struct rewrite_rule {
            std::string from{};
            std::string to{};
        };

        static bool matches_at(
                const std::vector<scan::token>& tokens, size_t at, const std::vector<scan::token>& pattern) {
            if (at + pattern.size() > tokens.size()) {
                return false;
            }
            for (size_t i = 0U; i < pattern.size(); ++i) {
                if (tokens[at + i].kind != pattern[i].kind || tokens[at + i].text != pattern[i].text) {
                    return false;
                }
            }
            return true;
        }

        static std::vector<rewrite_rule> parse_rules(snapshot& snap, std::string_view args) {
            std::vector<rewrite_rule> rules{};
            bool failed = false;
            size_t begin = 0U;
            while (begin <= args.size()) {
                auto end = args.find_first_of(";\n", begin);
                if (end == std::string_view::npos) {
                    end = args.size();
                }
                auto piece = utils::trim_view(args.substr(begin, end - begin));
                begin = end + 1U;
                if (piece.empty()) {
                    continue;
                }
                auto arrow = piece.find("->"sv);
                if (arrow == std::string_view::npos) {
                    snap.add_error("invalid rewrite {}: expected old -> new"_format(piece));
                    failed = true;
                    continue;
                }
                auto from = utils::trim_view(piece.substr(0, arrow));
                auto to = utils::trim_view(piece.substr(arrow + 2U));
                if (from.empty()) {
                    snap.add_error("invalid rewrite {}: empty pattern"_format(piece));
                    failed = true;
                    continue;
                }
                rules.push_back(rewrite_rule{.from = std::string{from}, .to = std::string{to}});
            }
            if (failed) {
                return {};
            }
            if (rules.empty()) {
                snap.add_error("usage: ex old -> new [; old -> new ...]");
            }
            return rules;
        }

    }  // namespace detail

    void command_registry::add(std::string name, command_handler handler) {
        if (name.empty()) {
            throw std::invalid_argument("command name is empty");
        }
        if (!handler) {
            throw std::invalid_argument("command {} has no handler"_format(name));
        }
        auto [it, inserted] = handlers_.emplace(std::move(name), std::move(handler));
        if (!inserted) {
            throw std::invalid_argument("command {} registered twice"_format(it->first));
        }
    }

    const command_handler* command_registry::find(std::string_view name) const {
        auto it = handlers_.find(name);
        return it == handlers_.end() ? nullptr : &it->second;
    }

    std::vector<std::string> command_registry::names() const {
        std::vector<std::string> out{};
        out.reserve(handlers_.size());
        for (const auto& [name, _] : handlers_) {
            out.push_back(name);
        }
        return out;
    }

    command_registry default_commands() {
        command_registry registry{};
        registry.add("add", commands::add);
        registry.add("debug", commands::debug);
        registry.add("ex", commands::ex);
        registry.add("mv", commands::mv);
        registry.add("rm", commands::rm);
        return registry;
    }

    namespace commands {

        void debug(snapshot& snap, std::string_view args) {
            auto& options = snap.session().debug;
            for (auto field : utils::split_whitespace(args)) {
                auto eq = field.find('=');
                if (eq == std::string_view::npos) {
                    options[std::string{field}] = "1";
                    continue;
                }
                options[std::string{field.substr(0, eq)}] = std::string{field.substr(eq + 1U)};
            }
        }

        void add(snapshot& snap, std::string_view args) {
            auto trimmed = utils::trim_view(args);
            auto split = trimmed.find_first_of(" \t\n");
            auto text = split == std::string_view::npos ? std::string_view{}
                                                        : utils::trim_view(trimmed.substr(split + 1U));
            if (text.empty()) {
                snap.add_error("usage: add <file|item> text");
                return;
            }
            auto dest = trimmed.substr(0, split);
            auto block = detail::as_block(text);

            if (snap.has_file(dest)) {
                detail::append_paragraph(snap, dest, block);
                return;
            }
            if (auto ids = snap.items().find_all(dest); !ids.empty()) {
                detail::add_after_item(snap, ids.front(), block);
                return;
            }
            if (snap.session().config.is_source_file(std::filesystem::path{dest})) {
                snap.create_file(dest, block);
                return;
            }
            snap.add_error("unknown file or item {}"_format(dest));
        }

        void rm(snapshot& snap, std::string_view args) {
            auto names = utils::split_whitespace(args);
            if (names.empty()) {
                snap.add_error("usage: rm item...");
                return;
            }

            std::vector<item_id> targets{};
            for (auto name : names) {
                std::ranges::copy(detail::lookup(snap, name), std::back_inserter(targets));
            }

            const auto& items = snap.items();
            for (auto id : targets) {
                // an enclosing declaration being removed already covers this one
                bool covered = false;
                for (auto o = items.outer(id); o != no_item && !covered; o = items.outer(o)) {
                    covered = std::ranges::find(targets, o) != targets.end();
                }
                if (covered) {
                    continue;
                }
                const auto& node = items.at(id);
                auto text = snap.text(node.file);
                if (!text || !snap.has_file(node.file)) {
                    snap.add_error("cannot remove {}: {} was removed"_format(items.qualified_name(id), node.file));
                    continue;
                }
                auto span = detail::declaration_lines(*text, node);
                snap.remove(node.file, span.begin, span.end);
            }
        }

        void mv(snapshot& snap, std::string_view args) {
            auto fields = utils::split_whitespace(args);
            if (fields.size() < 2U) {
                snap.add_error("usage: mv item newname | mv item... file");
                return;
            }

            auto dest = fields.back();
            const auto& cfg = snap.session().config;
            if (cfg.is_source_file(std::filesystem::path{dest}) && snap.items().find_all(dest).empty()) {
                fields.pop_back();
                detail::move_to_file(snap, fields, dest);
                return;
            }
            if (fields.size() == 2U) {
                detail::rename(snap, fields[0], fields[1]);
                return;
            }
            snap.add_error("usage: mv item newname | mv item... file");
        }

        void ex(snapshot& snap, std::string_view args) {
            auto rules = detail::parse_rules(snap, args);

            std::vector<std::vector<internal::scan::token>> patterns{};
            for (const auto& rule : rules) {
                auto lexed = internal::scan::lex(rule.from);
                if (!lexed.errors.empty() || lexed.tokens.empty()) {
                    snap.add_error("invalid rewrite pattern {}"_format(rule.from));
                    return;
                }
                patterns.push_back(std::move(lexed.tokens));
            }

            for (const auto& [path, text] : snap.files()) {
                if (!snap.has_file(path)) {
                    continue;
                }
                auto lexed = internal::scan::lex(text);
                const auto& tokens = lexed.tokens;
                for (size_t r = 0U; r < rules.size(); ++r) {
                    const auto& pattern = patterns[r];
                    size_t i = 0U;
                    while (i < tokens.size()) {
                        if (!detail::matches_at(tokens, i, pattern)) {
                            ++i;
                            continue;
                        }
                        auto begin = tokens[i].begin;
                        auto end = tokens[i + pattern.size() - 1U].end;
                        try {
                            snap.replace(path, begin, end, rules[r].to);
                        } catch (const edit_conflict&) {
                            snap.error_at(path, begin, "rewrite of {} overlaps another rewrite"_format(rules[r].from));
                        }
                        i += pattern.size();
                    }
                }
            }
        }

    }  // namespace commands

}  // namespace refit
