#include "refit/items.hpp"

#include "internal/scan.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>

namespace refit {

    namespace detail {

        using internal::scan::token;

        static constexpr std::array<std::string_view, 31> non_name_keywords{
                "struct"sv,    "class"sv,    "union"sv,     "enum"sv,      "namespace"sv,    "typedef"sv,
                "using"sv,     "template"sv, "typename"sv,  "const"sv,     "constexpr"sv,    "static"sv,
                "inline"sv,    "extern"sv,   "virtual"sv,   "friend"sv,    "volatile"sv,     "mutable"sv,
                "explicit"sv,  "unsigned"sv, "signed"sv,    "register"sv,  "thread_local"sv, "consteval"sv,
                "constinit"sv, "noexcept"sv, "override"sv,  "final"sv,     "public"sv,       "private"sv,
                "protected"sv};

        static constexpr bool is_keyword(std::string_view word) {
            return std::ranges::find(non_name_keywords, word) != non_name_keywords.end();
        }

        static constexpr bool is_access_specifier(std::string_view word) {
            return word == "public"sv || word == "private"sv || word == "protected"sv;
        }

        class indexer {
          public:
            indexer(item_tree& items, std::string_view file, const std::vector<token>& tokens)
                    : items_{items}, file_{file}, toks_{tokens} {}

            void run() {
                size_t i = 0U;
                parse_block(i, no_item);
            }

          private:
            struct statement {
                size_t first{};
                std::string_view name{};
                bool name_frozen{false};
                bool freeze_by_paren{false};
                bool saw_paren{false};
                bool saw_assign{false};
                bool scoped{false};
                bool is_namespace{false};
                bool is_type{false};
                bool is_enum{false};
                bool is_alias{false};
                bool skip{false};
                size_t idents{0U};
                item_id self{no_item};
            };

            bool is_single_colon(size_t i) const {
                if (!toks_[i].is(':')) {
                    return false;
                }
                auto prev_colon = i > 0U && toks_[i - 1U].is(':') && toks_[i - 1U].end == toks_[i].begin;
                auto next_colon = i + 1U < toks_.size() && toks_[i + 1U].is(':') && toks_[i + 1U].begin == toks_[i].end;
                return !prev_colon && !next_colon;
            }

            // Parses statements up to and including the '}' closing the current scope.
            void parse_block(size_t& i, item_id outer) {
                while (i < toks_.size()) {
                    if (toks_[i].is('}')) {
                        ++i;
                        return;
                    }
                    if (toks_[i].is(';')) {
                        ++i;
                        continue;
                    }
                    parse_statement(i, outer);
                }
            }

            void skip_balanced(size_t& i, char open, char close) {
                int depth = 0;
                while (i < toks_.size()) {
                    if (toks_[i].is(open)) {
                        ++depth;
                    }
                    else if (toks_[i].is(close)) {
                        --depth;
                        if (depth == 0) {
                            ++i;
                            return;
                        }
                    }
                    ++i;
                }
            }

            item_kind kind_of(const statement& st) const {
                if (st.is_namespace) {
                    return item_kind::namespace_scope;
                }
                if (st.is_alias) {
                    return item_kind::alias;
                }
                if (st.is_type && !st.freeze_by_paren) {
                    return item_kind::type;
                }
                if (st.freeze_by_paren) {
                    return item_kind::function;
                }
                return item_kind::variable;
            }

            void finish(const statement& st, size_t end, item_id outer) {
                if (st.self != no_item) {
                    auto& node = items_.at(st.self);
                    node.end = end;
                    node.name = std::string{st.name};
                    return;
                }
                if (st.skip || st.name.empty() || st.name == "static_assert"sv) {
                    return;
                }
                items_.add(item{
                        .name = std::string{st.name},
                        .kind = kind_of(st),
                        .file = std::string{file_},
                        .begin = toks_[st.first].begin,
                        .end = end,
                        .outer = outer});
            }

            void freeze(statement& st) {
                st.name_frozen = true;
            }

            void note_identifier(statement& st, std::string_view word) {
                ++st.idents;
                if (!st.name_frozen) {
                    if (word == "struct"sv || word == "class"sv || word == "union"sv) {
                        st.is_type = true;
                        st.scoped = !st.is_enum;
                    }
                    else if (word == "enum"sv) {
                        st.is_type = true;
                        st.is_enum = true;
                        st.scoped = false;
                    }
                    else if (word == "namespace"sv) {
                        if (st.idents == 2U && st.is_alias) {
                            // using namespace x;
                            st.skip = true;
                        }
                        st.scoped = true;
                        st.is_namespace = true;
                    }
                    else if (word == "using"sv || word == "typedef"sv) {
                        st.is_alias = true;
                    }
                }
                if (is_keyword(word)) {
                    return;
                }
                if (!st.name_frozen || st.name.empty()) {
                    st.name = word;
                }
            }

            void parse_statement(size_t& i, item_id outer) {
                if (i + 1U < toks_.size() && toks_[i].kind == internal::scan::token_kind::identifier &&
                    is_access_specifier(toks_[i].text) && is_single_colon(i + 1U)) {
                    i += 2U;
                    return;
                }

                if (i + 2U < toks_.size() && toks_[i].is_ident("extern"sv) &&
                    toks_[i + 1U].kind == internal::scan::token_kind::string && toks_[i + 2U].is('{')) {
                    i += 3U;
                    parse_block(i, outer);
                    return;
                }

                statement st{.first = i};
                int depth = 0;

                while (i < toks_.size()) {
                    const auto& t = toks_[i];

                    if (depth > 0) {
                        if (t.is('(') || t.is('[')) {
                            ++depth;
                        }
                        else if (t.is(')') || t.is(']')) {
                            --depth;
                        }
                        else if (t.is('{')) {
                            skip_balanced(i, '{', '}');
                            continue;
                        }
                        else if (t.is('}') || t.is(';')) {
                            // unbalanced parentheses; let the statement end here
                            depth = 0;
                            continue;
                        }
                        ++i;
                        continue;
                    }

                    if (t.is(';')) {
                        ++i;
                        finish(st, t.end, outer);
                        return;
                    }
                    if (t.is('}')) {
                        if (i > st.first) {
                            finish(st, toks_[i - 1U].end, outer);
                        }
                        return;
                    }
                    if (t.is('{')) {
                        freeze(st);
                        if (st.scoped && !st.saw_paren && !st.saw_assign) {
                            ++i;
                            if (st.is_namespace && st.name.empty()) {
                                parse_block(i, outer);
                                return;
                            }
                            st.self = items_.add(item{
                                    .name = std::string{st.name},
                                    .kind = kind_of(st),
                                    .file = std::string{file_},
                                    .begin = toks_[st.first].begin,
                                    .end = t.end,
                                    .outer = outer});
                            parse_block(i, st.self);
                            auto end = toks_[i - 1U].end;
                            if (st.is_namespace) {
                                finish(st, end, outer);
                                return;
                            }
                            items_.at(st.self).end = end;
                            continue;
                        }
                        skip_balanced(i, '{', '}');
                        if (st.saw_paren && !st.saw_assign) {
                            finish(st, toks_[i - 1U].end, outer);
                            return;
                        }
                        continue;
                    }
                    if (t.is_ident("template"sv) && i + 1U < toks_.size() && toks_[i + 1U].is('<')) {
                        ++i;
                        skip_balanced(i, '<', '>');
                        continue;
                    }
                    if (t.is('(') || t.is('[')) {
                        if (!st.name_frozen && t.is('(')) {
                            freeze(st);
                            st.freeze_by_paren = true;
                        }
                        if (t.is('(')) {
                            st.saw_paren = true;
                        }
                        ++depth;
                        ++i;
                        continue;
                    }
                    if (t.is('=')) {
                        if (!st.name_frozen) {
                            freeze(st);
                        }
                        st.saw_assign = true;
                        ++i;
                        continue;
                    }
                    if (is_single_colon(i) && !st.name_frozen) {
                        freeze(st);
                        ++i;
                        continue;
                    }
                    if (t.kind == internal::scan::token_kind::identifier) {
                        note_identifier(st, t.text);
                    }
                    ++i;
                }

                if (!toks_.empty() && i > st.first) {
                    finish(st, toks_.back().end, outer);
                }
            }

            item_tree& items_;
            std::string_view file_;
            const std::vector<token>& toks_;
        };

    }  // namespace detail

    item_id item_tree::add(item node) {
        if (node.outer != no_item && node.outer >= items_.size()) {
            throw std::out_of_range("item outer reference out of range");
        }
        items_.push_back(std::move(node));
        return static_cast<item_id>(items_.size() - 1U);
    }

    const item& item_tree::at(item_id id) const {
        return items_.at(id);
    }

    item& item_tree::at(item_id id) {
        return items_.at(id);
    }

    item_id item_tree::top_item(item_id id) const {
        while (id != no_item && at(id).outer != no_item) {
            id = at(id).outer;
        }
        return id;
    }

    std::string item_tree::qualified_name(item_id id) const {
        std::vector<std::string_view> parts{};
        for (auto cur = id; cur != no_item; cur = at(cur).outer) {
            if (!at(cur).name.empty()) {
                parts.push_back(at(cur).name);
            }
        }
        std::string out{};
        for (auto it = parts.rbegin(); it != parts.rend(); ++it) {
            if (!out.empty()) {
                out.push_back('.');
            }
            out.append(*it);
        }
        return out;
    }

    std::optional<item_id> item_tree::find(std::string_view qualified) const {
        for (item_id id = 0U; id < items_.size(); ++id) {
            if (!items_[id].name.empty() && qualified_name(id) == qualified) {
                return id;
            }
        }
        return std::nullopt;
    }

    std::vector<item_id> item_tree::find_all(std::string_view qualified) const {
        std::vector<item_id> out{};
        for (item_id id = 0U; id < items_.size(); ++id) {
            if (!items_[id].name.empty() && qualified_name(id) == qualified) {
                out.push_back(id);
            }
        }
        return out;
    }

    std::vector<item_id> item_tree::children(item_id id) const {
        std::vector<item_id> out{};
        for (item_id cur = 0U; cur < items_.size(); ++cur) {
            if (items_[cur].outer == id) {
                out.push_back(cur);
            }
        }
        return out;
    }

    void index_items(item_tree& items, std::string_view file, std::string_view text) {
        auto lexed = internal::scan::lex(text);
        detail::indexer{items, file, lexed.tokens}.run();
    }

}  // namespace refit
