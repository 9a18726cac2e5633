#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace refit {

    using namespace std::string_view_literals;

    enum class item_kind : uint8_t {
        function,
        variable,
        type,
        alias,
        namespace_scope,
    };

    inline constexpr std::string_view to_string(item_kind kind) {
        switch (kind) {
            case item_kind::function:
                return "func"sv;
            case item_kind::variable:
                return "var"sv;
            case item_kind::type:
                return "type"sv;
            case item_kind::alias:
                return "alias"sv;
            case item_kind::namespace_scope:
                return "namespace"sv;
        }
        return "var"sv;
    }

    using item_id = uint32_t;
    inline constexpr item_id no_item = std::numeric_limits<item_id>::max();

    struct item {
        std::string name{};
        item_kind kind{item_kind::variable};
        std::string file{};
        // byte span of the whole declaration in file, end exclusive
        size_t begin{};
        size_t end{};
        item_id outer{no_item};
    };

    // Arena of declarations. Nodes only link to their owning scope; top-level
    // declarations have no outer.
    class item_tree {
      public:
        item_id add(item node);

        const item& at(item_id id) const;
        item& at(item_id id);

        item_id outer(item_id id) const { return at(id).outer; }
        item_id top_item(item_id id) const;

        // Names of the enclosing items joined with '.', e.g. "point.x".
        std::string qualified_name(item_id id) const;

        std::optional<item_id> find(std::string_view qualified) const;
        std::vector<item_id> find_all(std::string_view qualified) const;
        std::vector<item_id> children(item_id id) const;

        size_t size() const { return items_.size(); }
        bool empty() const { return items_.empty(); }
        const std::vector<item>& items() const { return items_; }

      private:
        std::vector<item> items_{};
    };

    // Adds the declarations of one file to items.
    void index_items(item_tree& items, std::string_view file, std::string_view text);

}  // namespace refit
