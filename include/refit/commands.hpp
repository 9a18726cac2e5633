#pragma once

#include "snapshot.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace refit {

    // Mutates the snapshot's pending edits for one script command; problems are
    // reported through snapshot::add_error / snapshot::error_at.
    using command_handler = std::function<void(snapshot&, std::string_view)>;

    class command_registry {
      public:
        // Throws std::invalid_argument for an empty or already registered name.
        void add(std::string name, command_handler handler);

        const command_handler* find(std::string_view name) const;
        bool contains(std::string_view name) const { return find(name) != nullptr; }

        std::vector<std::string> names() const;
        size_t size() const { return handlers_.size(); }

      private:
        std::map<std::string, command_handler, std::less<>> handlers_{};
    };

    // debug, add, rm, mv, ex
    command_registry default_commands();

    namespace commands {

        // debug key[=value] ...
        void debug(snapshot& snap, std::string_view args);

        // add <file|item> text
        void add(snapshot& snap, std::string_view args);

        // rm item...
        void rm(snapshot& snap, std::string_view args);

        // mv item newname | mv item... file
        void mv(snapshot& snap, std::string_view args);

        // ex old -> new [; old -> new ...]
        void ex(snapshot& snap, std::string_view args);

    }  // namespace commands

}  // namespace refit
