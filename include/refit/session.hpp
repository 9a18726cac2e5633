#pragma once

#include "config.hpp"

#include <iostream>
#include <ostream>
#include <string>
#include <string_view>
#include <unordered_map>

namespace refit {

    // Per-run state shared by the pipeline and the command handlers. The debug
    // map is written by the `debug` command and read by the controller.
    struct session {
        session_config config{};
        std::unordered_map<std::string, std::string> debug{};
        std::ostream* out{&std::cout};
        std::ostream* err{&std::cerr};

        bool debugging(std::string_view key) const {
            auto it = debug.find(std::string{key});
            return it != debug.end() && !it->second.empty();
        }
    };

}  // namespace refit
