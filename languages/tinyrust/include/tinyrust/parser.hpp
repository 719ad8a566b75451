#pragma once
#include <string>
#include <string_view>

#include "tailrec/edn.hpp"

namespace tinyrust {

struct ParseResult {
    bool success{false};
    std::string edn;           // Lowered EDN text of the module
    tailrec::node_ptr module;  // Same tree, with line/col metadata
    std::string error_message; // If !success, human-readable message
    int line{0};
    int column{0};
};

class Parser {
public:
    // Parse tinyrust source text into a (module ...) EDN form.
    ParseResult parse_string(std::string_view src, std::string_view filename = "<memory>") const;
};

} // namespace tinyrust
