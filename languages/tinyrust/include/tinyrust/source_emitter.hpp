#pragma once
#include <stdexcept>
#include <string>

#include "tailrec/edn.hpp"

namespace tinyrust {

struct emit_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct EmitOptions {
    int indent = 4;
};

// Render a (module ...), (fn ...) or expression form as tinyrust source.
// Throws emit_error for forms with no surface syntax.
std::string emit_source(const tailrec::node_ptr& n, const EmitOptions& opts = {});

} // namespace tinyrust
