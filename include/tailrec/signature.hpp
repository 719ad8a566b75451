// signature.hpp - decomposes a (fn ...) form into its parameter/return descriptors
#pragma once
#include "tailrec/edn.hpp"
#include "tailrec/diagnostics.hpp"
#include <string>
#include <vector>

namespace tailrec {

struct Param { node_ptr pattern; node_ptr type; };

// Immutable view of a function header; patterns and types are deep copies owned here.
struct FunctionSignature {
    std::string name;
    std::vector<Param> params;
    node_ptr ret;       // nullptr when the function declares no return type (unit)
    node_ptr origin;    // the (fn ...) form, for diagnostics positions only
};

// Validate the header shape of a (fn ...) form and extract its signature.
// Reports E1000..E1005 and returns false on malformed input.
bool extract_signature(const node_ptr& fn_form, FunctionSignature& out, ErrorReporter& rep);

// Ordered parameter patterns / types.
std::vector<node_ptr> input_patterns(const FunctionSignature& sig);
std::vector<node_ptr> input_types(const FunctionSignature& sig);
// Declared return type, or the unit type (tuple) when absent.
node_ptr return_type(const FunctionSignature& sig);
// (tuple T1 ... Tn): the argument-tuple type used as the trampoline state.
node_ptr state_type(const FunctionSignature& sig);

// Names bound by a pattern, in left-to-right order.
std::vector<std::string> bound_names(const node_ptr& pattern);
// The expression that rebuilds the value a pattern destructured: x -> x, (mut x) -> x,
// (tuple p...) -> (tuple e...). Returns nullptr when the pattern contains a wildcard or literal.
node_ptr pattern_to_expr(const node_ptr& pattern);
// Copy of `pattern` with every `_` replaced by a fresh __argN binding.
node_ptr name_wildcards(const node_ptr& pattern, int& counter);

} // namespace tailrec
