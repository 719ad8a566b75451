// rewrite.hpp - tail-position classification and rewriting of a function body
#pragma once
#include "tailrec/edn.hpp"
#include "tailrec/config.hpp"
#include <string>
#include <vector>

namespace tailrec {

// Closed set of expression kinds the rewriter distinguishes.
enum class expr_kind { Call, MethodCall, Match, Conditional, Block, Return, Opaque, Other };

expr_kind classify(const node_ptr& n);
const char* kind_name(expr_kind k);

// True for block elements that are statements rather than a trailing expression:
// (let ...), (semi ...), and item forms (fn ...) / (enum ...).
bool is_statement(const node_ptr& n);

// True when evaluating `n` never completes normally: a return, a loop with no break of its
// own, or an if/match/block whose every path does one of those.
bool diverges(const node_ptr& n);

struct RewriteContext {
    std::string fn_name;          // self-recursion is detected by equality with this name
    const TransformOptions* opts; // variant names and tracing; never null
};

struct RewriteStats {
    int continues = 0;      // self-tail-calls turned into Continue
    int returns = 0;        // terminal values wrapped in Return
    int opaque_skipped = 0; // finalized nodes met again and left alone
};

// Rewrites tail positions into Action::Continue / Action::Return constructions and marks each
// produced node opaque, so running the rewriter again over the same tree changes nothing.
class TailRewriter {
public:
    explicit TailRewriter(RewriteContext ctx) : ctx_(std::move(ctx)) {}

    // Rewrite all (return ...) operands of the body, then the body's own tail positions.
    void rewrite_body(node_ptr& body);
    // Rewrite the expression occupying a tail position (slot is replaced in place).
    void rewrite_tail(node_ptr& slot);

    const RewriteStats& stats() const { return stats_; }

    // Construction helpers, also used by the rebuilder.
    node_ptr make_continue(std::vector<node_ptr> args, const node_ptr& origin);
    node_ptr make_return(node_ptr value, const node_ptr& origin);

private:
    void rewrite_returns(node_ptr& n);
    void rewrite_block_tail(node_ptr& block);
    void rewrite_return_form(node_ptr& ret);
    bool is_self_name(const node_ptr& callee) const;

    RewriteContext ctx_;
    RewriteStats stats_;
};

// Calls to `fn_name` (plain or method style) anywhere in the tree, outside nested fn items.
int count_self_calls(const node_ptr& n, const std::string& fn_name);

} // namespace tailrec
