#include "tinyrust/parser.hpp"
#include "grammar.hpp"

#include "tailrec/forms.hpp"

#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/parse_tree.hpp>

#include <cerrno>
#include <cstdlib>

namespace tinyrust {
using namespace tinyrust::grammar;
using tailrec::node_ptr;
using tailrec::form;
using tailrec::n_sym;
using tailrec::n_kw;
using tailrec::n_i64;
using tailrec::n_bool;
using tailrec::node_vec;
using tailrec::operator<<;

namespace {

using tree = tao::pegtl::parse_tree::node;

// Raised while lowering the parse tree; reported like a grammar error.
struct lower_error {
    std::string message;
    int line;
    int column;
};

[[noreturn]] void fail(const tree& t, const std::string& msg){
    auto p = t.begin();
    throw lower_error{ msg, static_cast<int>(p.line), static_cast<int>(p.column) };
}

node_ptr at(node_ptr n, const tree& t){
    auto p = t.begin();
    n->metadata["line"] = n_i64(static_cast<int64_t>(p.line));
    n->metadata["col"] = n_i64(static_cast<int64_t>(p.column));
    return n;
}

bool is_block_like(const tree& t){
    return t.is<block>() || t.is<if_expr>() || t.is<match_expr>() || t.is<loop_expr>() || t.is<while_expr>();
}

int64_t to_int(const tree& t, const std::string& text){
    errno = 0;
    char* end = nullptr;
    long long v = std::strtoll(text.c_str(), &end, 10);
    if(errno == ERANGE || !end || *end) fail(t, "integer literal out of range: " + text);
    return static_cast<int64_t>(v);
}

class Lowering {
public:
    node_ptr module(const tree& root){
        auto m = form("module", {});
        for(auto& c : root.children) m << item(*c);
        return m;
    }

private:
    node_ptr item(const tree& t){
        if(t.is<fn_item>()) return fn(t);
        if(t.is<enum_item>()) return enum_decl(t);
        fail(t, "expected item");
    }

    node_ptr fn(const tree& t){
        auto attrs = node_vec();
        node_ptr name, params = node_vec(), ret, body;
        for(auto& c : t.children){
            if(c->is<attribute>()) attrs << n_sym(c->children.front()->string());
            else if(c->is<ident>()) name = n_sym(c->string());
            else if(c->is<param_list>()){
                for(auto& p : c->children)
                    params << at(form("param", { pattern(*p->children[0]), type(*p->children[1]) }), *p);
            }
            else if(c->is<ret_type>()) ret = type(*c->children.front());
            else if(c->is<block>()) body = block_expr(*c);
        }
        std::vector<node_ptr> rest{ n_kw("name"), name };
        if(!tailrec::elems_of(attrs).empty()){ rest.push_back(n_kw("attrs")); rest.push_back(attrs); }
        rest.push_back(n_kw("params")); rest.push_back(params);
        if(ret){ rest.push_back(n_kw("ret")); rest.push_back(ret); }
        if(body){ rest.push_back(n_kw("body")); rest.push_back(body); }
        return at(form("fn", std::move(rest)), t);
    }

    node_ptr enum_decl(const tree& t){
        node_ptr name;
        auto generic_names = node_vec();
        auto variants = node_vec();
        bool has_generics = false;
        for(auto& c : t.children){
            if(c->is<ident>()) name = n_sym(c->string());
            else if(c->is<generics>()){
                has_generics = true;
                for(auto& g : c->children) generic_names << n_sym(g->string());
            }
            else if(c->is<variant>()){
                auto v = form(c->children.front()->string().c_str(), {});
                for(size_t i=1;i<c->children.size();++i) v << type(*c->children[i]);
                variants << at(v, *c);
            }
        }
        std::vector<node_ptr> rest{ name };
        if(has_generics){ rest.push_back(n_kw("generics")); rest.push_back(generic_names); }
        rest.push_back(n_kw("variants")); rest.push_back(variants);
        return at(form("enum", std::move(rest)), t);
    }

    // ---- types ----
    node_ptr type(const tree& t){
        if(t.is<tuple_type>()){
            std::vector<node_ptr> parts;
            bool comma = false;
            for(auto& c : t.children){
                if(c->is<tuple_comma>()) comma = true;
                else parts.push_back(type(*c));
            }
            if(parts.size() == 1 && !comma) return parts.front();
            return form("tuple", std::move(parts));
        }
        if(t.is<named_type>()){
            auto n = t.children.front()->string();
            if(t.children.size() == 1){
                if(n == "i64" || n == "i32" || n == "isize" || n == "u64" || n == "u32" || n == "usize") return n_sym("Int");
                if(n == "bool") return n_sym("Bool");
                return n_sym(n);
            }
            auto app = form("app", { n_sym(n) });
            for(auto& a : t.children[1]->children) app << type(*a);
            return app;
        }
        fail(t, "expected type");
    }

    // ---- patterns ----
    node_ptr pattern(const tree& t){
        if(t.is<ident>()) return at(n_sym(t.string()), t);
        if(t.is<path>()) return at(n_sym(t.string()), t);
        if(t.is<pat_int>()) return n_i64(to_int(t, t.string()));
        if(t.is<pat_bool>()) return n_bool(t.string() == "true");
        if(t.is<pat_mut>()) return at(form("mut", { n_sym(t.children.front()->string()) }), t);
        if(t.is<pat_tuple>()){
            std::vector<node_ptr> parts;
            bool comma = false;
            for(auto& c : t.children){
                if(c->is<tuple_comma>()) comma = true;
                else parts.push_back(pattern(*c));
            }
            if(parts.size() == 1 && !comma) return parts.front();
            return at(form("tuple", std::move(parts)), t);
        }
        if(t.is<pat_ctor>()){
            auto out = form("ctor", { n_sym(t.children.front()->string()) });
            for(size_t i=1;i<t.children.size();++i) out << pattern(*t.children[i]);
            return at(out, t);
        }
        fail(t, "expected pattern");
    }

    // ---- statements ----
    node_ptr block_expr(const tree& t){
        auto out = at(form("block", {}), t);
        const auto n = t.children.size();
        for(size_t i=0;i<n;++i){
            const auto& c = *t.children[i];
            if(c.is<let_stmt>()){ out << let(c); continue; }
            if(c.is<fn_item>() || c.is<enum_item>()){ out << item(c); continue; }
            // expr_stmt: [expr, semi_tok?]
            auto e = expr(*c.children.front());
            bool semi = c.children.size() > 1;
            if(semi) out << at(form("semi", { e }), c);
            else if(i + 1 == n) out << e;
            else if(is_block_like(*c.children.front())) out << at(form("semi", { e }), c);
            else fail(*t.children[i+1], "expected ';' after expression");
        }
        return out;
    }

    node_ptr let(const tree& t){
        auto& ch = t.children;
        std::vector<node_ptr> rest{ pattern(*ch.front()) };
        if(ch.size() == 3){ rest.push_back(n_kw("type")); rest.push_back(type(*ch[1])); }
        rest.push_back(expr(*ch.back()));
        return at(form("let", std::move(rest)), t);
    }

    // ---- expressions ----
    node_ptr binary_chain(const tree& t){
        auto lhs = expr(*t.children[0]);
        for(size_t i=1;i+1<t.children.size();i+=2){
            auto op = t.children[i]->string();
            lhs = at(form(op.c_str(), { lhs, expr(*t.children[i+1]) }), *t.children[i]);
        }
        return lhs;
    }

    std::vector<node_ptr> args(const tree& call_args_node){
        std::vector<node_ptr> out;
        for(auto& a : call_args_node.children) out.push_back(expr(*a));
        return out;
    }

    node_ptr expr(const tree& t){
        if(t.is<int_lit>()) return n_i64(to_int(t, t.string()));
        if(t.is<bool_lit>()) return n_bool(t.string() == "true");
        if(t.is<ident>() || t.is<path>()) return at(n_sym(t.string()), t);
        if(t.is<block>()) return block_expr(t);

        if(t.is<grammar::expr>()){
            auto op = t.children[1]->string();
            auto place = expr(*t.children[0]);
            auto value = expr(*t.children[2]);
            if(op != "="){
                auto bin = op.substr(0, 1);
                value = at(form(bin.c_str(), { tailrec::clone(place), value }), *t.children[1]);
            }
            return at(form("assign", { place, value }), t);
        }
        if(t.is<or_expr>() || t.is<and_expr>() || t.is<cmp_expr>() || t.is<add_expr>() || t.is<mul_expr>())
            return binary_chain(t);
        if(t.is<unary_expr>()){
            auto op = t.children[0]->string();
            const auto& operand = *t.children[1];
            if(op == "-"){
                if(operand.is<int_lit>()) return n_i64(-to_int(operand, operand.string()));
                return at(form("neg", { expr(operand) }), t);
            }
            return at(form("not", { expr(operand) }), t);
        }
        if(t.is<postfix_expr>()){
            auto recv = expr(*t.children[0]);
            for(size_t i=1;i<t.children.size();++i){
                const auto& m = *t.children[i];
                std::vector<node_ptr> rest{ recv, n_sym(m.children[0]->string()) };
                for(auto& a : args(*m.children[1])) rest.push_back(a);
                recv = at(form("method-call", std::move(rest)), m);
            }
            return recv;
        }
        if(t.is<call_or_name>()){
            std::vector<node_ptr> rest{ at(n_sym(t.children[0]->string()), *t.children[0]) };
            for(auto& a : args(*t.children[1])) rest.push_back(a);
            return at(form("call", std::move(rest)), t);
        }
        if(t.is<paren_expr>()){
            std::vector<node_ptr> parts;
            bool comma = false;
            for(auto& c : t.children){
                if(c->is<tuple_comma>()) comma = true;
                else parts.push_back(expr(*c));
            }
            if(parts.size() == 1 && !comma) return parts.front();
            return at(form("tuple", std::move(parts)), t);
        }
        if(t.is<if_expr>()){
            std::vector<node_ptr> rest{ expr(*t.children[0]), block_expr(*t.children[1]) };
            if(t.children.size() > 2) rest.push_back(expr(*t.children[2]));
            return at(form("if", std::move(rest)), t);
        }
        if(t.is<match_expr>()){
            auto out = form("match", { expr(*t.children[0]) });
            for(size_t i=1;i<t.children.size();++i){
                const auto& a = *t.children[i];
                std::vector<node_ptr> rest{ pattern(*a.children[0]) };
                size_t body = 1;
                if(a.children[1]->is<arm_guard>()){
                    rest.push_back(n_kw("if"));
                    rest.push_back(expr(*a.children[1]->children.front()));
                    body = 2;
                }
                rest.push_back(expr(*a.children[body]));
                out << at(form("arm", std::move(rest)), a);
            }
            return at(out, t);
        }
        if(t.is<loop_expr>()) return at(form("loop", { block_expr(*t.children[0]) }), t);
        if(t.is<while_expr>()) return at(form("while", { expr(*t.children[0]), block_expr(*t.children[1]) }), t);
        if(t.is<return_expr>() || t.is<break_expr>()){
            auto out = form(t.is<return_expr>() ? "return" : "break", {});
            if(!t.children.empty()) out << expr(*t.children[0]);
            return at(out, t);
        }
        if(t.is<continue_expr>()) return at(form("continue", {}), t);
        if(t.is<closure_expr>()){
            auto params = node_vec();
            for(auto& p : t.children[0]->children) params << pattern(*p);
            return at(form("closure", { params, expr(*t.children[1]) }), t);
        }
        fail(t, "unsupported expression");
    }
};

} // namespace

ParseResult Parser::parse_string(std::string_view src, std::string_view filename) const {
    tao::pegtl::memory_input in(src.data(), src.size(), std::string(filename));
    ParseResult r;
    try {
        auto root = tao::pegtl::parse_tree::parse< module_rule, selector >(in);
        if(!root){ r.error_message = "parse failed"; return r; }
        r.module = Lowering().module(*root);
        r.edn = tailrec::to_string(r.module);
        r.success = true;
    } catch (const tao::pegtl::parse_error& e) {
        auto p = e.positions().front();
        r.error_message = e.what(); r.line = static_cast<int>(p.line); r.column = static_cast<int>(p.column);
    } catch (const lower_error& e) {
        r.error_message = std::string(filename) + ":" + std::to_string(e.line) + ":" + std::to_string(e.column) + ": " + e.message;
        r.line = e.line; r.column = e.column;
    }
    return r;
}

} // namespace tinyrust
