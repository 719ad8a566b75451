#include "tinyrust/source_emitter.hpp"
#include "tailrec/forms.hpp"

#include <sstream>
#include <unordered_map>

namespace tinyrust {
using namespace tailrec;

namespace {

// Binding strength, weakest first. Operands weaker than their slot get parentheses.
enum prec : int { P_JUMP = 1, P_ASSIGN = 2, P_OR = 3, P_AND = 4, P_CMP = 5, P_ADD = 6, P_MUL = 7, P_UNARY = 8, P_POSTFIX = 9, P_ATOM = 10 };

int binary_prec(const std::string& op){
    static const std::unordered_map<std::string,int> table{
        {"||", P_OR}, {"&&", P_AND},
        {"==", P_CMP}, {"!=", P_CMP}, {"<", P_CMP}, {"<=", P_CMP}, {">", P_CMP}, {">=", P_CMP},
        {"+", P_ADD}, {"-", P_ADD}, {"*", P_MUL}, {"/", P_MUL}, {"%", P_MUL} };
    auto it = table.find(op);
    return it == table.end() ? 0 : it->second;
}

class SourceEmitter {
public:
    explicit SourceEmitter(const EmitOptions& o) : opts_(o) {}

    std::string top(const node_ptr& n){
        auto h = head_name(n);
        if(h == "module"){
            const auto& el = elems_of(n);
            for(size_t i=1;i<el.size();++i){
                if(i > 1) out_ << "\n";
                item(el[i]);
            }
        } else if(h == "fn" || h == "enum"){
            item(n);
        } else {
            out_ << expr(n, P_JUMP);
        }
        return out_.str();
    }

private:
    const EmitOptions& opts_;
    std::ostringstream out_;
    int depth_ = 0;

    std::string pad() const { return std::string(static_cast<size_t>(depth_ * opts_.indent), ' '); }

    [[noreturn]] static void unsupported(const node_ptr& n){
        std::string where;
        if(n && line(*n) >= 0) where = " at " + std::to_string(line(*n)) + ":" + std::to_string(col(*n));
        throw emit_error("no source form for " + to_string(n) + where);
    }

    // ---- items ----
    void item(const node_ptr& n){
        if(is_form(n, "fn")) fn(n);
        else if(is_form(n, "enum")) enum_decl(n);
        else unsupported(n);
    }

    void fn(const node_ptr& n){
        for(auto& a : elems_of(kw_value(n, "attrs"))) out_ << pad() << "#[" << name_of(a) << "]\n";
        out_ << pad() << "fn " << name_of(kw_value(n, "name")) << "(";
        bool first = true;
        for(auto& p : elems_of(kw_value(n, "params"))){
            const auto& pe = elems_of(p);
            if(pe.size() != 3) unsupported(p);
            if(!first) out_ << ", ";
            first = false;
            out_ << pattern(pe[1]) << ": " << type(pe[2]);
        }
        out_ << ")";
        if(auto ret = kw_value(n, "ret")) out_ << " -> " << type(ret);
        auto body = kw_value(n, "body");
        if(!body){ out_ << ";\n"; return; }
        out_ << " " << block(body) << "\n";
    }

    void enum_decl(const node_ptr& n){
        const auto& el = elems_of(n);
        out_ << pad() << "enum " << name_of(el.size() > 1 ? el[1] : nullptr);
        const auto& gens = elems_of(kw_value(n, "generics"));
        if(!gens.empty()){
            out_ << "<";
            for(size_t i=0;i<gens.size();++i) out_ << (i ? ", " : "") << name_of(gens[i]);
            out_ << ">";
        }
        out_ << " { ";
        const auto& vars = elems_of(kw_value(n, "variants"));
        for(size_t i=0;i<vars.size();++i){
            const auto& ve = elems_of(vars[i]);
            // unit variants may be written as a bare symbol
            out_ << (i ? ", " : "") << (ve.empty() ? name_of(vars[i]) : name_of(ve[0]));
            if(ve.size() > 1){
                out_ << "(";
                for(size_t j=1;j<ve.size();++j) out_ << (j > 1 ? ", " : "") << type(ve[j]);
                out_ << ")";
            }
        }
        out_ << " }\n";
    }

    // ---- types and patterns ----
    std::string type(const node_ptr& t){
        auto n = name_of(t);
        if(n == "Int") return "i64";
        if(n == "Bool") return "bool";
        if(n == "Unit") return "()";
        if(!n.empty()) return n;
        if(is_form(t, "tuple")) return tuple_of(t, [this](const node_ptr& x){ return type(x); });
        if(is_form(t, "app")){
            const auto& el = elems_of(t);
            std::string s = name_of(el.size() > 1 ? el[1] : nullptr) + "<";
            for(size_t i=2;i<el.size();++i) s += (i > 2 ? ", " : "") + type(el[i]);
            return s + ">";
        }
        unsupported(t);
    }

    std::string pattern(const node_ptr& p){
        if(!p) unsupported(p);
        if(std::holds_alternative<int64_t>(p->data)) return std::to_string(std::get<int64_t>(p->data));
        if(std::holds_alternative<bool>(p->data)) return std::get<bool>(p->data) ? "true" : "false";
        auto n = name_of(p);
        if(!n.empty()) return n;
        if(is_form(p, "mut")) return "mut " + name_of(elems_of(p).at(1));
        if(is_form(p, "tuple")) return tuple_of(p, [this](const node_ptr& x){ return pattern(x); });
        if(is_form(p, "ctor")){
            const auto& el = elems_of(p);
            std::string s = name_of(el.size() > 1 ? el[1] : nullptr) + "(";
            for(size_t i=2;i<el.size();++i) s += (i > 2 ? ", " : "") + pattern(el[i]);
            return s + ")";
        }
        unsupported(p);
    }

    template<class F>
    static std::string tuple_of(const node_ptr& t, F each){
        const auto& el = elems_of(t);
        if(el.size() == 1) return "()";
        std::string s = "(";
        for(size_t i=1;i<el.size();++i) s += (i > 1 ? ", " : "") + each(el[i]);
        return s + (el.size() == 2 ? ",)" : ")");
    }

    // ---- blocks ----
    std::string block(const node_ptr& b){
        const auto& el = elems_of(b);
        if(el.size() == 1) return "{}";
        std::ostringstream s;
        s << "{\n";
        ++depth_;
        for(size_t i=1;i<el.size();++i){
            const auto& st = el[i];
            auto h = head_name(st);
            if(h == "fn" || h == "enum"){
                std::ostringstream saved;
                saved.swap(out_);
                item(st);
                saved.swap(out_);
                s << saved.str();
            } else if(h == "let"){
                s << pad() << let(st) << ";\n";
            } else if(h == "semi"){
                s << pad() << expr(elems_of(st).at(1), P_JUMP) << ";\n";
            } else {
                s << pad() << expr(st, P_JUMP) << "\n";
            }
        }
        --depth_;
        s << pad() << "}";
        return s.str();
    }

    std::string let(const node_ptr& n){
        const auto& el = elems_of(n);
        if(el.size() != 3 && el.size() != 5) unsupported(n);
        std::string s = "let " + pattern(el[1]);
        if(auto t = kw_value(n, "type")) s += ": " + type(t);
        return s + " = " + expr(el.back(), P_JUMP);
    }

    // ---- expressions ----
    std::string expr(const node_ptr& e, int min){
        int p = P_ATOM;
        auto s = expr_raw(e, p);
        return p < min ? "(" + s + ")" : s;
    }

    std::string args(const std::vector<node_ptr>& el, size_t from){
        std::string s = "(";
        for(size_t i=from;i<el.size();++i) s += (i > from ? ", " : "") + expr(el[i], P_JUMP);
        return s + ")";
    }

    std::string expr_raw(const node_ptr& e, int& p){
        if(!e) unsupported(e);
        if(std::holds_alternative<int64_t>(e->data)){
            auto v = std::get<int64_t>(e->data);
            if(v < 0) p = P_UNARY;
            return std::to_string(v);
        }
        if(std::holds_alternative<bool>(e->data)) return std::get<bool>(e->data) ? "true" : "false";
        if(auto* s = as_symbol(*e)) return s->name;

        auto h = head_name(e);
        const auto& el = elems_of(e);
        if(int bp = binary_prec(h); bp && el.size() == 3){
            p = bp;
            // comparisons do not chain
            int lhs = bp == P_CMP ? bp + 1 : bp;
            return expr(el[1], lhs) + " " + h + " " + expr(el[2], bp + 1);
        }
        if(h == "neg" || h == "not"){
            p = P_UNARY;
            return (h == "neg" ? "-" : "!") + expr(el.at(1), P_UNARY);
        }
        if(h == "assign"){
            p = P_ASSIGN;
            return expr(el.at(1), P_OR) + " = " + expr(el.at(2), P_ASSIGN);
        }
        if(h == "call"){
            p = P_POSTFIX;
            return expr(el.at(1), P_POSTFIX) + args(el, 2);
        }
        if(h == "method-call"){
            p = P_POSTFIX;
            return expr(el.at(1), P_POSTFIX) + "." + name_of(el.at(2)) + args(el, 3);
        }
        if(h == "tuple") return tuple_of(e, [this](const node_ptr& x){ return expr(x, P_JUMP); });
        if(h == "block" || h == "if" || h == "match" || h == "loop" || h == "while"){
            // parenthesized as operands: `if c {..} else {..} + 1` as a statement ends at the brace
            p = P_ASSIGN;
            if(h == "block") return block(e);
            if(h == "if") return if_expr(e);
            if(h == "match") return match_expr(e);
            if(h == "loop") return "loop " + block(el.at(1));
            return "while " + expr(el.at(1), P_JUMP) + " " + block(el.at(2));
        }
        if(h == "return" || h == "break"){
            if(el.size() == 1) return h;
            p = P_JUMP;
            return h + " " + expr(el[1], P_JUMP);
        }
        if(h == "continue") return "continue";
        if(h == "closure"){
            p = P_JUMP;
            std::string s = "|";
            const auto& ps = elems_of(el.at(1));
            for(size_t i=0;i<ps.size();++i) s += (i ? ", " : "") + pattern(ps[i]);
            return s + "| " + expr(el.at(2), P_JUMP);
        }
        unsupported(e);
    }

    std::string if_expr(const node_ptr& e){
        const auto& el = elems_of(e);
        std::string s = "if " + expr(el.at(1), P_JUMP) + " " + block(el.at(2));
        if(el.size() > 3){
            s += " else ";
            s += is_form(el[3], "if") ? if_expr(el[3]) : block(el[3]);
        }
        return s;
    }

    std::string match_expr(const node_ptr& e){
        const auto& el = elems_of(e);
        std::string s = "match " + expr(el.at(1), P_JUMP) + " {\n";
        ++depth_;
        for(size_t i=2;i<el.size();++i){
            const auto& arm = elems_of(el[i]);
            if(!is_form(el[i], "arm") || arm.size() < 3) unsupported(el[i]);
            s += pad() + pattern(arm[1]);
            if(auto* g = find_kw(*as_list(*el[i]), "if", 2)) s += " if " + expr(*g, P_JUMP);
            const auto& body = arm.back();
            s += " => " + expr(body, P_JUMP);
            s += is_form(body, "block") ? "\n" : ",\n";
        }
        --depth_;
        return s + pad() + "}";
    }
};

} // namespace

std::string emit_source(const node_ptr& n, const EmitOptions& opts){
    return SourceEmitter(opts).top(n);
}

} // namespace tinyrust
