// Compact and pretty EDN printers. Metadata (positions, opaque markers) is never printed.
#include "tailrec/edn.hpp"
#include <functional>

namespace tailrec {

std::string to_string(const node &n)
{
    struct V
    {
        std::string operator()(std::monostate) const { return "nil"; }
        std::string operator()(bool b) const { return b ? "true" : "false"; }
        std::string operator()(int64_t i) const { return std::to_string(i); }
        std::string operator()(const std::string &s) const
        {
            std::string out = "\"";
            for (char c : s)
            {
                if (c == '"' || c == '\\')
                    out += '\\';
                if (c == '\n')
                {
                    out += "\\n";
                    continue;
                }
                out += c;
            }
            return out + '"';
        }
        std::string operator()(const keyword &k) const { return ':' + k.name; }
        std::string operator()(const symbol &s) const { return s.name; }
        std::string join(const std::vector<node_ptr> &elems, char open, char close) const
        {
            std::string out(1, open);
            bool first = true;
            for (auto &ch : elems)
            {
                if (!first)
                    out += ' ';
                first = false;
                out += to_string(ch);
            }
            out += close;
            return out;
        }
        std::string operator()(const list &l) const { return join(l.elems, '(', ')'); }
        std::string operator()(const vector_t &v) const { return join(v.elems, '[', ']'); }
    };
    return std::visit(V{}, n.data);
}

std::string to_pretty_string(const node &n, int indentWidth)
{
    // Compact single-line forms for short collections; control forms always break so
    // rewritten function bodies stay readable.
    auto indentStr = [](int spaces) -> std::string {
        if (spaces < 0) spaces = 0;
        return std::string(static_cast<size_t>(spaces), ' ');
    };
    auto is_atomic = [](const node &x) -> bool {
        return !std::holds_alternative<list>(x.data) && !std::holds_alternative<vector_t>(x.data);
    };

    const size_t MAX_INLINE_LEN = 80;

    std::function<std::string(const node &, int)> pp = [&](const node &x, int indent) -> std::string {
        if (is_atomic(x))
            return to_string(x);

        bool isList = std::holds_alternative<list>(x.data);
        const auto &elems = isList ? std::get<list>(x.data).elems : std::get<vector_t>(x.data).elems;
        char openC = isList ? '(' : '[';
        char closeC = isList ? ')' : ']';
        if (elems.empty())
            return std::string(1, openC) + closeC;

        bool forceMulti = false;
        if (isList && std::holds_alternative<symbol>(elems[0]->data))
        {
            static const char *controlSyms[] = {"module", "fn", "block", "if", "match", "loop", "while", "enum"};
            const std::string &head = std::get<symbol>(elems[0]->data).name;
            for (auto s : controlSyms)
            {
                if (head == s)
                {
                    forceMulti = true;
                    break;
                }
            }
        }
        if (!forceMulti)
        {
            std::string inlineForm = to_string(x);
            if (inlineForm.size() + static_cast<size_t>(indent) <= MAX_INLINE_LEN)
                return inlineForm;
        }
        // Multiline: head (and keyword/value pairs after it) on their own lines
        std::string out(1, openC);
        size_t i = 0;
        if (isList && is_atomic(*elems[0]))
        {
            out += pp(*elems[0], indent);
            i = 1;
        }
        for (; i < elems.size(); ++i)
        {
            out += '\n' + indentStr(indent + indentWidth);
            if (is_keyword(*elems[i]) && i + 1 < elems.size())
            {
                out += to_string(*elems[i]) + ' ';
                ++i;
            }
            out += pp(*elems[i], indent + indentWidth);
        }
        out += closeC;
        return out;
    };
    return pp(n, 0);
}

} // namespace tailrec
