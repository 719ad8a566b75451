// EDN reader: lists, vectors, keywords, symbols (including :: paths), integers, booleans, strings.
#include "tailrec/edn.hpp"
#include <cctype>

namespace tailrec {

namespace {

struct reader
{
    std::string_view d;
    size_t p = 0;
    int line = 1, col = 1;
    int last_line = 1, last_col = 1;
    explicit reader(std::string_view s) : d(s) {}
    bool eof() const { return p >= d.size(); }
    char peek(size_t ahead = 0) const { return p + ahead >= d.size() ? '\0' : d[p + ahead]; }
    char get()
    {
        if (eof())
            return '\0';
        last_line = line;
        last_col = col;
        char c = d[p++];
        if (c == '\n')
        {
            ++line;
            col = 1;
        }
        else
        {
            ++col;
        }
        return c;
    }
    void skip_ws()
    {
        while (!eof())
        {
            char c = peek();
            if (c == ';')
            {
                while (!eof() && get() != '\n')
                    continue;
                continue;
            }
            // commas are whitespace in EDN
            if (c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v' || c == ',')
            {
                get();
                continue;
            }
            break;
        }
    }
    [[noreturn]] void fail(const std::string &msg) const { throw parse_error(msg, line, col); }
};

bool is_digit(char c) { return c >= '0' && c <= '9'; }
bool is_symbol_start(char c) { return std::isalpha((unsigned char)c) || c == '*' || c == '!' || c == '_' || c == '?' || c == '-' || c == '+' || c == '/' || c == '<' || c == '>' || c == '=' || c == '$' || c == '%' || c == '&' || c == '|'; }
// ':' is allowed after the first character so that paths like Action::Return read as one symbol
bool is_symbol_char(char c) { return is_symbol_start(c) || is_digit(c) || c == '.' || c == '#' || c == ':'; }

node_ptr make_int(int64_t v) { return detail::make_node(node_data{v}); }
void attach_pos(node &n, int sl, int sc, int el, int ec)
{
    n.metadata["line"] = make_int(sl);
    n.metadata["col"] = make_int(sc);
    n.metadata["end-line"] = make_int(el);
    n.metadata["end-col"] = make_int(ec);
}

node_ptr parse_value(reader &r);

node_ptr parse_seq(reader &r, char end, int sl, int sc)
{
    std::vector<node_ptr> elems;
    r.skip_ws();
    while (!r.eof() && r.peek() != end)
    {
        elems.push_back(parse_value(r));
        r.skip_ws();
    }
    if (r.get() != end)
        throw parse_error("unterminated collection", sl, sc);
    node_ptr out;
    if (end == ')')
        out = detail::make_node(list{std::move(elems)});
    else
        out = detail::make_node(vector_t{std::move(elems)});
    attach_pos(*out, sl, sc, r.last_line, r.last_col);
    return out;
}

node_ptr parse_string(reader &r)
{
    int sl = r.line, sc = r.col;
    r.get(); // opening quote
    std::string out;
    bool closed = false;
    while (!r.eof())
    {
        char c = r.get();
        if (c == '"')
        {
            closed = true;
            break;
        }
        if (c == '\\')
        {
            if (r.eof())
                r.fail("bad escape");
            char e = r.get();
            switch (e)
            {
            case 'n': out += '\n'; break;
            case 'r': out += '\r'; break;
            case 't': out += '\t'; break;
            default: out += e; break;
            }
        }
        else
            out += c;
    }
    if (!closed)
        throw parse_error("unterminated string", sl, sc);
    auto n = detail::make_node(out);
    attach_pos(*n, sl, sc, r.last_line, r.last_col);
    return n;
}

node_ptr parse_number(reader &r)
{
    int sl = r.line, sc = r.col;
    std::string num;
    if (r.peek() == '+' || r.peek() == '-')
        num += r.get();
    while (is_digit(r.peek()))
        num += r.get();
    if (r.peek() == '.' || r.peek() == 'e' || r.peek() == 'E')
        throw parse_error("floating point literals are not supported", sl, sc);
    node_ptr n;
    try
    {
        n = make_int((int64_t)std::stoll(num));
    }
    catch (const std::exception &)
    {
        throw parse_error("invalid integer literal '" + num + "'", sl, sc);
    }
    attach_pos(*n, sl, sc, r.last_line, r.last_col);
    return n;
}

node_ptr parse_symbol_or_keyword(reader &r)
{
    int sl = r.line, sc = r.col;
    bool kw = false;
    if (r.peek() == ':')
    {
        kw = true;
        r.get();
    }
    std::string s;
    while (is_symbol_char(r.peek()))
        s += r.get();
    if (s.empty())
        throw parse_error(kw ? "empty keyword" : "empty symbol", sl, sc);
    node_ptr n;
    if (s == "nil" && !kw)
        n = detail::make_node(std::monostate{});
    else if (s == "true" && !kw)
        n = detail::make_node(true);
    else if (s == "false" && !kw)
        n = detail::make_node(false);
    else if (kw)
        n = detail::make_node(keyword{s});
    else
        n = detail::make_node(symbol{s});
    attach_pos(*n, sl, sc, r.last_line, r.last_col);
    return n;
}

node_ptr parse_value(reader &r)
{
    r.skip_ws();
    char c = r.peek();
    if (r.eof())
        r.fail("unexpected end of input");
    switch (c)
    {
    case '"':
        return parse_string(r);
    case '(':
    case '[':
    {
        int sl = r.line, sc = r.col;
        r.get();
        return parse_seq(r, c == '(' ? ')' : ']', sl, sc);
    }
    case ')':
    case ']':
        r.fail(std::string("unexpected '") + c + "'");
    default:
        break;
    }
    // a sign only starts a number when a digit follows; otherwise it is the operator symbol
    if (is_digit(c) || ((c == '+' || c == '-') && is_digit(r.peek(1))))
        return parse_number(r);
    if (c == ':' || is_symbol_start(c))
        return parse_symbol_or_keyword(r);
    r.fail(std::string("unexpected character '") + c + "'");
}

} // namespace

node_ptr parse(std::string_view input)
{
    reader r(input);
    r.skip_ws();
    auto v = parse_value(r);
    r.skip_ws();
    if (!r.eof())
        r.fail("unexpected trailing characters");
    return v;
}

} // namespace tailrec
