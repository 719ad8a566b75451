// Node-based EDN representation with metadata & source positions.
// Function definitions and expression trees are carried in this form.
#pragma once
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <memory>
#include <stdexcept>
#include <map>
#include <cstdint>
#include <initializer_list>

namespace tailrec
{

    struct parse_error : std::runtime_error
    {
        parse_error(const std::string &msg, int line, int col)
            : std::runtime_error(msg + " at " + std::to_string(line) + ":" + std::to_string(col)), line(line), col(col) {}
        int line;
        int col;
    };

    struct keyword
    {
        std::string name;
    };
    struct symbol
    {
        std::string name;
    };
    struct list;
    struct vector_t;
    struct node;

    using node_ptr = std::shared_ptr<node>;

    struct list
    {
        std::vector<node_ptr> elems;
    };
    struct vector_t
    {
        std::vector<node_ptr> elems;
    };

    using node_data = std::variant<std::monostate, bool, int64_t, std::string, keyword, symbol, list, vector_t>;

    struct node
    {
        node_data data;
        std::map<std::string, node_ptr> metadata;
    };

    // Parse a single EDN form (entire input) into a node tree. Throws parse_error.
    node_ptr parse(std::string_view input);

    // Structural deep equality of two EDN nodes. If ignore_metadata is true, metadata maps are ignored.
    bool equal(const node_ptr &a, const node_ptr &b, bool ignore_metadata = true);

    // Deep copy; the result shares no node with the input. Metadata is copied.
    node_ptr clone(const node_ptr &n);

    std::string to_string(const node &n);
    inline std::string to_string(const node_ptr &p) { return p ? to_string(*p) : std::string("nil"); }
    // Pretty printer with newlines and indentation for control forms
    std::string to_pretty_string(const node &n, int indentWidth = 2);
    inline std::string to_pretty_string(const node_ptr &p, int indentWidth = 2) { return p ? to_pretty_string(*p, indentWidth) : std::string("nil"); }

    inline bool is_symbol(const node &n) { return std::holds_alternative<symbol>(n.data); }
    inline bool is_keyword(const node &n) { return std::holds_alternative<keyword>(n.data); }
    inline bool is_list(const node &n) { return std::holds_alternative<list>(n.data); }
    inline bool is_vector(const node &n) { return std::holds_alternative<vector_t>(n.data); }
    inline list *as_list(node &n) { return is_list(n) ? &std::get<list>(n.data) : nullptr; }
    inline const list *as_list(const node &n) { return is_list(n) ? &std::get<list>(n.data) : nullptr; }
    inline const vector_t *as_vector(const node &n) { return is_vector(n) ? &std::get<vector_t>(n.data) : nullptr; }
    inline const symbol *as_symbol(const node &n) { return is_symbol(n) ? &std::get<symbol>(n.data) : nullptr; }

    inline int meta_int(const node &n, const std::string &k, int def = -1)
    {
        auto it = n.metadata.find(k);
        if (it == n.metadata.end() || !it->second)
            return def;
        auto &nd = *it->second;
        if (std::holds_alternative<int64_t>(nd.data))
            return (int)std::get<int64_t>(nd.data);
        return def;
    }
    inline int line(const node &n) { return meta_int(n, "line"); }
    inline int col(const node &n) { return meta_int(n, "col"); }

    namespace detail
    {
        inline node_ptr make_node(node_data d) { return std::make_shared<node>(node{std::move(d), {}}); }
    }

    // ------ Factory helpers ------
    inline node_ptr n_sym(std::string name) { return detail::make_node(symbol{std::move(name)}); }
    inline node_ptr n_kw(std::string name) { return detail::make_node(keyword{std::move(name)}); }
    inline node_ptr n_i64(int64_t v) { return detail::make_node(v); }
    inline node_ptr n_bool(bool b) { return detail::make_node(b); }

    inline node_ptr node_list() { return detail::make_node(list{}); }
    inline node_ptr node_vec() { return detail::make_node(vector_t{}); }
    inline node_ptr node_list(std::initializer_list<node_ptr> xs)
    {
        list l;
        l.elems.assign(xs.begin(), xs.end());
        return detail::make_node(std::move(l));
    }
    inline node_ptr node_vec(std::initializer_list<node_ptr> xs)
    {
        vector_t v;
        v.elems.assign(xs.begin(), xs.end());
        return detail::make_node(std::move(v));
    }

    // Generic appender for list/vector nodes
    inline node_ptr &operator<<(node_ptr &c, const node_ptr &n)
    {
        if (!c)
            throw std::invalid_argument("operator<<: null container node");
        if (std::holds_alternative<list>(c->data))
            std::get<list>(c->data).elems.push_back(n);
        else if (std::holds_alternative<vector_t>(c->data))
            std::get<vector_t>(c->data).elems.push_back(n);
        else
            throw std::invalid_argument("operator<<: container is not list/vector");
        return c;
    }

} // namespace tailrec
