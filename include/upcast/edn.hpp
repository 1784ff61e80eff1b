// EDN forms used for plan interchange and the EDN hierarchy front-end
#pragma once
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace upcast::edn
{

    struct parse_error : std::runtime_error
    {
        using std::runtime_error::runtime_error;
        parse_error(const std::string &msg, int line, int col)
            : std::runtime_error(msg + " at " + std::to_string(line) + ":" + std::to_string(col)), line(line), col(col) {}
        int line = -1;
        int col = -1;
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

    using node_data = std::variant<std::monostate, int64_t, std::string, keyword, symbol, list, vector_t>;

    struct node
    {
        node_data data;
        int line = -1;
        int col = -1;
    };

    // Parse exactly one form; trailing content other than whitespace/comments is an error.
    node_ptr parse(std::string_view src);

    std::string to_string(const node &n);
    inline std::string to_string(const node_ptr &p) { return to_string(*p); }
    // Multiline rendering: lists and vectors holding nested collections break one element per line.
    std::string to_pretty_string(const node &n, int indentWidth = 2);
    inline std::string to_pretty_string(const node_ptr &p, int indentWidth = 2) { return to_pretty_string(*p, indentWidth); }

    inline const list *as_list(const node &n) { return std::get_if<list>(&n.data); }
    inline const vector_t *as_vector(const node &n) { return std::get_if<vector_t>(&n.data); }
    inline const symbol *as_symbol(const node &n) { return std::get_if<symbol>(&n.data); }
    inline const keyword *as_keyword(const node &n) { return std::get_if<keyword>(&n.data); }
    inline const std::string *as_string(const node &n) { return std::get_if<std::string>(&n.data); }
    inline const int64_t *as_int(const node &n) { return std::get_if<int64_t>(&n.data); }

    // Text of a symbol or string atom; empty for anything else.
    inline std::string atom_text(const node &n)
    {
        if (auto *s = as_symbol(n))
            return s->name;
        if (auto *s = as_string(n))
            return *s;
        return {};
    }

    // Find the value following :name in a (head :k v :k v ...) list, scanning from index `from`.
    inline node_ptr keyword_arg(const std::vector<node_ptr> &elems, const std::string &name, size_t from = 1)
    {
        for (size_t i = from; i + 1 < elems.size(); ++i)
        {
            auto *k = elems[i] ? as_keyword(*elems[i]) : nullptr;
            if (k && k->name == name)
                return elems[i + 1];
        }
        return nullptr;
    }

    inline node_ptr make_node(node_data d) { return std::make_shared<node>(node{std::move(d)}); }
    inline node_ptr n_sym(std::string name) { return make_node(symbol{std::move(name)}); }
    inline node_ptr n_kw(std::string name) { return make_node(keyword{std::move(name)}); }
    inline node_ptr n_str(std::string s) { return make_node(std::move(s)); }
    inline node_ptr n_i64(int64_t v) { return make_node(v); }

    inline node_ptr node_list(std::initializer_list<node_ptr> xs)
    {
        list l;
        l.elems.assign(xs.begin(), xs.end());
        return make_node(std::move(l));
    }
    inline node_ptr node_vec(std::initializer_list<node_ptr> xs = {})
    {
        vector_t v;
        v.elems.assign(xs.begin(), xs.end());
        return make_node(std::move(v));
    }

    // Append into a list/vector node.
    inline node_ptr &operator<<(node_ptr &c, const node_ptr &n)
    {
        if (!c)
            throw std::invalid_argument("operator<<: null container node");
        if (auto *l = std::get_if<list>(&c->data))
            l->elems.push_back(n);
        else if (auto *v = std::get_if<vector_t>(&c->data))
            v->elems.push_back(n);
        else
            throw std::invalid_argument("operator<<: container is not list/vector");
        return c;
    }

} // namespace upcast::edn
