// edn.cpp - reader and printers for the EDN subset used by plans and EDN hierarchies
#include "upcast/edn.hpp"

#include <cctype>
#include <functional>
#include <sstream>

namespace upcast::edn
{

namespace
{

struct reader
{
    std::string_view d;
    size_t p = 0;
    int line = 1, col = 1;
    explicit reader(std::string_view s) : d(s) {}
    bool eof() const { return p >= d.size(); }
    char peek() const { return eof() ? '\0' : d[p]; }
    char get()
    {
        if (eof())
            return '\0';
        char c = d[p++];
        if (c == '\n')
        {
            ++line;
            col = 1;
        }
        else
            ++col;
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
            // EDN treats commas as whitespace
            if (std::isspace((unsigned char)c) || c == ',')
            {
                get();
                continue;
            }
            break;
        }
    }
    [[noreturn]] void fail(const std::string &msg) const { throw parse_error(msg, line, col); }
};

bool is_delim(char c)
{
    return std::isspace((unsigned char)c) || c == '(' || c == ')' || c == '[' || c == ']' || c == '{' || c == '}' || c == '"' || c == ';' || c == ',';
}

node_ptr positioned(node_data d, int l, int c)
{
    auto n = make_node(std::move(d));
    n->line = l;
    n->col = c;
    return n;
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
    if (end == ')')
        return positioned(list{std::move(elems)}, sl, sc);
    return positioned(vector_t{std::move(elems)}, sl, sc);
}

node_ptr parse_string(reader &r)
{
    int sl = r.line, sc = r.col;
    r.get(); // opening quote
    std::string out;
    for (;;)
    {
        if (r.eof())
            throw parse_error("unterminated string", sl, sc);
        char c = r.get();
        if (c == '"')
            break;
        if (c != '\\')
        {
            out += c;
            continue;
        }
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
    return positioned(std::move(out), sl, sc);
}

node_ptr parse_token(reader &r)
{
    int sl = r.line, sc = r.col;
    std::string tok;
    while (!r.eof() && !is_delim(r.peek()))
        tok += r.get();
    if (tok.empty())
        r.fail("unexpected character");
    if (tok[0] == ':')
    {
        if (tok.size() == 1)
            throw parse_error("empty keyword", sl, sc);
        return positioned(keyword{tok.substr(1)}, sl, sc);
    }
    size_t digits = (tok[0] == '-' || tok[0] == '+') ? 1 : 0;
    if (digits < tok.size() && std::isdigit((unsigned char)tok[digits]))
    {
        size_t used = 0;
        long long v = 0;
        try
        {
            v = std::stoll(tok, &used);
        }
        catch (const std::exception &)
        {
            throw parse_error("invalid integer '" + tok + "'", sl, sc);
        }
        if (used != tok.size())
            throw parse_error("invalid integer '" + tok + "'", sl, sc);
        return positioned((int64_t)v, sl, sc);
    }
    if (tok == "nil")
        return positioned(std::monostate{}, sl, sc);
    return positioned(symbol{std::move(tok)}, sl, sc);
}

node_ptr parse_value(reader &r)
{
    r.skip_ws();
    if (r.eof())
        r.fail("unexpected end of input");
    int sl = r.line, sc = r.col;
    switch (r.peek())
    {
    case '"':
        return parse_string(r);
    case '(':
        r.get();
        return parse_seq(r, ')', sl, sc);
    case '[':
        r.get();
        return parse_seq(r, ']', sl, sc);
    case ')':
    case ']':
    case '{':
    case '}':
        r.fail(std::string("unexpected '") + r.peek() + "'");
    default:
        return parse_token(r);
    }
}

std::string quote(const std::string &s)
{
    std::string out = "\"";
    for (char c : s)
    {
        switch (c)
        {
        case '"': out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\t': out += "\\t"; break;
        default: out += c; break;
        }
    }
    out += '"';
    return out;
}

bool is_atomic(const node &n) { return !as_list(n) && !as_vector(n); }

} // namespace

node_ptr parse(std::string_view src)
{
    reader r(src);
    auto v = parse_value(r);
    r.skip_ws();
    if (!r.eof())
        r.fail("unexpected trailing characters");
    return v;
}

std::string to_string(const node &n)
{
    struct V
    {
        std::string operator()(std::monostate) const { return "nil"; }
        std::string operator()(int64_t i) const { return std::to_string(i); }
        std::string operator()(const std::string &s) const { return quote(s); }
        std::string operator()(const keyword &k) const { return ':' + k.name; }
        std::string operator()(const symbol &s) const { return s.name; }
        std::string join(const std::vector<node_ptr> &elems, char open, char close) const
        {
            std::string out(1, open);
            for (size_t i = 0; i < elems.size(); ++i)
            {
                if (i)
                    out += ' ';
                out += to_string(elems[i]);
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
    // Collections of atoms stay on one line; a list keeps its leading
    // head/keyword-value run inline until the first nested collection.
    std::function<std::string(const node &, int)> pp = [&](const node &x, int indent) -> std::string {
        const std::vector<node_ptr> *elems = nullptr;
        char open = '(', close = ')';
        if (auto *l = as_list(x))
            elems = &l->elems;
        else if (auto *v = as_vector(x))
        {
            elems = &v->elems;
            open = '[';
            close = ']';
        }
        if (!elems)
            return to_string(x);
        bool flat = true;
        for (auto &e : *elems)
            if (!is_atomic(*e))
                flat = false;
        if (flat)
            return to_string(x);
        std::string pad(static_cast<size_t>(indent + indentWidth), ' ');
        std::string out(1, open);
        bool broke = false;
        for (size_t i = 0; i < elems->size(); ++i)
        {
            const node &e = *(*elems)[i];
            bool inlineHere = !broke && open == '(' && (is_atomic(e) || (i > 0 && as_keyword(*(*elems)[i - 1]) && as_vector(e) && [&] {
                for (auto &c : as_vector(e)->elems)
                    if (!is_atomic(*c))
                        return false;
                return true;
            }()));
            if (inlineHere)
            {
                if (i)
                    out += ' ';
                out += pp(e, indent);
                continue;
            }
            broke = true;
            out += '\n' + pad + pp(e, indent + indentWidth);
        }
        out += close;
        return out;
    };
    return pp(n, 0);
}

} // namespace upcast::edn
