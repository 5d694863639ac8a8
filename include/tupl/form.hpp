// Form trees: the already-tokenized annotation / pattern description handed to the core.
#pragma once
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <memory>
#include <stdexcept>
#include <cctype>
#include <map>
#include <cstdint>
#include <cstdlib>

namespace tupl
{

    struct parse_error : std::runtime_error
    {
        using std::runtime_error::runtime_error;
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

    // Parse exactly one form; trailing content is an error.
    node_ptr parse_one(std::string_view src);

    // Structural deep equality. Metadata (source positions) is ignored unless asked for.
    bool equal(const node_ptr& a, const node_ptr& b, bool ignore_metadata = true);

    namespace detail
    {
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
                    if (c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == ',')
                    {
                        get();
                        continue;
                    }
                    break;
                }
            }
        };
        inline bool is_digit(char c) { return c >= '0' && c <= '9'; }
        // '.' may start a symbol so that the ellipsis marker reads as `...`
        inline bool is_symbol_start(char c) { return std::isalpha((unsigned char)c) || c == '*' || c == '_' || c == '?' || c == '.' || c == '<' || c == '>' || c == '|' || c == '$' || c == '%' || c == '&' || c == '@'; }
        inline bool is_symbol_char(char c) { return is_symbol_start(c) || is_digit(c) || c == '-' || c == '+' || c == '!' || c == '/' || c == '#'; }

        inline node_ptr make_node(node_data d) { return std::make_shared<node>(node{std::move(d), {}}); }
        inline node_ptr make_int(int64_t v) { return make_node(node_data{v}); }
        inline void attach_pos(node &n, int sl, int sc)
        {
            n.metadata["line"] = make_int(sl);
            n.metadata["col"] = make_int(sc);
        }

        inline node_ptr parse_value(reader &);

        inline node_ptr parse_seq(reader &r, char end, int sl, int sc)
        {
            std::vector<node_ptr> elems;
            r.skip_ws();
            while (!r.eof() && r.peek() != end)
            {
                elems.push_back(parse_value(r));
                r.skip_ws();
            }
            if (r.get() != end)
                throw parse_error("unterminated collection");
            node_ptr out;
            if (end == ')')
                out = make_node(list{std::move(elems)});
            else
                out = make_node(vector_t{std::move(elems)});
            attach_pos(*out, sl, sc);
            return out;
        }

        inline node_ptr parse_string(reader &r)
        {
            int sl = r.line, sc = r.col;
            r.get();
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
                        throw parse_error("bad escape");
                    char e = r.get();
                    out += e == 'n' ? '\n' : e == 't' ? '\t' : e;
                }
                else
                    out += c;
            }
            if (!closed)
                throw parse_error("unterminated string");
            auto n = make_node(out);
            attach_pos(*n, sl, sc);
            return n;
        }

        inline node_ptr parse_integer(reader &r)
        {
            int sl = r.line, sc = r.col;
            std::string num;
            if (r.peek() == '+' || r.peek() == '-')
                num += r.get();
            while (is_digit(r.peek()))
                num += r.get();
            if (is_symbol_char(r.peek()))
                throw parse_error("invalid integer '" + num + r.peek() + "'");
            int64_t v = 0;
            try
            {
                v = (int64_t)std::stoll(num);
            }
            catch (const std::exception &)
            {
                throw parse_error("integer out of range: " + num);
            }
            auto n = make_int(v);
            attach_pos(*n, sl, sc);
            return n;
        }

        inline node_ptr parse_symbol_or_keyword(reader &r)
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
                throw parse_error("empty symbol");
            node_ptr n;
            if (s == "nil" && !kw)
                n = make_node(std::monostate{});
            else if (s == "true" && !kw)
                n = make_node(true);
            else if (s == "false" && !kw)
                n = make_node(false);
            else if (kw)
                n = make_node(keyword{s});
            else
                n = make_node(symbol{s});
            attach_pos(*n, sl, sc);
            return n;
        }

        inline node_ptr parse_value(reader &r)
        {
            r.skip_ws();
            char c = r.peek();
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
            case '\0':
                throw parse_error("unexpected end of input");
            default:
                break;
            }
            if (is_digit(c) || ((c == '+' || c == '-') && is_digit(r.peek(1))))
                return parse_integer(r);
            if (c == ':' || is_symbol_start(c))
                return parse_symbol_or_keyword(r);
            throw parse_error(std::string("unexpected character '") + c + "'");
        }
    }

    inline std::string to_string(const node &n);
    inline std::string to_string(const node_ptr &p) { return p ? to_string(*p) : std::string("nil"); }
    inline std::string to_string(const node &n)
    {
        struct V
        {
            std::string operator()(std::monostate) const { return "nil"; }
            std::string operator()(bool b) const { return b ? "true" : "false"; }
            std::string operator()(int64_t i) const { return std::to_string(i); }
            std::string operator()(const std::string &s) const { return '"' + s + '"'; }
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

    inline bool is_symbol(const node &n) { return std::holds_alternative<symbol>(n.data); }
    inline bool is_keyword(const node &n) { return std::holds_alternative<keyword>(n.data); }
    inline bool is_list(const node &n) { return std::holds_alternative<list>(n.data); }
    inline bool is_vector(const node &n) { return std::holds_alternative<vector_t>(n.data); }
    inline const list *as_list(const node &n) { return is_list(n) ? &std::get<list>(n.data) : nullptr; }
    inline const vector_t *as_vector(const node &n) { return is_vector(n) ? &std::get<vector_t>(n.data) : nullptr; }
    inline const symbol *as_symbol(const node &n) { return is_symbol(n) ? &std::get<symbol>(n.data) : nullptr; }
    // Head symbol name of a list form, or empty.
    inline std::string head_of(const node &n)
    {
        auto *l = as_list(n);
        if (!l || l->elems.empty() || !l->elems[0] || !is_symbol(*l->elems[0]))
            return {};
        return std::get<symbol>(l->elems[0]->data).name;
    }
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

    // Factory helpers for building forms in code.
    inline node_ptr n_sym(std::string name) { return detail::make_node(symbol{std::move(name)}); }
    inline node_ptr n_kw(std::string name) { return detail::make_node(keyword{std::move(name)}); }
    inline node_ptr n_i64(int64_t v) { return detail::make_node(v); }
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

} // namespace tupl
