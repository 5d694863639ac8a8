#include "tupl/types.hpp"
#include "tupl/failure.hpp"
#include <algorithm>
#include <mutex>

namespace tupl
{

    TypeContext::TypeContext()
    { // seed the two singleton kinds; Unknown is id 0 so zero-initialized ids read as Unknown
        Type u{};
        u.kind = Type::Kind::Unknown;
        unknown_ = add_type(std::move(u));
        Type nv{};
        nv.kind = Type::Kind::Never;
        never_ = add_type(std::move(nv));
    }

    TypeId TypeContext::add_type(Type t)
    {
        TypeId id = static_cast<TypeId>(types_.size());
        types_.push_back(std::move(t));
        return id;
    }

    template <class Map, class Key>
    TypeId TypeContext::intern(Map &cache, const Key &key, Type proto)
    {
        {
            std::shared_lock<std::shared_mutex> lk(mu_);
            auto it = cache.find(key);
            if (it != cache.end())
                return it->second;
        }
        std::unique_lock<std::shared_mutex> lk(mu_);
        auto it = cache.find(key);
        if (it != cache.end())
            return it->second;
        TypeId id = add_type(std::move(proto));
        cache.emplace(key, id);
        return id;
    }

    const Type &TypeContext::at(TypeId id) const
    {
        std::shared_lock<std::shared_mutex> lk(mu_);
        return types_.at(id);
    }

    size_t TypeContext::size() const
    {
        std::shared_lock<std::shared_mutex> lk(mu_);
        return types_.size();
    }

    TypeId TypeContext::get_named(const std::string &name)
    {
        Type t{};
        t.kind = Type::Kind::Named;
        t.name = name;
        return intern(named_cache_, name, std::move(t));
    }

    TypeId TypeContext::get_type_param(const std::string &name)
    {
        Type t{};
        t.kind = Type::Kind::TypeParam;
        t.name = name;
        return intern(param_cache_, name, std::move(t));
    }

    TypeId TypeContext::get_variadic_param(const std::string &name)
    {
        Type t{};
        t.kind = Type::Kind::VariadicParam;
        t.name = name;
        return intern(variadic_param_cache_, name, std::move(t));
    }

    TypeId TypeContext::get_variadic_union(TypeId variadic_param)
    {
        Type t{};
        t.kind = Type::Kind::VariadicUnion;
        t.elem = variadic_param;
        return intern(vunion_cache_, variadic_param, std::move(t));
    }

    TypeId TypeContext::get_sequence(TypeId elem)
    {
        Type t{};
        t.kind = Type::Kind::Sequence;
        t.elem = elem;
        return intern(seq_cache_, elem, std::move(t));
    }

    TypeId TypeContext::get_iterable(TypeId elem)
    {
        Type t{};
        t.kind = Type::Kind::Iterable;
        t.elem = elem;
        return intern(iter_cache_, elem, std::move(t));
    }

    TypeId TypeContext::get_union(const std::vector<TypeId> &members)
    {
        std::vector<TypeId> flat;
        auto add = [&](TypeId m) {
            if (std::find(flat.begin(), flat.end(), m) == flat.end())
                flat.push_back(m);
        };
        for (TypeId m : members)
        {
            const Type &T = at(m);
            if (T.kind == Type::Kind::Never)
                continue;
            if (T.kind == Type::Kind::Union)
            {
                for (TypeId inner : T.members)
                    add(inner);
                continue;
            }
            add(m);
        }
        if (flat.empty())
            return never_;
        if (flat.size() == 1)
            return flat[0];
        // key is order-insensitive; the first spelling seen is the one kept for display
        std::vector<TypeId> key = flat;
        std::sort(key.begin(), key.end());
        Type t{};
        t.kind = Type::Kind::Union;
        t.members = std::move(flat);
        return intern(union_cache_, key, std::move(t));
    }

    TypeId TypeContext::get_tuple(const TupleShape &shape)
    {
        TupleShape norm = TupleShape::mixed(shape.prefix, shape.variadic, shape.suffix);
        Type t{};
        t.kind = Type::Kind::Tuple;
        t.shape = norm;
        return intern(tuple_cache_, norm, std::move(t));
    }

    std::vector<TypeId> TypeContext::alternatives(TypeId id) const
    {
        const Type &t = at(id);
        if (t.kind == Type::Kind::Union)
            return t.members;
        if (t.kind == Type::Kind::Never)
            return {};
        return {id};
    }

    std::string TypeContext::shape_to_string(const TupleShape &s) const
    {
        if (s.is_empty())
            return "tuple[()]";
        if (s.is_homogeneous())
            return "tuple[" + to_string(s.variadic->type) + ", ...]";
        std::string out = "tuple[";
        bool first = true;
        auto emit = [&](const std::string &piece) {
            if (!first)
                out += ", ";
            first = false;
            out += piece;
        };
        for (TypeId e : s.prefix)
            emit(to_string(e));
        if (s.variadic)
        {
            if (s.variadic->is_param())
                emit("*" + to_string(s.variadic->type));
            else
                emit("*tuple[" + to_string(s.variadic->type) + ", ...]");
        }
        for (TypeId e : s.suffix)
            emit(to_string(e));
        out += "]";
        return out;
    }

    std::string TypeContext::to_string(TypeId id) const
    {
        const Type &t = at(id);
        switch (t.kind)
        {
        case Type::Kind::Unknown:
            return "Unknown";
        case Type::Kind::Never:
            return "Never";
        case Type::Kind::Named:
        case Type::Kind::TypeParam:
        case Type::Kind::VariadicParam:
            return t.name;
        case Type::Kind::Union:
        {
            std::string s;
            for (size_t i = 0; i < t.members.size(); ++i)
            {
                if (i)
                    s += " | ";
                s += to_string(t.members[i]);
            }
            return s;
        }
        case Type::Kind::Tuple:
            return shape_to_string(t.shape);
        case Type::Kind::Sequence:
            return "list[" + to_string(t.elem) + "]";
        case Type::Kind::Iterable:
            return "Iterable[" + to_string(t.elem) + "]";
        case Type::Kind::VariadicUnion:
            return "Union[*" + to_string(t.elem) + "]";
        }
        return "<bad-type>";
    }

    namespace
    {
        bool is_ellipsis(const node_ptr &n)
        {
            auto *s = n ? as_symbol(*n) : nullptr;
            return s && s->name == "...";
        }
    }

    TypeId TypeContext::parse_type(const node_ptr &n, const TypeScope *scope)
    {
        if (!n)
            throw parse_error("null type form");
        if (auto *s = as_symbol(*n))
        {
            const std::string &name = s->name;
            if (name == "?" || name == "unknown" || name == "Unknown")
                return unknown_;
            if (name == "never" || name == "Never")
                return never_;
            if (name == "tuple")
                return get_tuple(TupleShape::homogeneous(unknown_));
            if (name == "...")
                throw shape_error("ellipsis outside a tuple annotation");
            if (scope)
            {
                bool found = false;
                TypeId id = scope->find(name, found);
                if (found)
                    return id;
            }
            return get_named(name);
        }
        std::string head = head_of(*n);
        if (head.empty())
            throw parse_error("unsupported type node: " + tupl::to_string(n));
        const auto &l = as_list(*n)->elems;
        // element positions must not hold a bare variadic parameter
        auto element = [&](const node_ptr &e, int64_t pos) {
            TypeId id = parse_type(e, scope);
            if (kind(id) == Type::Kind::VariadicParam)
                throw shape_error("variadic parameter '" + to_string(id) + "' must be unpacked", FailureKind::MalformedShape, pos);
            return id;
        };
        if (head == "tuple")
            return parse_tuple_form(l, scope);
        if (head == "literal")
            return parse_literal_form(l, scope);
        if (head == "union")
        {
            std::vector<TypeId> members;
            for (size_t i = 1; i < l.size(); ++i)
            {
                // (union (unpack Ts)) is the element-type view of a variadic parameter
                if (head_of(*l[i]) == "unpack")
                {
                    const auto &ul = as_list(*l[i])->elems;
                    TypeId inner = ul.size() == 2 ? parse_type(ul[1], scope) : unknown_;
                    if (ul.size() != 2 || kind(inner) != Type::Kind::VariadicParam)
                        throw shape_error("union unpack requires a variadic parameter", FailureKind::MalformedShape, (int64_t)i - 1);
                    members.push_back(get_variadic_union(inner));
                    continue;
                }
                members.push_back(element(l[i], (int64_t)i - 1));
            }
            return get_union(members);
        }
        if (head == "seq" || head == "iter")
        {
            if (l.size() != 2)
                throw parse_error(head + " expects exactly one element type");
            TypeId elem = element(l[1], 0);
            return head == "seq" ? get_sequence(elem) : get_iterable(elem);
        }
        if (head == "tuple-from")
        {
            if (l.size() != 2)
                throw parse_error("tuple-from expects exactly one argument type");
            return construct_tuple(*this, element(l[1], 0));
        }
        if (head == "unpack" || head == "star")
            throw shape_error(head + " marker outside a tuple form");
        throw parse_error("unknown type form: " + head);
    }

    TypeId TypeContext::parse_tuple_form(const std::vector<node_ptr> &l, const TypeScope *scope)
    {
        size_t count = l.size() - 1;
        for (size_t i = 1; i < l.size(); ++i)
        {
            if (!is_ellipsis(l[i]))
                continue;
            if (count != 2 || i != 2)
                throw shape_error("ellipsis must follow exactly one element type", FailureKind::MalformedShape, (int64_t)i - 1);
            if (head_of(*l[1]) == "unpack")
                throw shape_error("unpacked entry cannot repeat", FailureKind::MalformedShape, 0);
            TypeId elem = parse_type(l[1], scope);
            if (kind(elem) == Type::Kind::VariadicParam)
                throw shape_error("variadic parameter must be unpacked", FailureKind::MalformedShape, 0);
            return get_tuple(TupleShape::homogeneous(elem));
        }
        std::vector<AnnotationEntry> entries;
        entries.reserve(count);
        for (size_t i = 1; i < l.size(); ++i)
        {
            int64_t pos = (int64_t)i - 1;
            if (head_of(*l[i]) == "unpack")
            {
                const auto &ul = as_list(*l[i])->elems;
                if (ul.size() != 2)
                    throw shape_error("unpack expects exactly one operand", FailureKind::MalformedShape, pos);
                TypeId inner = parse_type(ul[1], scope);
                auto k = kind(inner);
                if (k != Type::Kind::Tuple && k != Type::Kind::VariadicParam)
                    throw shape_error("unpack requires a tuple or a variadic parameter", FailureKind::MalformedShape, pos);
                entries.push_back(AnnotationEntry{inner, true});
                continue;
            }
            TypeId elem = parse_type(l[i], scope);
            if (kind(elem) == Type::Kind::VariadicParam)
                throw shape_error("variadic parameter must be unpacked", FailureKind::MalformedShape, pos);
            entries.push_back(AnnotationEntry{elem, false});
        }
        return get_tuple(make_annotation_shape(*this, entries));
    }

    TypeId TypeContext::parse_literal_form(const std::vector<node_ptr> &l, const TypeScope *scope)
    {
        std::vector<LiteralEntry> entries;
        for (size_t i = 1; i < l.size(); ++i)
        {
            if (head_of(*l[i]) == "star")
            {
                const auto &sl = as_list(*l[i])->elems;
                if (sl.size() != 2)
                    throw parse_error("star expects exactly one operand");
                entries.push_back(LiteralEntry{parse_type(sl[1], scope), true});
                continue;
            }
            entries.push_back(LiteralEntry{parse_type(l[i], scope), false});
        }
        return get_tuple(make_literal_shape(*this, entries));
    }

} // namespace tupl
