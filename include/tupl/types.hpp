// Interned element types and tuple shapes.
#pragma once
#include <cstdint>
#include <deque>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "tupl/form.hpp"
#include "tupl/shape.hpp"

namespace tupl
{

    struct Type
    {
        enum class Kind
        {
            Unknown,
            Never,
            Named,
            Union,
            Tuple,
            Sequence,
            Iterable,
            TypeParam,
            VariadicParam,
            VariadicUnion
        } kind = Kind::Unknown;
        std::string name;            // Named, TypeParam, VariadicParam
        std::vector<TypeId> members; // Union
        TupleShape shape;            // Tuple
        TypeId elem{0};              // Sequence, Iterable; VariadicUnion -> its VariadicParam
    };

    // Names visible to the annotation reader as type parameters (name -> TypeParam or
    // VariadicParam id).
    struct TypeScope
    {
        std::unordered_map<std::string, TypeId> params;
        const TypeScope *parent = nullptr;
        TypeId find(const std::string &name, bool &found) const
        {
            for (const TypeScope *s = this; s; s = s->parent)
            {
                auto it = s->params.find(name);
                if (it != s->params.end())
                {
                    found = true;
                    return it->second;
                }
            }
            found = false;
            return 0;
        }
    };

    // Every type is interned: structurally equal types share one id, so id equality is
    // structural equality. Safe for concurrent use; returned references stay valid for
    // the lifetime of the context.
    class TypeContext
    {
    public:
        TypeContext();
        TypeContext(const TypeContext &) = delete;
        TypeContext &operator=(const TypeContext &) = delete;

        TypeId unknown() const { return unknown_; }
        TypeId never() const { return never_; }
        TypeId get_named(const std::string &name);
        // Flattens nested unions, drops Never and duplicates, keeps first-seen order.
        TypeId get_union(const std::vector<TypeId> &members);
        TypeId get_tuple(const TupleShape &shape);
        TypeId get_sequence(TypeId elem);
        TypeId get_iterable(TypeId elem);
        TypeId get_type_param(const std::string &name);
        TypeId get_variadic_param(const std::string &name);
        TypeId get_variadic_union(TypeId variadic_param);

        const Type &at(TypeId id) const;
        Type::Kind kind(TypeId id) const { return at(id).kind; }
        bool is_tuple(TypeId id) const { return kind(id) == Type::Kind::Tuple; }
        bool is_unknown(TypeId id) const { return kind(id) == Type::Kind::Unknown; }
        const TupleShape *shape_of(TypeId id) const
        {
            const Type &t = at(id);
            return t.kind == Type::Kind::Tuple ? &t.shape : nullptr;
        }
        // Union members, or the type itself as a single alternative.
        std::vector<TypeId> alternatives(TypeId id) const;
        size_t size() const;

        std::string to_string(TypeId id) const;

        // Lower a type form -> TypeId. Throws parse_error for unknown forms and
        // shape_error for malformed tuple annotations.
        TypeId parse_type(const node_ptr &n, const TypeScope *scope = nullptr);

    private:
        struct VecHash
        {
            size_t operator()(const std::vector<TypeId> &v) const noexcept
            {
                return static_cast<size_t>(llvm::hash_combine_range(v.begin(), v.end()));
            }
        };

        TypeId add_type(Type t);
        template <class Map, class Key>
        TypeId intern(Map &cache, const Key &key, Type proto);
        TypeId parse_tuple_form(const std::vector<node_ptr> &elems, const TypeScope *scope);
        TypeId parse_literal_form(const std::vector<node_ptr> &elems, const TypeScope *scope);
        std::string shape_to_string(const TupleShape &s) const;

        mutable std::shared_mutex mu_;
        std::deque<Type> types_;
        TypeId unknown_{0};
        TypeId never_{0};
        std::unordered_map<std::string, TypeId> named_cache_;
        std::unordered_map<std::string, TypeId> param_cache_;
        std::unordered_map<std::string, TypeId> variadic_param_cache_;
        std::unordered_map<std::vector<TypeId>, TypeId, VecHash> union_cache_;
        std::unordered_map<TupleShape, TypeId, TupleShapeHash> tuple_cache_;
        std::unordered_map<TypeId, TypeId> seq_cache_;
        std::unordered_map<TypeId, TypeId> iter_cache_;
        std::unordered_map<TypeId, TypeId> vunion_cache_;
    };

} // namespace tupl
