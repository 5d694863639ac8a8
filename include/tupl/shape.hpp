// Tuple shapes: prefix / optional open segment / suffix.
#pragma once
#include <cstdint>
#include <cstddef>
#include <optional>
#include <vector>

#include <llvm/ADT/Hashing.h>

namespace tupl {

using TypeId = uint32_t;

class TypeContext;

// The open part of a shape. A Repeat segment carries the element type that repeats
// zero or more times; a Param segment carries the id of an unresolved variadic type
// parameter (it is replaced by a captured shape during specialization).
struct VariadicSegment {
    enum class Kind { Repeat, Param } kind = Kind::Repeat;
    TypeId type = 0;

    static VariadicSegment repeat(TypeId elem){ return VariadicSegment{Kind::Repeat, elem}; }
    static VariadicSegment param(TypeId ref){ return VariadicSegment{Kind::Param, ref}; }
    bool is_param() const { return kind == Kind::Param; }
    bool operator==(const VariadicSegment& o) const { return kind == o.kind && type == o.type; }
    bool operator!=(const VariadicSegment& o) const { return !(*this == o); }
};

// Exact count, or "at least count" when the shape has an open segment.
struct Arity { size_t count = 0; bool at_least = false; };

struct TupleShape;

// Read-only three-part view handed to the resolver / checker / assigner.
struct ElementSequence {
    const std::vector<TypeId>& prefix;
    const VariadicSegment* variadic;
    const std::vector<TypeId>& suffix;
};

struct TupleShape {
    std::vector<TypeId> prefix;
    std::optional<VariadicSegment> variadic;
    std::vector<TypeId> suffix;

    static TupleShape empty(){ return TupleShape{}; }
    static TupleShape exact(std::vector<TypeId> elems){ TupleShape s; s.prefix = std::move(elems); return s; }
    static TupleShape homogeneous(TypeId elem){ TupleShape s; s.variadic = VariadicSegment::repeat(elem); return s; }
    // Builds a shape and folds a stray suffix into the prefix when there is no open segment.
    static TupleShape mixed(std::vector<TypeId> prefix, std::optional<VariadicSegment> seg, std::vector<TypeId> suffix){
        TupleShape s; s.prefix = std::move(prefix); s.variadic = seg;
        if(seg) s.suffix = std::move(suffix);
        else s.prefix.insert(s.prefix.end(), suffix.begin(), suffix.end());
        return s;
    }

    bool is_exact() const { return !variadic.has_value(); }
    bool is_empty() const { return is_exact() && prefix.empty(); }
    bool is_homogeneous() const { return variadic && !variadic->is_param() && prefix.empty() && suffix.empty(); }
    size_t min_length() const { return prefix.size() + suffix.size(); }
    Arity arity() const { return Arity{min_length(), !is_exact()}; }
    ElementSequence element_sequence() const { return ElementSequence{prefix, variadic ? &*variadic : nullptr, suffix}; }

    bool operator==(const TupleShape& o) const { return prefix == o.prefix && variadic == o.variadic && suffix == o.suffix; }
    bool operator!=(const TupleShape& o) const { return !(*this == o); }
};

struct TupleShapeHash {
    size_t operator()(const TupleShape& s) const noexcept {
        llvm::hash_code h = llvm::hash_combine_range(s.prefix.begin(), s.prefix.end());
        if(s.variadic) h = llvm::hash_combine(h, static_cast<int>(s.variadic->kind), s.variadic->type);
        else h = llvm::hash_combine(h, -1);
        h = llvm::hash_combine(h, llvm::hash_combine_range(s.suffix.begin(), s.suffix.end()));
        return static_cast<size_t>(h);
    }
};

// An element of a tuple-type annotation: a plain type, or an unpack marker around a
// tuple type or a variadic parameter.
struct AnnotationEntry { TypeId type = 0; bool unpacked = false; };

// An entry of a tuple expression: a plain element, or a star-unpacked iterable/tuple.
struct LiteralEntry { TypeId type = 0; bool star = false; };

// Lowers a tuple annotation. Throws shape_error (MalformedShape) when more than one
// entry opens a variadic segment.
TupleShape make_annotation_shape(TypeContext& ctx, const std::vector<AnnotationEntry>& entries);

// Lowers a tuple expression. Several open segments collapse into one whose element type
// is the union of everything between the first and the last of them.
TupleShape make_literal_shape(TypeContext& ctx, const std::vector<LiteralEntry>& entries);

// Type of `tuple(arg)`: a tuple argument keeps its shape, an iterable or sequence of T
// gives tuple[T, ...], unions map per alternative, anything else gives tuple[Unknown, ...].
TypeId construct_tuple(TypeContext& ctx, TypeId arg);

// Element type contributed by an open segment (Union[*Ts] for a parameter segment).
TypeId segment_element_type(TypeContext& ctx, const VariadicSegment& seg);

// Every element type of the shape in order (open segment represented once).
std::vector<TypeId> shape_element_types(TypeContext& ctx, const TupleShape& shape);

// Union of every element type; Never for the empty shape.
TypeId shape_element_union(TypeContext& ctx, const TupleShape& shape);

} // namespace tupl
