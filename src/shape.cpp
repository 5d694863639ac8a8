#include "tupl/shape.hpp"
#include "tupl/types.hpp"
#include "tupl/failure.hpp"

namespace tupl {

TupleShape make_annotation_shape(TypeContext& ctx, const std::vector<AnnotationEntry>& entries){
    std::vector<TypeId> prefix, suffix;
    std::optional<VariadicSegment> seg;
    auto push = [&](TypeId t){ (seg ? suffix : prefix).push_back(t); };
    for(size_t i=0;i<entries.size(); ++i){
        const auto& e = entries[i];
        if(!e.unpacked){ push(e.type); continue; }
        auto open = [&](const VariadicSegment& s){
            if(seg) throw shape_error("more than one unpacked variadic entry in tuple annotation", FailureKind::MalformedShape, (int64_t)i);
            seg = s;
        };
        const Type& t = ctx.at(e.type);
        if(t.kind == Type::Kind::VariadicParam){ open(VariadicSegment::param(e.type)); continue; }
        if(t.kind != Type::Kind::Tuple)
            throw shape_error("unpack requires a tuple or a variadic parameter", FailureKind::MalformedShape, (int64_t)i);
        // exact tuples splice without opening a segment
        for(TypeId p : t.shape.prefix) push(p);
        if(t.shape.variadic) open(*t.shape.variadic);
        for(TypeId s : t.shape.suffix) push(s);
    }
    return TupleShape::mixed(std::move(prefix), seg, std::move(suffix));
}

namespace {
    struct LiteralItem { TypeId type = 0; std::optional<VariadicSegment> open; };
}

TupleShape make_literal_shape(TypeContext& ctx, const std::vector<LiteralEntry>& entries){
    std::vector<LiteralItem> items;
    for(const auto& e : entries){
        if(!e.star){ items.push_back(LiteralItem{e.type, std::nullopt}); continue; }
        const Type& t = ctx.at(e.type);
        switch(t.kind){
            case Type::Kind::Tuple:
                for(TypeId p : t.shape.prefix) items.push_back(LiteralItem{p, std::nullopt});
                if(t.shape.variadic) items.push_back(LiteralItem{0, t.shape.variadic});
                for(TypeId s : t.shape.suffix) items.push_back(LiteralItem{s, std::nullopt});
                break;
            case Type::Kind::Sequence:
            case Type::Kind::Iterable:
                items.push_back(LiteralItem{0, VariadicSegment::repeat(t.elem)});
                break;
            default:
                // Unknown, or something we cannot see into
                items.push_back(LiteralItem{0, VariadicSegment::repeat(ctx.unknown())});
                break;
        }
    }
    long first = -1, last = -1;
    for(size_t i=0;i<items.size(); ++i){
        if(!items[i].open) continue;
        if(first < 0) first = (long)i;
        last = (long)i;
    }
    if(first < 0){
        std::vector<TypeId> elems; elems.reserve(items.size());
        for(auto& it : items) elems.push_back(it.type);
        return TupleShape::exact(std::move(elems));
    }
    std::vector<TypeId> prefix, suffix;
    for(long i=0;i<first; ++i) prefix.push_back(items[i].type);
    for(size_t i=(size_t)last+1;i<items.size(); ++i) suffix.push_back(items[i].type);
    if(first == last) return TupleShape::mixed(std::move(prefix), items[first].open, std::move(suffix));
    // several open regions: everything between the first and the last collapses into one
    std::vector<TypeId> region;
    for(long i=first;i<=last; ++i)
        region.push_back(items[i].open ? segment_element_type(ctx, *items[i].open) : items[i].type);
    return TupleShape::mixed(std::move(prefix), VariadicSegment::repeat(ctx.get_union(region)), std::move(suffix));
}

TypeId construct_tuple(TypeContext& ctx, TypeId arg){
    const Type& t = ctx.at(arg);
    switch(t.kind){
        case Type::Kind::Tuple: return arg;
        case Type::Kind::Sequence:
        case Type::Kind::Iterable: return ctx.get_tuple(TupleShape::homogeneous(t.elem));
        case Type::Kind::Union: {
            std::vector<TypeId> alts;
            for(TypeId m : t.members) alts.push_back(construct_tuple(ctx, m));
            return ctx.get_union(alts);
        }
        default: return ctx.get_tuple(TupleShape::homogeneous(ctx.unknown()));
    }
}

TypeId segment_element_type(TypeContext& ctx, const VariadicSegment& seg){
    return seg.is_param() ? ctx.get_variadic_union(seg.type) : seg.type;
}

std::vector<TypeId> shape_element_types(TypeContext& ctx, const TupleShape& shape){
    std::vector<TypeId> out(shape.prefix.begin(), shape.prefix.end());
    if(shape.variadic) out.push_back(segment_element_type(ctx, *shape.variadic));
    out.insert(out.end(), shape.suffix.begin(), shape.suffix.end());
    return out;
}

TypeId shape_element_union(TypeContext& ctx, const TupleShape& shape){
    return ctx.get_union(shape_element_types(ctx, shape));
}

} // namespace tupl
