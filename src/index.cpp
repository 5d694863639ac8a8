#include "tupl/index.hpp"
#include "tupl/trace.hpp"

namespace tupl {

std::optional<TypeId> IndexResolver::resolve_shape(const TupleShape& s, int64_t i){
    if(s.is_exact()){
        const int64_t n = (int64_t)s.prefix.size();
        if(i < 0) i += n;
        if(i < 0 || i >= n) return std::nullopt;
        return s.prefix[(size_t)i];
    }
    if(i >= 0 && (uint64_t)i < s.prefix.size()) return s.prefix[(size_t)i];
    return resolve_open(s, i);
}

// The index cannot be pinned to one element; over-approximate with a union.
TypeId IndexResolver::resolve_open(const TupleShape& s, int64_t i){
    if(policy_ == IndexPolicy::Conservative) return shape_element_union(ctx_, s);

    const uint64_t P = s.prefix.size(), S = s.suffix.size();
    std::vector<TypeId> members{segment_element_type(ctx_, *s.variadic)};
    if(i < 0){
        const uint64_t mag = (uint64_t)(-(i + 1)) + 1;
        if(mag <= S) return s.suffix[S - mag];
        // reaches past the suffix: the open segment, or a prefix element when it is short
        for(uint64_t q = 0; q <= mag - 1 - S && q < P; ++q) members.push_back(s.prefix[P - 1 - q]);
    } else {
        for(uint64_t j = 0; j <= (uint64_t)i - P && j < S; ++j) members.push_back(s.suffix[j]);
    }
    return ctx_.get_union(members);
}

IndexResult IndexResolver::resolve(TypeId subject, int64_t index){
    IndexResult r;
    using K = Type::Kind;
    const bool is_union = ctx_.kind(subject) == K::Union;
    const auto alts = ctx_.alternatives(subject);
    if(alts.empty()){ r.type = ctx_.never(); return r; }

    std::vector<TypeId> found, fallback;
    for(size_t k=0;k<alts.size(); ++k){
        TypeId alt = alts[k];
        K kind = ctx_.kind(alt);
        if(kind == K::Unknown){ found.push_back(ctx_.unknown()); continue; }
        if(kind != K::Tuple){
            Failure f; f.kind = FailureKind::NotATuple; f.position = index; f.source = alt;
            if(is_union) f.alternative = (int)k;
            r.failures.push_back(f);
            found.push_back(ctx_.unknown());
            continue;
        }
        const TupleShape shape = *ctx_.shape_of(alt);
        if(auto t = resolve_shape(shape, index)){ found.push_back(*t); continue; }
        Failure f = index_out_of_range(index, shape.min_length());
        f.source = alt;
        if(is_union) f.alternative = (int)k;
        r.failures.push_back(f);
        for(TypeId e : shape_element_types(ctx_, shape)) fallback.push_back(e);
    }
    if(!found.empty()) r.type = ctx_.get_union(found);
    else r.type = fallback.empty() ? ctx_.unknown() : ctx_.get_union(fallback);
    if(trace_enabled())
        trace("index", ctx_.to_string(subject) + "[" + std::to_string(index) + "] policy=" + index_policy_name(policy_) +
              " -> " + ctx_.to_string(r.type) + " failures=" + std::to_string(r.failures.size()));
    return r;
}

} // namespace tupl
