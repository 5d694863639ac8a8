#include "tupl/destructure.hpp"
#include "tupl/trace.hpp"

namespace tupl {

DestructureResult DestructuringAssigner::all(size_t n, TypeId t){
    DestructureResult r;
    r.bindings.assign(n, t);
    return r;
}

DestructureResult DestructuringAssigner::assign(const std::vector<Target>& targets, TypeId source){
    long rest = -1;
    for(size_t i=0;i<targets.size(); ++i){
        if(!targets[i].collect_rest) continue;
        if(rest >= 0){
            auto r = all(targets.size(), ctx_.unknown());
            Failure f; f.kind = FailureKind::MalformedPattern; f.position = (int64_t)i; f.source = source;
            r.failures.push_back(f);
            return r;
        }
        rest = (long)i;
    }
    if(ctx_.kind(source) != Type::Kind::Union) return assign_one(targets, source, rest);

    // each alternative is destructured on its own; bindings widen per target
    const auto members = ctx_.alternatives(source);
    std::vector<std::vector<TypeId>> per(targets.size());
    DestructureResult r;
    bool any_ok = false;
    for(size_t k=0;k<members.size(); ++k){
        auto sub = assign_one(targets, members[k], rest);
        if(sub.ok()){
            any_ok = true;
            for(size_t i=0;i<targets.size(); ++i) per[i].push_back(sub.bindings[i]);
            continue;
        }
        size_t before = r.failures.size();
        r.failures.insert(r.failures.end(), sub.failures.begin(), sub.failures.end());
        tag_alternative(r.failures, before, (int)k);
    }
    for(size_t i=0;i<targets.size(); ++i)
        r.bindings.push_back(any_ok ? ctx_.get_union(per[i]) : ctx_.unknown());
    return r;
}

DestructureResult DestructuringAssigner::assign_one(const std::vector<Target>& targets, TypeId source, long rest){
    const Type& t = ctx_.at(source);
    switch(t.kind){
        case Type::Kind::Unknown: return all(targets.size(), ctx_.unknown());
        case Type::Kind::Never: return all(targets.size(), ctx_.never());
        case Type::Kind::Tuple: return assign_shape(targets, t.shape, rest);
        case Type::Kind::Sequence:
        case Type::Kind::Iterable: return assign_elements(targets, t.elem, rest);
        default: break;
    }
    auto r = all(targets.size(), ctx_.unknown());
    Failure f; f.kind = FailureKind::NotATuple; f.source = source;
    r.failures.push_back(f);
    return r;
}

// Generic iterable: no size information to check.
DestructureResult DestructuringAssigner::assign_elements(const std::vector<Target>& targets, TypeId elem, long rest){
    DestructureResult r;
    for(size_t i=0;i<targets.size(); ++i)
        r.bindings.push_back((long)i == rest ? ctx_.get_sequence(elem) : elem);
    return r;
}

DestructureResult DestructuringAssigner::assign_shape(const std::vector<Target>& targets, const TupleShape& s, long rest){
    const size_t n = targets.size();
    if(rest < 0){
        if(!s.is_exact() || s.prefix.size() != n){
            auto r = all(n, ctx_.unknown());
            r.failures.push_back(size_mismatch(n, s.min_length(), !s.is_exact()));
            return r;
        }
        DestructureResult r;
        r.bindings = s.prefix;
        return r;
    }

    const size_t lead = (size_t)rest, trail = n - 1 - lead;
    if(s.min_length() < n - 1){
        auto r = all(n, ctx_.unknown());
        r.failures.push_back(size_mismatch(n - 1, s.min_length(), !s.is_exact(), true));
        return r;
    }
    DestructureResult r;
    r.bindings.resize(n, ctx_.unknown());

    if(s.is_exact()){
        const auto& F = s.prefix;
        const size_t N = F.size();
        for(size_t i=0;i<lead; ++i) r.bindings[i] = F[i];
        for(size_t t=0;t<trail; ++t) r.bindings[lead + 1 + t] = F[N - trail + t];
        std::vector<TypeId> middle(F.begin() + lead, F.begin() + (N - trail));
        r.bindings[lead] = ctx_.get_sequence(ctx_.get_union(middle));
        return r;
    }

    const size_t sP = s.prefix.size(), sS = s.suffix.size();
    const TypeId E = segment_element_type(ctx_, *s.variadic);
    for(size_t i=0;i<lead; ++i){
        if(i < sP){ r.bindings[i] = s.prefix[i]; continue; }
        std::vector<TypeId> m{E};
        for(size_t j=0; j<=i-sP && j<sS; ++j) m.push_back(s.suffix[j]);
        r.bindings[i] = ctx_.get_union(m);
    }
    for(size_t t=0;t<trail; ++t){
        size_t j = trail - 1 - t; // distance from the end
        if(j < sS){ r.bindings[lead + 1 + t] = s.suffix[sS - 1 - j]; continue; }
        std::vector<TypeId> m{E};
        for(size_t q=0; q<=j-sS && q<sP; ++q) m.push_back(s.prefix[sP - 1 - q]);
        r.bindings[lead + 1 + t] = ctx_.get_union(m);
    }
    // everything that can fall between the leading and trailing targets
    std::vector<TypeId> middle{E};
    for(size_t i=lead;i<sP; ++i) middle.push_back(s.prefix[i]);
    for(size_t j=0;j+trail<sS; ++j) middle.push_back(s.suffix[j]);
    r.bindings[lead] = ctx_.get_sequence(ctx_.get_union(middle));
    if(trace_enabled())
        trace("destructure", ctx_.to_string(ctx_.get_tuple(s)) + " rest@" + std::to_string(rest) + " -> " + ctx_.to_string(r.bindings[lead]));
    return r;
}

} // namespace tupl
