#include "tupl/assign.hpp"
#include "tupl/trace.hpp"

namespace tupl {

void AssignabilityChecker::element(std::vector<Failure>& out, int64_t position, TypeId src, TypeId dst){
    if(!rel_.assignable(src, dst)) out.push_back(element_mismatch(position, src, dst));
}

// A position that may be occupied by any of several source elements.
void AssignabilityChecker::element_any(std::vector<Failure>& out, int64_t position, const std::vector<TypeId>& candidates, TypeId dst){
    for(TypeId c : candidates){
        if(!rel_.assignable(c, dst)){ out.push_back(element_mismatch(position, c, dst)); return; }
    }
}

AssignResult AssignabilityChecker::check(TypeId source, TypeId target){
    AssignResult r;
    if(source == target) return r;
    using K = Type::Kind;
    K ks = ctx_.kind(source), kt = ctx_.kind(target);
    if(ks == K::Unknown || kt == K::Unknown) return r;
    if(ks == K::Union){
        // every member must be assignable
        const auto members = ctx_.at(source).members;
        for(size_t k=0;k<members.size(); ++k){
            size_t before = r.failures.size();
            auto sub = check(members[k], target);
            r.failures.insert(r.failures.end(), sub.failures.begin(), sub.failures.end());
            tag_alternative(r.failures, before, (int)k);
        }
        return r;
    }
    if(ks == K::Never) return r;
    if(kt == K::Union){
        const auto members = ctx_.at(target).members;
        for(size_t k=0;k<members.size(); ++k){
            auto sub = check(source, members[k]);
            if(sub.ok()) return AssignResult{};
            size_t before = r.failures.size();
            r.failures.insert(r.failures.end(), sub.failures.begin(), sub.failures.end());
            tag_alternative(r.failures, before, (int)k);
        }
        return r;
    }
    if(ks == K::Tuple){
        const TupleShape src = *ctx_.shape_of(source);
        if(kt == K::Tuple) return check_shapes(src, *ctx_.shape_of(target));
        if(kt == K::Iterable) return check_iterable(src, ctx_.at(target).elem);
        element(r.failures, -1, source, target);
        return r;
    }
    if(kt == K::Tuple){
        Failure f; f.kind = FailureKind::NotATuple; f.source = source; f.target = target;
        r.failures.push_back(f);
        return r;
    }
    element(r.failures, -1, source, target);
    return r;
}

AssignResult AssignabilityChecker::check_shapes(const TupleShape& src, const TupleShape& dst){
    AssignResult r;
    auto& fs = r.failures;
    // tuple[Unknown, ...] fits any shape
    if(src.is_homogeneous() && ctx_.is_unknown(src.variadic->type)) return r;
    if(dst.is_exact()){
        if(!src.is_exact()){
            fs.push_back(size_mismatch(dst.prefix.size(), src.min_length(), true));
            return r;
        }
        if(src.prefix.size() != dst.prefix.size()){
            fs.push_back(size_mismatch(dst.prefix.size(), src.prefix.size(), false));
            return r;
        }
        for(size_t i=0;i<src.prefix.size(); ++i) element(fs, (int64_t)i, src.prefix[i], dst.prefix[i]);
        return r;
    }

    const size_t dP = dst.prefix.size(), dS = dst.suffix.size();
    const TypeId dseg = segment_element_type(ctx_, *dst.variadic);
    if(src.min_length() < dst.min_length()){
        fs.push_back(size_mismatch(dst.min_length(), src.min_length(), !src.is_exact(), true));
        return r;
    }

    if(src.is_exact()){
        const auto& F = src.prefix;
        const size_t n = F.size();
        for(size_t i=0;i<dP; ++i) element(fs, (int64_t)i, F[i], dst.prefix[i]);
        for(size_t i=dP;i<n-dS; ++i) element(fs, (int64_t)i, F[i], dseg);
        for(size_t j=0;j<dS; ++j) element(fs, (int64_t)(n-dS+j), F[n-dS+j], dst.suffix[j]);
        return r;
    }

    const size_t sP = src.prefix.size(), sS = src.suffix.size();
    const TypeId sseg = segment_element_type(ctx_, *src.variadic);
    // front: positions past the source prefix may hold the open segment or shifted suffix elements
    for(size_t i=0;i<dP; ++i){
        if(i < sP){ element(fs, (int64_t)i, src.prefix[i], dst.prefix[i]); continue; }
        std::vector<TypeId> cands{sseg};
        for(size_t j=0; j<=i-sP && j<sS; ++j) cands.push_back(src.suffix[j]);
        element_any(fs, (int64_t)i, cands, dst.prefix[i]);
    }
    // back, counted from the end
    for(size_t j=0;j<dS; ++j){
        TypeId d = dst.suffix[dS-1-j];
        int64_t pos = -(int64_t)(j+1);
        if(j < sS){ element(fs, pos, src.suffix[sS-1-j], d); continue; }
        std::vector<TypeId> cands{sseg};
        for(size_t q=0; q<=j-sS && q<sP; ++q) cands.push_back(src.prefix[sP-1-q]);
        element_any(fs, pos, cands, d);
    }
    // leftover source fixed elements land in the target's open segment
    for(size_t i=dP;i<sP; ++i) element(fs, (int64_t)i, src.prefix[i], dseg);
    for(size_t j=0;j+dS<sS; ++j) element(fs, -(int64_t)(sS-j), src.suffix[j], dseg);
    element(fs, (int64_t)sP, sseg, dseg);
    if(trace_enabled() && !fs.empty())
        trace("assign", ctx_.to_string(ctx_.get_tuple(src)) + " -> " + ctx_.to_string(ctx_.get_tuple(dst)) + " failures=" + std::to_string(fs.size()));
    return r;
}

AssignResult AssignabilityChecker::check_iterable(const TupleShape& src, TypeId elem){
    AssignResult r;
    const size_t sP = src.prefix.size(), sS = src.suffix.size();
    for(size_t i=0;i<sP; ++i) element(r.failures, (int64_t)i, src.prefix[i], elem);
    if(src.variadic) element(r.failures, (int64_t)sP, segment_element_type(ctx_, *src.variadic), elem);
    for(size_t j=0;j<sS; ++j) element(r.failures, -(int64_t)(sS-j), src.suffix[j], elem);
    return r;
}

} // namespace tupl
