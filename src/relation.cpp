#include "tupl/relation.hpp"
#include "tupl/assign.hpp"
#include <unordered_set>

namespace tupl {

StructuralRelation::StructuralRelation(TypeContext& ctx): ctx_(ctx){
    for(auto& p : default_promotions()) promotions_.insert(p);
}

StructuralRelation::StructuralRelation(TypeContext& ctx, const std::vector<Promotion>& extra): StructuralRelation(ctx){
    for(auto& p : extra) promotions_.insert(p);
}

std::vector<StructuralRelation::Promotion> StructuralRelation::default_promotions(){
    return { {"int", "float"}, {"bool", "int"} };
}

// Promotions chain (bool -> int -> float).
bool StructuralRelation::promotes(const std::string& from, const std::string& to) const {
    std::vector<std::string> work{from};
    std::unordered_set<std::string> seen{from};
    while(!work.empty()){
        std::string cur = work.back(); work.pop_back();
        for(auto it = promotions_.lower_bound(Promotion{cur, std::string()}); it != promotions_.end() && it->first == cur; ++it){
            if(it->second == to) return true;
            if(seen.insert(it->second).second) work.push_back(it->second);
        }
    }
    return false;
}

bool StructuralRelation::assignable(TypeId source, TypeId target){
    if(source == target) return true;
    const Type& s = ctx_.at(source);
    const Type& t = ctx_.at(target);
    using K = Type::Kind;
    if(s.kind == K::Unknown || t.kind == K::Unknown) return true;
    if(s.kind == K::Never) return true;
    if(t.kind == K::Named && t.name == "object") return true;
    if(s.kind == K::Union){
        for(TypeId m : s.members) if(!assignable(m, target)) return false;
        return true;
    }
    if(t.kind == K::Union){
        for(TypeId m : t.members) if(assignable(source, m)) return true;
        return false;
    }
    switch(s.kind){
        case K::Named:
            return t.kind == K::Named && promotes(s.name, t.name);
        case K::Tuple:
            // a tuple is never a list
            if(t.kind == K::Tuple || t.kind == K::Iterable)
                return AssignabilityChecker(ctx_, *this).check(source, target).ok();
            return false;
        case K::Sequence:
            if(t.kind == K::Sequence){
                // invariant element type; Unknown is compatible with anything
                return s.elem == t.elem || ctx_.is_unknown(s.elem) || ctx_.is_unknown(t.elem);
            }
            if(t.kind == K::Iterable) return assignable(s.elem, t.elem);
            return false;
        case K::Iterable:
            return t.kind == K::Iterable && assignable(s.elem, t.elem);
        default:
            // TypeParam, VariadicParam, VariadicUnion: identity only (handled above)
            return false;
    }
}

} // namespace tupl
