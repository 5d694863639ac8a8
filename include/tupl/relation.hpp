// relation.hpp - the general element assignability predicate
#pragma once
#include "tupl/types.hpp"
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace tupl {

// assignable(source, target) for individual element types. The tuple components only
// ever ask this question; embedders with a richer type lattice plug in their own.
class ElementRelation {
public:
    virtual ~ElementRelation() = default;
    virtual bool assignable(TypeId source, TypeId target) = 0;
};

// Default relation: identity, Unknown both ways, `object` as top, nominal promotions,
// unions, recursive tuples, invariant Sequence (list), covariant Iterable. Tuples are
// assignable to Iterable but never to Sequence. Union[*Ts] is only
// assignable to itself and `object`.
class StructuralRelation : public ElementRelation {
public:
    using Promotion = std::pair<std::string, std::string>;

    explicit StructuralRelation(TypeContext& ctx);
    StructuralRelation(TypeContext& ctx, const std::vector<Promotion>& extra);

    // int -> float, bool -> int
    static std::vector<Promotion> default_promotions();
    void add_promotion(const std::string& from, const std::string& to){ promotions_.emplace(from, to); }

    bool assignable(TypeId source, TypeId target) override;

private:
    bool promotes(const std::string& from, const std::string& to) const;

    TypeContext& ctx_;
    std::set<Promotion> promotions_;
};

} // namespace tupl
