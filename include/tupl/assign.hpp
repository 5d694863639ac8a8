// assign.hpp - tuple-shape assignability
#pragma once
#include "tupl/failure.hpp"
#include "tupl/relation.hpp"
#include "tupl/types.hpp"
#include <vector>

namespace tupl {

struct AssignResult {
    std::vector<Failure> failures;
    bool ok() const { return failures.empty(); }
};

// Decides whether a source type may be assigned where a target type is expected.
// Every failing element position is reported, not just the first. Positions that
// belong to a source suffix are reported as negative offsets from the end.
class AssignabilityChecker {
public:
    AssignabilityChecker(TypeContext& ctx, ElementRelation& rel): ctx_(ctx), rel_(rel){}

    AssignResult check(TypeId source, TypeId target);
    AssignResult check_shapes(const TupleShape& src, const TupleShape& dst);
    // Target is Iterable[elem]. list[elem] never accepts a tuple.
    AssignResult check_iterable(const TupleShape& src, TypeId elem);

private:
    void element(std::vector<Failure>& out, int64_t position, TypeId src, TypeId dst);
    void element_any(std::vector<Failure>& out, int64_t position, const std::vector<TypeId>& candidates, TypeId dst);

    TypeContext& ctx_;
    ElementRelation& rel_;
};

} // namespace tupl
