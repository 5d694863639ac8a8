// destructure.hpp - binding a tuple-typed value to a target pattern
#pragma once
#include "tupl/failure.hpp"
#include "tupl/types.hpp"
#include <string>
#include <vector>

namespace tupl {

struct Target {
    std::string name;
    bool collect_rest = false; // `*name` receives a sequence of the leftover elements
};

struct DestructureResult {
    std::vector<TypeId> bindings; // one per target, in target order
    std::vector<Failure> failures;
    bool ok() const { return failures.empty(); }
};

class DestructuringAssigner {
public:
    explicit DestructuringAssigner(TypeContext& ctx): ctx_(ctx){}

    // Always yields one binding per target; targets of a failed assignment bind to Unknown.
    DestructureResult assign(const std::vector<Target>& targets, TypeId source);

private:
    DestructureResult assign_one(const std::vector<Target>& targets, TypeId source, long rest);
    DestructureResult assign_shape(const std::vector<Target>& targets, const TupleShape& shape, long rest);
    DestructureResult assign_elements(const std::vector<Target>& targets, TypeId elem, long rest);
    DestructureResult all(size_t n, TypeId t);

    TypeContext& ctx_;
};

} // namespace tupl
