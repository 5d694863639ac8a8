// index.hpp - literal-index element type resolution
#pragma once
#include "tupl/failure.hpp"
#include "tupl/options.hpp"
#include "tupl/types.hpp"
#include <optional>
#include <vector>

namespace tupl {

struct IndexResult {
    TypeId type = 0;
    std::vector<Failure> failures;
    bool ok() const { return failures.empty(); }
};

class IndexResolver {
public:
    explicit IndexResolver(TypeContext& ctx, IndexPolicy policy = IndexPolicy::Conservative): ctx_(ctx), policy_(policy){}

    IndexPolicy policy() const { return policy_; }

    // Subject may be a tuple, a union of tuples, or Unknown. Each union alternative is
    // indexed on its own; failing alternatives contribute one failure each. When no
    // alternative succeeds the result is the union of the failing shapes' elements.
    IndexResult resolve(TypeId subject, int64_t index);

    // Element type at `index`, or nullopt when the index is out of range.
    std::optional<TypeId> resolve_shape(const TupleShape& shape, int64_t index);

private:
    TypeId resolve_open(const TupleShape& shape, int64_t index);

    TypeContext& ctx_;
    IndexPolicy policy_;
};

} // namespace tupl
