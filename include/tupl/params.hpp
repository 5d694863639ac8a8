// params.hpp - virtual parameter lists (expands `*args: *tuple[...]`)
#pragma once
#include "tupl/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace tupl {

enum class ParamCategory { Simple, ArgsList, KwargsDict };
enum class ParamSource { PositionOnly, PositionOrKeyword, KeywordOnly };

// A declared parameter. An ArgsList with an empty name is the bare `*` separator.
// For ArgsList, `type` is the per-argument element type, or (when `unpacked`) a
// tuple type or variadic parameter that describes all the extra arguments at once.
struct ParamDecl {
    ParamCategory category = ParamCategory::Simple;
    std::string name;
    TypeId type = 0;
    bool unpacked = false;
    bool has_default = false;
};

struct VirtualParam {
    ParamCategory category = ParamCategory::Simple;
    std::string name;        // synthesized as "args[0]", "args[1]", ... for expanded entries
    TypeId type = 0;         // element type for ArgsList entries
    size_t index = 0;        // index of the declared parameter it came from
    ParamSource source = ParamSource::PositionOrKeyword;
    bool has_default = false;
    bool synthesized = false;
    std::optional<VariadicSegment> segment; // ArgsList entries only
};

struct ParamListDetails {
    std::vector<VirtualParam> params;
    size_t position_param_count = 0;
    std::optional<size_t> args_index;
    std::optional<size_t> kwargs_index;
    std::optional<size_t> first_keyword_only_index;
    bool has_unpacked_variadic_param = false;

    // The positional part as the declared shape a call binds against.
    TupleShape positional_shape() const;
};

ParamListDetails expand_param_list(TypeContext& ctx, const std::vector<ParamDecl>& decls);

// Reads [ (param x int) (param y int :default) (args rest (tuple int (unpack Ts)) :unpack) (kwargs kw str) ]
// `(args)` with no name is the keyword-only separator.
// Throws parse_error for malformed entries.
std::vector<ParamDecl> read_params(TypeContext& ctx, const node_ptr& form, const TypeScope* scope = nullptr);

} // namespace tupl
