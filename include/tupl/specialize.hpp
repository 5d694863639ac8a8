// specialize.hpp - binding generic signatures against call-site argument shapes
#pragma once
#include "tupl/assign.hpp"
#include "tupl/failure.hpp"
#include "tupl/relation.hpp"
#include "tupl/types.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace tupl {

struct TypeParamDecl {
    enum class Kind { Scalar, VariadicTuple } kind = Kind::Scalar;
    std::string name;
    TypeId id = 0; // TypeParam or VariadicParam
};

struct GenericSignature {
    std::string name; // optional
    std::vector<TypeParamDecl> params;
    TupleShape positional; // declared positional-parameter shape
    TypeId ret = 0;
};

// Reads a parameter vector [T U (variadic Ts)] into `out`, registering each name in
// `scope`. At most one variadic parameter.
void read_type_params(TypeContext& ctx, const node_ptr& vec, std::vector<TypeParamDecl>& out, TypeScope& scope);

// Reads
//   (generic [name] :params [T (variadic Ts)] :args (tuple T (unpack Ts)) :ret <type>)
// Throws parse_error for malformed signatures and shape_error for malformed
// annotations inside it.
GenericSignature read_signature(TypeContext& ctx, const node_ptr& form, const TypeScope* outer = nullptr);

struct Bindings {
    std::unordered_map<TypeId, TypeId> scalars;       // TypeParam -> bound type
    std::unordered_map<TypeId, TupleShape> variadics; // VariadicParam -> captured shape
};

struct SpecializeResult {
    TypeId ret = 0;
    Bindings bindings;
    std::vector<Failure> failures;
    bool ok() const { return failures.empty(); }
};

class Specializer {
public:
    Specializer(TypeContext& ctx, ElementRelation& rel): ctx_(ctx), rel_(rel){}

    // Binds then substitutes the return type. A failed binding returns Unknown.
    SpecializeResult specialize_call(const GenericSignature& sig, const TupleShape& args);

    std::vector<Failure> bind(const GenericSignature& sig, const TupleShape& args, Bindings& b);

    // Unbound scalar parameters become Unknown; a captured shape is spliced in place of
    // its variadic reference.
    TypeId substitute(TypeId t, const Bindings& b);
    TupleShape substitute_shape(const TupleShape& s, const Bindings& b);

private:
    // `outer` >= 0 reports nested failures at the enclosing argument position.
    void bind_shape(const TupleShape& decl, const TupleShape& args, Bindings& b, std::vector<Failure>& fs, int64_t outer);
    void unify(TypeId param, TypeId arg, int64_t position, Bindings& b, std::vector<Failure>& fs);
    bool mentions_params(TypeId t);

    TypeContext& ctx_;
    ElementRelation& rel_;
};

} // namespace tupl
