// analyzer.hpp - runs the tuple components over form programs and collects diagnostics
#pragma once
#include "tupl/assign.hpp"
#include "tupl/cache.hpp"
#include "tupl/destructure.hpp"
#include "tupl/failure.hpp"
#include "tupl/form.hpp"
#include "tupl/index.hpp"
#include "tupl/options.hpp"
#include "tupl/params.hpp"
#include "tupl/relation.hpp"
#include "tupl/specialize.hpp"
#include "tupl/types.hpp"
#include <map>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace tupl {

// Structured data only; rendering a message is the embedder's business.
struct Diagnostic {
    std::string code;
    FailureKind kind = FailureKind::SizeMismatch;
    int line = -1;
    int col = -1;
    Failure failure;
};

struct AnalysisResult {
    bool success = true;
    std::vector<Diagnostic> diagnostics;
    std::map<std::string, TypeId> bindings; // names bound by the program
};

// Programs are (tuples <stmt>*) with statements
//   (def %a <type>)
//   (index %r <type> N)
//   (assign <source> <target>)
//   (destructure [%x (rest %y) %z] <source>)
//   (generic f :params [T (variadic Ts)] :args (tuple ...) :ret <type>)
//   (fn f :generics [T] :params [ (param x T) (args rest (tuple int (unpack Ts)) :unpack) ] :ret <type>)
//   (call %r f <args tuple>)
// Names bound by def/index/destructure/call may be used as types by later statements.
// Malformed statements throw parse_error; every tuple failure becomes a Diagnostic and
// the affected name binds to Unknown (or the index fallback type). A malformed
// annotation inside a signature is reported once and calls to it bind Unknown.
class TupleAnalyzer {
public:
    explicit TupleAnalyzer(TypeContext& ctx);
    TupleAnalyzer(TypeContext& ctx, Options opts);

    AnalysisResult analyze(const node_ptr& program);

    // Single steps; each appends its diagnostics to `r`, located at `at`.
    TypeId lower(AnalysisResult& r, const node_ptr& form);
    TypeId index(AnalysisResult& r, TypeId subject, int64_t i, const node& at);
    bool assign(AnalysisResult& r, TypeId source, TypeId target, const node& at);
    std::vector<TypeId> destructure(AnalysisResult& r, const std::vector<Target>& targets, TypeId source, const node& at);
    TypeId call(AnalysisResult& r, const GenericSignature& sig, TypeId args, const node& at);

    ShapeCache& cache(){ return cache_; }
    StructuralRelation& relation(){ return relation_; }
    const Options& options() const { return opts_; }

private:
    void report(AnalysisResult& r, const node& at, const std::vector<Failure>& fs);
    void bind(AnalysisResult& r, const std::string& name, TypeId t);
    void report_shape_error(AnalysisResult& r, const node& at, const shape_error& e);
    GenericSignature read_fn(const node_ptr& form);

    TypeContext& ctx_;
    Options opts_;
    StructuralRelation relation_;
    IndexResolver resolver_;
    AssignabilityChecker checker_;
    DestructuringAssigner destructurer_;
    Specializer specializer_;
    ShapeCache cache_;
    // per program
    TypeScope scope_;
    std::unordered_map<std::string, GenericSignature> signatures_;
    std::unordered_set<std::string> malformed_;
};

} // namespace tupl
