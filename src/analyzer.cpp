#include "tupl/analyzer.hpp"
#include "tupl/diagnostics_json.hpp"
#include "tupl/trace.hpp"

namespace tupl {

TupleAnalyzer::TupleAnalyzer(TypeContext& ctx): TupleAnalyzer(ctx, detect_options()){}

TupleAnalyzer::TupleAnalyzer(TypeContext& ctx, Options opts)
    : ctx_(ctx), opts_(std::move(opts)), relation_(ctx, opts_.promotions), resolver_(ctx, opts_.index_policy),
      checker_(ctx, relation_), destructurer_(ctx), specializer_(ctx, relation_), cache_(opts_.enable_cache)
{
    if(opts_.trace) set_trace_enabled(true);
    install_fatal_handler_if_requested(opts_);
}

void TupleAnalyzer::report(AnalysisResult& r, const node& at, const std::vector<Failure>& fs){
    for(const auto& f : fs){
        Diagnostic d;
        d.code = failure_code(f.kind);
        d.kind = f.kind;
        d.line = line(at);
        d.col = col(at);
        d.failure = f;
        r.diagnostics.push_back(d);
    }
    if(!fs.empty()) r.success = false;
}

void TupleAnalyzer::bind(AnalysisResult& r, const std::string& name, TypeId t){
    scope_.params[name] = t;
    r.bindings[name] = t;
}

void TupleAnalyzer::report_shape_error(AnalysisResult& r, const node& at, const shape_error& e){
    Failure f; f.kind = e.kind; f.position = e.position;
    trace("lower", std::string("shape error: ") + e.what());
    report(r, at, {f});
}

TypeId TupleAnalyzer::lower(AnalysisResult& r, const node_ptr& form){
    try {
        return ctx_.parse_type(form, &scope_);
    } catch(const shape_error& e){
        report_shape_error(r, form ? *form : node{}, e);
        return ctx_.unknown();
    }
}

TypeId TupleAnalyzer::index(AnalysisResult& r, TypeId subject, int64_t i, const node& at){
    auto res = cache_.index(subject, i, resolver_.policy(), [&]{ return resolver_.resolve(subject, i); });
    report(r, at, res.failures);
    return res.type;
}

bool TupleAnalyzer::assign(AnalysisResult& r, TypeId source, TypeId target, const node& at){
    auto res = cache_.assign(source, target, [&]{ return checker_.check(source, target); });
    report(r, at, res.failures);
    return res.ok();
}

std::vector<TypeId> TupleAnalyzer::destructure(AnalysisResult& r, const std::vector<Target>& targets, TypeId source, const node& at){
    auto res = destructurer_.assign(targets, source);
    report(r, at, res.failures);
    return res.bindings;
}

TypeId TupleAnalyzer::call(AnalysisResult& r, const GenericSignature& sig, TypeId args, const node& at){
    const Type& a = ctx_.at(args);
    if(a.kind == Type::Kind::Unknown) return ctx_.unknown();
    if(a.kind != Type::Kind::Tuple){
        Failure f; f.kind = FailureKind::NotATuple; f.source = args;
        report(r, at, {f});
        return ctx_.unknown();
    }
    auto res = specializer_.specialize_call(sig, a.shape);
    report(r, at, res.failures);
    return res.ret;
}

// (fn f :generics [T (variadic Ts)] :params [ ... ] :ret <type>)
GenericSignature TupleAnalyzer::read_fn(const node_ptr& form){
    const auto& l = as_list(*form)->elems;
    if(l.size() < 2 || !l[1] || !is_symbol(*l[1])) throw parse_error("fn: expected a name");
    GenericSignature sig;
    sig.name = as_symbol(*l[1])->name;
    TypeScope scope; scope.parent = &scope_;
    node_ptr params, ret;
    for(size_t j=2;j<l.size(); ++j){
        if(!l[j] || !is_keyword(*l[j])) throw parse_error("fn: expected keyword, got " + to_string(l[j]));
        std::string kw = std::get<keyword>(l[j]->data).name;
        if(++j >= l.size()) throw parse_error("fn: missing value for :" + kw);
        if(kw == "generics") read_type_params(ctx_, l[j], sig.params, scope);
        else if(kw == "params") params = l[j];
        else if(kw == "ret") ret = l[j];
        else throw parse_error("fn: unknown key :" + kw);
    }
    if(!ret) throw parse_error("fn: missing :ret");
    if(params) sig.positional = expand_param_list(ctx_, read_params(ctx_, params, &scope)).positional_shape();
    sig.ret = ctx_.parse_type(ret, &scope);
    return sig;
}

static std::string sym_name(const node_ptr& n, const char* what){
    if(!n || !is_symbol(*n)) throw parse_error(std::string(what) + ": expected a name, got " + to_string(n));
    return as_symbol(*n)->name;
}

AnalysisResult TupleAnalyzer::analyze(const node_ptr& program){
    if(!program || head_of(*program) != "tuples") throw parse_error("expected (tuples ...) program");
    AnalysisResult r;
    scope_ = TypeScope{};
    signatures_.clear();
    malformed_.clear();
    const auto& top = as_list(*program)->elems;
    for(size_t s=1; s<top.size(); ++s){
        const node_ptr& stmt = top[s];
        std::string head = stmt ? head_of(*stmt) : std::string();
        if(head.empty()) throw parse_error("statement must be a list form: " + to_string(stmt));
        const auto& l = as_list(*stmt)->elems;
        trace("stmt", to_string(stmt));
        if(head == "def"){
            if(l.size() != 3) throw parse_error("def: expected (def name type)");
            bind(r, sym_name(l[1], "def"), lower(r, l[2]));
        } else if(head == "index"){
            if(l.size() != 4 || !l[3] || !std::holds_alternative<int64_t>(l[3]->data))
                throw parse_error("index: expected (index name type integer)");
            std::string dst = sym_name(l[1], "index");
            TypeId subject = lower(r, l[2]);
            bind(r, dst, index(r, subject, std::get<int64_t>(l[3]->data), *stmt));
        } else if(head == "assign"){
            if(l.size() != 3) throw parse_error("assign: expected (assign source target)");
            TypeId src = lower(r, l[1]);
            TypeId dst = lower(r, l[2]);
            assign(r, src, dst, *stmt);
        } else if(head == "destructure"){
            if(l.size() != 3 || !l[1] || !is_vector(*l[1])) throw parse_error("destructure: expected (destructure [targets] source)");
            std::vector<Target> targets;
            for(auto& t : as_vector(*l[1])->elems){
                if(t && head_of(*t) == "rest"){
                    const auto& rl = as_list(*t)->elems;
                    if(rl.size() != 2) throw parse_error("destructure: (rest name) expects one name");
                    targets.push_back(Target{sym_name(rl[1], "rest"), true});
                } else {
                    targets.push_back(Target{sym_name(t, "destructure"), false});
                }
            }
            TypeId src = lower(r, l[2]);
            auto types = destructure(r, targets, src, *stmt);
            for(size_t i=0;i<targets.size(); ++i) bind(r, targets[i].name, types[i]);
        } else if(head == "generic" || head == "fn"){
            std::string name = l.size() > 1 && l[1] && is_symbol(*l[1]) ? as_symbol(*l[1])->name : std::string();
            try {
                auto sig = head == "fn" ? read_fn(stmt) : read_signature(ctx_, stmt, &scope_);
                if(sig.name.empty()) throw parse_error(head + ": a named signature is required here");
                malformed_.erase(sig.name);
                signatures_[sig.name] = std::move(sig);
            } catch(const shape_error& e){
                // calls to a signature with a malformed annotation bind Unknown
                report_shape_error(r, *stmt, e);
                if(!name.empty()){ signatures_.erase(name); malformed_.insert(name); }
            }
        } else if(head == "call"){
            if(l.size() != 4) throw parse_error("call: expected (call name signature args)");
            std::string dst = sym_name(l[1], "call");
            std::string fname = sym_name(l[2], "call");
            if(malformed_.count(fname)){
                lower(r, l[3]);
                bind(r, dst, ctx_.unknown());
                continue;
            }
            auto it = signatures_.find(fname);
            if(it == signatures_.end()) throw parse_error("call: unknown signature " + fname);
            TypeId args = lower(r, l[3]);
            bind(r, dst, call(r, it->second, args, *stmt));
        } else {
            throw parse_error("unknown statement: " + head);
        }
    }
    maybe_print_json(r, ctx_, opts_);
    return r;
}

} // namespace tupl
