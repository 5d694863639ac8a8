#include "tupl/specialize.hpp"
#include "tupl/trace.hpp"

namespace tupl {

void read_type_params(TypeContext& ctx, const node_ptr& vec, std::vector<TypeParamDecl>& out, TypeScope& scope){
    auto* v = vec ? as_vector(*vec) : nullptr;
    if(!v) throw parse_error("generic: type parameters must be a vector");
    bool sawVariadic = false;
    for(auto& p : v->elems){
        TypeParamDecl d;
        if(p && is_symbol(*p)){
            d.name = as_symbol(*p)->name;
            d.id = ctx.get_type_param(d.name);
        } else if(p && head_of(*p) == "variadic"){
            const auto& vl = as_list(*p)->elems;
            if(vl.size() != 2 || !vl[1] || !is_symbol(*vl[1])) throw parse_error("generic: (variadic Name) expects one symbol");
            if(sawVariadic) throw parse_error("generic: at most one variadic parameter");
            sawVariadic = true;
            d.kind = TypeParamDecl::Kind::VariadicTuple;
            d.name = as_symbol(*vl[1])->name;
            d.id = ctx.get_variadic_param(d.name);
        } else {
            throw parse_error("generic: bad type parameter " + to_string(p));
        }
        if(scope.params.count(d.name)) throw parse_error("generic: duplicate type parameter " + d.name);
        scope.params[d.name] = d.id;
        out.push_back(std::move(d));
    }
}

GenericSignature read_signature(TypeContext& ctx, const node_ptr& form, const TypeScope* outer){
    if(!form || head_of(*form) != "generic") throw parse_error("expected (generic ...) signature");
    const auto& l = as_list(*form)->elems;
    GenericSignature sig;
    TypeScope scope; scope.parent = outer;
    node_ptr args, ret;
    size_t j = 1;
    if(j < l.size() && l[j] && is_symbol(*l[j])) sig.name = as_symbol(*l[j++])->name;
    for(;j<l.size(); ++j){
        if(!l[j] || !is_keyword(*l[j])) throw parse_error("generic: expected keyword, got " + to_string(l[j]));
        std::string kw = std::get<keyword>(l[j]->data).name;
        if(++j >= l.size()) throw parse_error("generic: missing value for :" + kw);
        if(kw == "params") read_type_params(ctx, l[j], sig.params, scope);
        else if(kw == "args") args = l[j];
        else if(kw == "ret") ret = l[j];
        else throw parse_error("generic: unknown key :" + kw);
    }
    if(args){
        TypeId a = ctx.parse_type(args, &scope);
        if(!ctx.is_tuple(a)) throw parse_error("generic: :args must be a tuple form");
        sig.positional = *ctx.shape_of(a);
    }
    if(!ret) throw parse_error("generic: missing :ret");
    sig.ret = ctx.parse_type(ret, &scope);
    return sig;
}

bool Specializer::mentions_params(TypeId t){
    const Type& x = ctx_.at(t);
    switch(x.kind){
        case Type::Kind::TypeParam:
        case Type::Kind::VariadicParam:
        case Type::Kind::VariadicUnion:
            return true;
        case Type::Kind::Union:
            for(TypeId m : x.members) if(mentions_params(m)) return true;
            return false;
        case Type::Kind::Sequence:
        case Type::Kind::Iterable:
            return mentions_params(x.elem);
        case Type::Kind::Tuple:
            for(TypeId e : x.shape.prefix) if(mentions_params(e)) return true;
            for(TypeId e : x.shape.suffix) if(mentions_params(e)) return true;
            if(x.shape.variadic) return x.shape.variadic->is_param() || mentions_params(x.shape.variadic->type);
            return false;
        default:
            return false;
    }
}

void Specializer::unify(TypeId param, TypeId arg, int64_t position, Bindings& b, std::vector<Failure>& fs){
    using K = Type::Kind;
    const Type& p = ctx_.at(param);
    if(p.kind == K::TypeParam){
        auto it = b.scalars.find(param);
        if(it == b.scalars.end()) b.scalars.emplace(param, arg);
        else if(it->second != arg) it->second = ctx_.get_union({it->second, arg});
        return;
    }
    if(!mentions_params(param)){
        if(!rel_.assignable(arg, param)) fs.push_back(element_mismatch(position, arg, param));
        return;
    }
    const Type& a = ctx_.at(arg);
    if(a.kind == K::Unknown) return;
    if(a.kind == K::Union && p.kind != K::Union){
        const auto members = a.members;
        for(TypeId m : members) unify(param, m, position, b, fs);
        return;
    }
    switch(p.kind){
        case K::Tuple:
            if(a.kind == K::Tuple){ bind_shape(p.shape, a.shape, b, fs, position); return; }
            break;
        case K::Sequence:
            if(a.kind == K::Sequence){ unify(p.elem, a.elem, position, b, fs); return; }
            break;
        case K::Iterable:
            if(a.kind == K::Sequence || a.kind == K::Iterable){ unify(p.elem, a.elem, position, b, fs); return; }
            if(a.kind == K::Tuple){ unify(p.elem, shape_element_union(ctx_, a.shape), position, b, fs); return; }
            break;
        case K::Union: {
            // concrete members absorb what they accept; the rest flows to the first generic member
            std::vector<TypeId> leftovers;
            TypeId open = 0; bool haveOpen = false;
            for(TypeId pm : p.members) if(!haveOpen && mentions_params(pm)){ open = pm; haveOpen = true; }
            for(TypeId m : ctx_.alternatives(arg)){
                bool absorbed = false;
                for(TypeId pm : p.members) if(!mentions_params(pm) && rel_.assignable(m, pm)){ absorbed = true; break; }
                if(!absorbed) leftovers.push_back(m);
            }
            if(leftovers.empty()) return;
            if(haveOpen){ unify(open, ctx_.get_union(leftovers), position, b, fs); return; }
            break;
        }
        default:
            break;
    }
    TypeId expect = substitute(param, b);
    if(!rel_.assignable(arg, expect)) fs.push_back(element_mismatch(position, arg, expect));
}

void Specializer::bind_shape(const TupleShape& decl, const TupleShape& args, Bindings& b, std::vector<Failure>& fs, int64_t outer){
    auto pos = [&](int64_t i){ return outer >= 0 ? outer : i; };
    auto arity = [&](size_t expected, bool expectedAtLeast){
        Failure f = size_mismatch(expected, args.min_length(), !args.is_exact(), expectedAtLeast);
        if(outer >= 0) f.position = outer;
        fs.push_back(f);
    };
    if(decl.is_exact()){
        if(!args.is_exact() || args.prefix.size() != decl.prefix.size()){ arity(decl.prefix.size(), false); return; }
        for(size_t i=0;i<decl.prefix.size(); ++i) unify(decl.prefix[i], args.prefix[i], pos((int64_t)i), b, fs);
        return;
    }

    const size_t dP = decl.prefix.size(), dS = decl.suffix.size();
    if(args.min_length() < dP + dS){ arity(dP + dS, true); return; }
    TupleShape remaining;
    if(args.is_exact()){
        const auto& F = args.prefix;
        const size_t N = F.size();
        for(size_t i=0;i<dP; ++i) unify(decl.prefix[i], F[i], pos((int64_t)i), b, fs);
        for(size_t j=0;j<dS; ++j) unify(decl.suffix[j], F[N-dS+j], pos((int64_t)(N-dS+j)), b, fs);
        remaining = TupleShape::exact(std::vector<TypeId>(F.begin() + dP, F.begin() + (N - dS)));
    } else {
        const size_t aP = args.prefix.size(), aS = args.suffix.size();
        // the argument's open segment must not overlap the fixed declared positions
        if(aP < dP || aS < dS){ arity(dP + dS, true); return; }
        for(size_t i=0;i<dP; ++i) unify(decl.prefix[i], args.prefix[i], pos((int64_t)i), b, fs);
        for(size_t j=0;j<dS; ++j) unify(decl.suffix[j], args.suffix[aS-dS+j], pos(-(int64_t)(dS-j)), b, fs);
        remaining = TupleShape::mixed(std::vector<TypeId>(args.prefix.begin() + dP, args.prefix.end()), args.variadic,
                                      std::vector<TypeId>(args.suffix.begin(), args.suffix.begin() + (aS - dS)));
    }

    const VariadicSegment seg = *decl.variadic;
    if(seg.is_param()){
        auto it = b.variadics.find(seg.type);
        if(it == b.variadics.end()) b.variadics.emplace(seg.type, remaining);
        else if(it->second != remaining)
            fs.push_back(element_mismatch(pos((int64_t)dP), ctx_.get_tuple(remaining), ctx_.get_tuple(it->second)));
        return;
    }
    // *args: T
    const size_t rP = remaining.prefix.size();
    for(size_t i=0;i<rP; ++i) unify(seg.type, remaining.prefix[i], pos((int64_t)(dP+i)), b, fs);
    if(remaining.variadic) unify(seg.type, segment_element_type(ctx_, *remaining.variadic), pos((int64_t)(dP+rP)), b, fs);
    for(size_t j=0;j<remaining.suffix.size(); ++j)
        unify(seg.type, remaining.suffix[j], pos(-(int64_t)(remaining.suffix.size()-j+dS)), b, fs);
}

std::vector<Failure> Specializer::bind(const GenericSignature& sig, const TupleShape& args, Bindings& b){
    std::vector<Failure> fs;
    bind_shape(sig.positional, args, b, fs, -1);
    return fs;
}

TupleShape Specializer::substitute_shape(const TupleShape& s, const Bindings& b){
    std::vector<TypeId> prefix, suffix;
    std::optional<VariadicSegment> seg;
    for(TypeId e : s.prefix) prefix.push_back(substitute(e, b));
    if(s.variadic){
        if(s.variadic->is_param()){
            auto it = b.variadics.find(s.variadic->type);
            if(it == b.variadics.end()) seg = VariadicSegment::repeat(ctx_.unknown());
            else {
                // splice, never nest
                const TupleShape& cap = it->second;
                prefix.insert(prefix.end(), cap.prefix.begin(), cap.prefix.end());
                seg = cap.variadic;
                suffix.insert(suffix.end(), cap.suffix.begin(), cap.suffix.end());
            }
        } else {
            seg = VariadicSegment::repeat(substitute(s.variadic->type, b));
        }
    }
    for(TypeId e : s.suffix) suffix.push_back(substitute(e, b));
    return TupleShape::mixed(std::move(prefix), seg, std::move(suffix));
}

TypeId Specializer::substitute(TypeId t, const Bindings& b){
    const Type& x = ctx_.at(t);
    switch(x.kind){
        case Type::Kind::TypeParam: {
            auto it = b.scalars.find(t);
            return it == b.scalars.end() ? ctx_.unknown() : it->second;
        }
        case Type::Kind::VariadicParam: {
            auto it = b.variadics.find(t);
            return it == b.variadics.end() ? ctx_.unknown() : ctx_.get_tuple(it->second);
        }
        case Type::Kind::VariadicUnion: {
            auto it = b.variadics.find(x.elem);
            return it == b.variadics.end() ? ctx_.unknown() : shape_element_union(ctx_, it->second);
        }
        case Type::Kind::Union: {
            std::vector<TypeId> ms;
            for(TypeId m : x.members) ms.push_back(substitute(m, b));
            return ctx_.get_union(ms);
        }
        case Type::Kind::Tuple: {
            const TupleShape shape = x.shape;
            return ctx_.get_tuple(substitute_shape(shape, b));
        }
        case Type::Kind::Sequence: return ctx_.get_sequence(substitute(x.elem, b));
        case Type::Kind::Iterable: return ctx_.get_iterable(substitute(x.elem, b));
        default: return t;
    }
}

SpecializeResult Specializer::specialize_call(const GenericSignature& sig, const TupleShape& args){
    SpecializeResult r;
    r.failures = bind(sig, args, r.bindings);
    if(!r.ok()) r.ret = ctx_.unknown();
    else r.ret = sig.params.empty() ? sig.ret : substitute(sig.ret, r.bindings);
    if(trace_enabled())
        trace("specialize", ctx_.to_string(ctx_.get_tuple(args)) + " -> " + ctx_.to_string(r.ret) + " failures=" + std::to_string(r.failures.size()));
    return r;
}

} // namespace tupl
