#include "tupl/params.hpp"
#include "tupl/failure.hpp"

namespace tupl {

ParamListDetails expand_param_list(TypeContext& ctx, const std::vector<ParamDecl>& decls){
    ParamListDetails r;
    bool sawKeywordOnly = false;
    auto source_for = [&](){ return sawKeywordOnly ? ParamSource::KeywordOnly : ParamSource::PositionOrKeyword; };

    for(size_t index=0; index<decls.size(); ++index){
        const ParamDecl& p = decls[index];
        if(p.category == ParamCategory::ArgsList){
            if(p.unpacked && !p.name.empty() && ctx.is_tuple(p.type)){
                // *args: *tuple[...] expands into one entry per tuple element
                const TupleShape shape = *ctx.shape_of(p.type);
                size_t ti = 0;
                auto synth = [&](ParamCategory cat, TypeId t){
                    VirtualParam v;
                    v.category = cat;
                    v.name = p.name + "[" + std::to_string(ti++) + "]";
                    v.type = t;
                    v.index = index;
                    v.source = ParamSource::PositionOnly;
                    v.synthesized = true;
                    return v;
                };
                for(TypeId t : shape.prefix){ r.params.push_back(synth(ParamCategory::Simple, t)); r.position_param_count++; }
                if(shape.variadic){
                    VirtualParam v = synth(ParamCategory::ArgsList, segment_element_type(ctx, *shape.variadic));
                    v.segment = shape.variadic;
                    if(shape.variadic->is_param()) r.has_unpacked_variadic_param = true;
                    r.args_index = r.params.size();
                    r.params.push_back(v);
                }
                for(TypeId t : shape.suffix){ r.params.push_back(synth(ParamCategory::Simple, t)); r.position_param_count++; }
                if(!sawKeywordOnly){ r.first_keyword_only_index = r.params.size(); sawKeywordOnly = true; }
                continue;
            }
            const bool variadicParam = p.unpacked && ctx.kind(p.type) == Type::Kind::VariadicParam;
            if(!p.name.empty() && !r.args_index){
                r.args_index = r.params.size();
                if(variadicParam) r.has_unpacked_variadic_param = true;
            }
            if(!sawKeywordOnly){
                r.first_keyword_only_index = r.params.size() + (p.name.empty() ? 0 : 1);
                sawKeywordOnly = true;
            }
            if(p.name.empty()) continue; // bare `*`
            VirtualParam v;
            v.category = ParamCategory::ArgsList;
            v.name = p.name;
            v.index = index;
            v.source = ParamSource::PositionOnly;
            if(variadicParam){
                v.type = ctx.get_variadic_union(p.type);
                v.segment = VariadicSegment::param(p.type);
            } else {
                v.type = p.type;
                v.segment = VariadicSegment::repeat(p.type);
            }
            r.params.push_back(v);
            continue;
        }
        if(p.category == ParamCategory::KwargsDict){
            sawKeywordOnly = true;
            if(p.name.empty()) continue;
            if(!r.kwargs_index) r.kwargs_index = r.params.size();
            if(!r.first_keyword_only_index) r.first_keyword_only_index = r.params.size();
            VirtualParam v;
            v.category = ParamCategory::KwargsDict;
            v.name = p.name;
            v.type = p.type;
            v.index = index;
            v.source = ParamSource::KeywordOnly;
            r.params.push_back(v);
            continue;
        }
        if(!p.name.empty() && !sawKeywordOnly) r.position_param_count++;
        VirtualParam v;
        v.name = p.name;
        v.type = p.type;
        v.index = index;
        v.source = source_for();
        v.has_default = p.has_default;
        r.params.push_back(v);
    }
    return r;
}

TupleShape ParamListDetails::positional_shape() const {
    std::vector<TypeId> prefix, suffix;
    std::optional<VariadicSegment> seg;
    for(const auto& v : params){
        if(v.source == ParamSource::KeywordOnly || v.category == ParamCategory::KwargsDict) continue;
        if(v.category == ParamCategory::ArgsList){
            if(!seg) seg = v.segment;
            continue;
        }
        (seg ? suffix : prefix).push_back(v.type);
    }
    return TupleShape::mixed(std::move(prefix), seg, std::move(suffix));
}

std::vector<ParamDecl> read_params(TypeContext& ctx, const node_ptr& form, const TypeScope* scope){
    if(!form || !is_vector(*form)) throw parse_error("params: expected a vector of parameter forms");
    std::vector<ParamDecl> out;
    for(auto& e : as_vector(*form)->elems){
        std::string head = e ? head_of(*e) : std::string();
        if(head != "param" && head != "args" && head != "kwargs") throw parse_error("params: bad parameter form " + to_string(e));
        const auto& l = as_list(*e)->elems;
        ParamDecl d;
        d.category = head == "param" ? ParamCategory::Simple : head == "args" ? ParamCategory::ArgsList : ParamCategory::KwargsDict;
        if(l.size() == 1 && d.category == ParamCategory::ArgsList){ out.push_back(d); continue; }
        if(l.size() < 3 || !l[1] || !is_symbol(*l[1])) throw parse_error("params: expected (" + head + " name type ...)");
        d.name = as_symbol(*l[1])->name;
        d.type = ctx.parse_type(l[2], scope);
        for(size_t j=3;j<l.size(); ++j){
            if(!l[j] || !is_keyword(*l[j])) throw parse_error("params: unexpected " + to_string(l[j]));
            const std::string& kw = std::get<keyword>(l[j]->data).name;
            if(kw == "default") d.has_default = true;
            else if(kw == "unpack" && d.category == ParamCategory::ArgsList) d.unpacked = true;
            else throw parse_error("params: unknown flag :" + kw);
        }
        if(d.unpacked){
            auto k = ctx.kind(d.type);
            if(k != Type::Kind::Tuple && k != Type::Kind::VariadicParam)
                throw shape_error("params: :unpack requires a tuple or a variadic parameter");
        }
        out.push_back(d);
    }
    return out;
}

} // namespace tupl
