#include "tupl/diagnostics_json.hpp"
#include <sstream>
#include <cstdio>

namespace tupl {

std::string json_escape(const std::string& s){
    std::ostringstream o; o<<'"';
    for(char c: s){
        switch(c){
            case '"': o<<"\\\""; break; case '\\': o<<"\\\\"; break;
            case '\n': o<<"\\n"; break; case '\r': o<<"\\r"; break; case '\t': o<<"\\t"; break;
            default:
                if(static_cast<unsigned char>(c) < 0x20){ char buf[7]; std::snprintf(buf,sizeof(buf),"\\u%04X", (unsigned char)c); o<<buf; }
                else { o<<c; }
                break;
        }
    }
    o<<'"';
    return o.str();
}

static void append_failure_json(std::ostringstream& os, const Failure& f, const TypeContext& ctx){
    os<<"{\"position\":"<<f.position
      <<",\"expected\":"<<f.expected
      <<",\"actual\":"<<f.actual
      <<",\"at_least\":"<<(f.at_least?"true":"false")
      <<",\"expected_at_least\":"<<(f.expected_at_least?"true":"false")
      <<",\"alternative\":"<<f.alternative
      <<",\"source\":"<<json_escape(ctx.to_string(f.source))
      <<",\"target\":"<<json_escape(ctx.to_string(f.target))
      <<"}";
}

std::string diagnostics_to_json(const AnalysisResult& r, const TypeContext& ctx){
    std::ostringstream os;
    os<<"{\"success\":"<<(r.success?"true":"false")<<",\"diagnostics\":[";
    for(size_t i=0;i<r.diagnostics.size(); ++i){
        const auto &d=r.diagnostics[i]; if(i) os<<",";
        os<<"{"
            "\"code\":"<<json_escape(d.code)
            <<",\"kind\":"<<json_escape(failure_kind_name(d.kind))
            <<",\"line\":"<<d.line
            <<",\"col\":"<<d.col
            <<",\"failure\":";
        append_failure_json(os, d.failure, ctx);
        os<<"}";
    }
    os<<"],\"bindings\":{";
    bool first = true;
    for(const auto& kv : r.bindings){
        if(!first) os<<",";
        first = false;
        os<<json_escape(kv.first)<<":"<<json_escape(ctx.to_string(kv.second));
    }
    os<<"}}";
    return os.str();
}

void maybe_print_json(const AnalysisResult& r, const TypeContext& ctx, const Options& opts){
    if(!opts.diag_json) return;
    auto js=diagnostics_to_json(r, ctx);
    std::fprintf(stderr, "%s\n", js.c_str());
}

} // namespace tupl
