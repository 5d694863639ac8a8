#include "tupl/options.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace tupl {

const char* index_policy_name(IndexPolicy p){
    return p == IndexPolicy::Narrow ? "narrow" : "conservative";
}

static std::string trim(const std::string& s){
    size_t b = 0, e = s.size();
    while(b < e && std::isspace((unsigned char)s[b])) ++b;
    while(e > b && std::isspace((unsigned char)s[e-1])) --e;
    return s.substr(b, e-b);
}

std::vector<std::pair<std::string, std::string>> parse_promotions(const std::string& text){
    std::vector<std::pair<std::string, std::string>> out;
    size_t start = 0;
    while(start <= text.size()){
        size_t comma = text.find(',', start);
        if(comma == std::string::npos) comma = text.size();
        std::string item = text.substr(start, comma - start);
        size_t gt = item.find('>');
        if(gt != std::string::npos){
            std::string from = trim(item.substr(0, gt));
            std::string to = trim(item.substr(gt + 1));
            if(!from.empty() && !to.empty()) out.emplace_back(from, to);
        }
        start = comma + 1;
    }
    return out;
}

Options detect_options(){
    Options o{};
    auto get = [](const char* k)->const char*{ const char* v = std::getenv(k); return (v && *v) ? v : nullptr; };
    auto on = [](const char* v){ return v[0]=='1'||v[0]=='y'||v[0]=='Y'||v[0]=='t'||v[0]=='T'; };

    if (const char* v = get("TUPL_INDEX_POLICY")) {
        std::string p = v;
        std::transform(p.begin(), p.end(), p.begin(), [](unsigned char c){ return (char)std::tolower(c); });
        if (p == "narrow") o.index_policy = IndexPolicy::Narrow;
    }
    if (const char* v = get("TUPL_CACHE")) o.enable_cache = (std::string(v) != "0");
    if (const char* v = get("TUPL_DIAG_JSON")) o.diag_json = on(v);
    if (const char* v = get("TUPL_TRACE")) o.trace = on(v);
    if (const char* v = get("TUPL_INSTALL_FATAL_HANDLER")) o.install_fatal_handler = (std::string(v) == "1");
    if (const char* v = get("TUPL_PROMOTIONS")) o.promotions = parse_promotions(v);
    return o;
}

} // namespace tupl
