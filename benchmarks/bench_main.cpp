#include "tupl/analyzer.hpp"
#include <chrono>
#include <iostream>
#include <string>
#include <vector>
#include <cstdlib>

using Clock = std::chrono::steady_clock;

struct RunResult { double ms; size_t diagnostics; size_t hits; };

// Runs `program` `rounds` times through one analyzer so repeated queries can hit the cache.
static RunResult bench_case(const char* name, const std::string &program, bool cache, int rounds){
    tupl::TypeContext tctx;
    tupl::Options opts;
    opts.enable_cache = cache;
    tupl::TupleAnalyzer an(tctx, opts);
    auto form = tupl::parse_one(program);

    size_t diags = 0;
    auto t0 = Clock::now();
    for(int i=0;i<rounds; ++i){
        auto r = an.analyze(form);
        diags = r.diagnostics.size();
    }
    auto t1 = Clock::now();
    if(diags == 0 && std::string(name) == "index_oor"){
        std::cerr << "[bench] case '" << name << "' produced no diagnostics\n";
    }
    return { std::chrono::duration<double, std::milli>(t1 - t0).count(), diags, an.cache().hits() };
}

// (tuple int int ... ) with n elements, spelled as a form
static std::string wide_tuple(int n, const char* elem){
    std::string s = "(tuple";
    for(int i=0;i<n; ++i){ s += ' '; s += elem; }
    return s + ")";
}

int main(int argc, char** argv){
    int rounds = 200;
    if(argc > 1) rounds = std::atoi(argv[1]);
    if(rounds <= 0) rounds = 200;

    struct Case { const char* name; std::string prog; };
    std::vector<Case> cases;

    // Case 1: indexing into a union of open shapes
    {
        std::string p = "(tuples\n  (def %u (union (tuple int (unpack (tuple str ...)) float) (tuple bytes bytes) (tuple bool ...)))\n";
        for(int i=-8;i<8; ++i) p += "  (index %r" + std::to_string(i + 8) + " %u " + std::to_string(i) + ")\n";
        cases.push_back({ "index_union", p + ")" });
    }

    // Case 2: out of range on a wide exact tuple
    {
        std::string p = "(tuples\n  (def %w " + wide_tuple(64, "int") + ")\n";
        for(int i=0;i<16; ++i) p += "  (index %r" + std::to_string(i) + " %w " + std::to_string(60 + i) + ")\n";
        cases.push_back({ "index_oor", p + ")" });
    }

    // Case 3: assignability of wide shapes against an open target
    {
        std::string src = wide_tuple(64, "bool");
        std::string p = "(tuples\n";
        for(int i=0;i<16; ++i) p += "  (assign " + src + " (tuple int (unpack (tuple float ...)) int))\n";
        cases.push_back({ "assign_wide", p + ")" });
    }

    // Case 4: variadic specialization
    cases.push_back({
        "specialize",
        "(tuples\n"
        "  (generic wrap :params [T (variadic Ts)] :args (tuple T (unpack Ts)) :ret (tuple (unpack Ts) T))\n"
        "  (call %a wrap (tuple int str bytes float))\n"
        "  (call %b wrap (tuple int (unpack (tuple str ...))))\n"
        "  (destructure [%x (rest %y) %z] %a)\n"
        ")"
    });

    std::cout << "name,cache,rounds,ms,diagnostics,cache_hits\n";
    for(const auto &c : cases){
        for(bool cache : {false, true}){
            auto r = bench_case(c.name, c.prog, cache, rounds);
            std::cout << c.name << "," << (cache ? "on" : "off") << "," << rounds << "," << r.ms << "," << r.diagnostics << "," << r.hits << "\n";
        }
    }
    return 0;
}
