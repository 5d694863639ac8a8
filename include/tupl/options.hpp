// options.hpp - process configuration (TUPL_* environment variables)
#pragma once
#include <string>
#include <utility>
#include <vector>

namespace tupl {

// How an index that falls into the open region of a shape is resolved.
enum class IndexPolicy {
    Conservative, // union of every element type of the shape
    Narrow        // suffix-relative for small negatives, positional unions otherwise
};

const char* index_policy_name(IndexPolicy p);

struct Options {
    IndexPolicy index_policy = IndexPolicy::Conservative;
    bool enable_cache = true;
    bool diag_json = false;
    bool trace = false;
    bool install_fatal_handler = false;
    // Extra nominal promotions (source name, target name) on top of the defaults.
    std::vector<std::pair<std::string, std::string>> promotions;
};

// Reads the process environment:
//   TUPL_INDEX_POLICY=conservative|narrow
//   TUPL_CACHE=0                 disable memoization
//   TUPL_DIAG_JSON=1             print analysis results as JSON to stderr
//   TUPL_TRACE=1                 [tupl][...] trace lines on stderr
//   TUPL_INSTALL_FATAL_HANDLER=1 LLVM fatal handler + pretty stack traces
//   TUPL_PROMOTIONS=a>b,c>d      extra nominal promotions
Options detect_options();

// Parses "a>b,c>d"; malformed entries are skipped.
std::vector<std::pair<std::string, std::string>> parse_promotions(const std::string& text);

} // namespace tupl
