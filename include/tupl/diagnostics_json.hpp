// diagnostics_json.hpp - JSON serialization for AnalysisResult
#pragma once
#include "tupl/analyzer.hpp"
#include <string>

namespace tupl {

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// Serialize diagnostics and bindings to a compact JSON string. Type ids are rendered
// as canonical type strings.
std::string diagnostics_to_json(const AnalysisResult& r, const TypeContext& ctx);

// If opts.diag_json (TUPL_DIAG_JSON=1), print the JSON to stderr.
void maybe_print_json(const AnalysisResult& r, const TypeContext& ctx, const Options& opts);

} // namespace tupl
