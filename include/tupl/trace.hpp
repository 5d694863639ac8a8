// trace.hpp - tagged stderr tracing and the optional LLVM fatal handler
#pragma once
#include <string>

namespace tupl {

struct Options;

// Tracing starts enabled when TUPL_TRACE=1; the analyzer also turns it on from Options.
bool trace_enabled();
void set_trace_enabled(bool on);

// Writes "[tupl][tag] msg" to llvm::errs() when tracing is enabled.
void trace(const char* tag, const std::string& msg);

// Installs the LLVM fatal error handler, pretty stack traces and a signal handler that
// prints a backtrace. Only once per process; returns whether the handler is installed.
bool install_fatal_handler_if_requested(const Options& opts);

} // namespace tupl
