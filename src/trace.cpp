#include "tupl/trace.hpp"
#include "tupl/options.hpp"
#include <llvm/Support/ErrorHandling.h>
#include <llvm/Support/PrettyStackTrace.h>
#include <llvm/Support/Signals.h>
#include <llvm/Support/raw_ostream.h>
#include <atomic>
#include <cstdlib>
#include <mutex>

namespace tupl {

static std::atomic<bool>& trace_flag(){
    static std::atomic<bool> flag{[]{
        const char* v = std::getenv("TUPL_TRACE");
        return v && v[0] == '1';
    }()};
    return flag;
}

bool trace_enabled(){ return trace_flag().load(std::memory_order_relaxed); }
void set_trace_enabled(bool on){ trace_flag().store(on, std::memory_order_relaxed); }

void trace(const char* tag, const std::string& msg){
    if(!trace_enabled()) return;
    // raw_ostream is not synchronized
    static std::mutex mu;
    std::lock_guard<std::mutex> lk(mu);
    llvm::errs() << "[tupl][" << tag << "] " << msg << "\n";
    llvm::errs().flush();
}

// Shared by the LLVM fatal error path and the crash signal path.
static void print_backtrace(const char* tag, const char* what){
    llvm::errs() << "[tupl][" << tag << "] " << what << "\n";
    llvm::sys::PrintStackTrace(llvm::errs());
    llvm::errs() << "[tupl][" << tag << "] end of backtrace\n";
    llvm::errs().flush();
}

static void on_fatal_error(void*, const char* reason, bool){
    print_backtrace("fatal", reason ? reason : "<no reason>");
}

static void on_signal(void*){
    print_backtrace("signal", "fatal signal");
}

bool install_fatal_handler_if_requested(const Options& opts){
    static std::once_flag once;
    static std::atomic<bool> installed{false};
    if(opts.install_fatal_handler){
        std::call_once(once, []{
            llvm::install_fatal_error_handler(on_fatal_error);
            llvm::EnablePrettyStackTrace();
            llvm::sys::AddSignalHandler(on_signal, nullptr);
            installed = true;
            trace("init", "fatal error handler installed (TUPL_INSTALL_FATAL_HANDLER=1)");
        });
    }
    return installed.load();
}

} // namespace tupl
