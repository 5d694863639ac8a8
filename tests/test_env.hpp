#pragma once
#include <string>
#include "tupl/form.hpp"
#include "tupl/types.hpp"

// Test-only cross-platform environment setter shim.
// Tests use the Windows spelling _putenv("NAME=VALUE"); an empty value unsets.
#ifndef _WIN32
extern "C" int _putenv(const char* assignment);
#endif

namespace tupl_test {

// Sets NAME=VALUE for the lifetime of the object and restores the previous value.
class ScopedEnv {
public:
    ScopedEnv(const std::string& name, const std::string& value);
    ~ScopedEnv();
    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;
private:
    std::string name_;
    std::string old_;
    bool had_old_ = false;
};

// Lowers a type form written as text, e.g. ty(ctx, "(tuple int str)").
tupl::TypeId ty(tupl::TypeContext& ctx, const char* src, const tupl::TypeScope* scope = nullptr);

} // namespace tupl_test
