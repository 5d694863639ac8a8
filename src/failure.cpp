#include "tupl/failure.hpp"

namespace tupl {

const char* failure_kind_name(FailureKind k){
    switch(k){
        case FailureKind::MalformedShape: return "MalformedShape";
        case FailureKind::SizeMismatch: return "SizeMismatch";
        case FailureKind::ElementTypeMismatch: return "ElementTypeMismatch";
        case FailureKind::IndexOutOfRange: return "IndexOutOfRange";
        case FailureKind::NotATuple: return "NotATuple";
        case FailureKind::MalformedPattern: return "MalformedPattern";
    }
    return "Unknown";
}

const char* failure_code(FailureKind k){
    switch(k){
        case FailureKind::MalformedShape: return "E2100";
        case FailureKind::SizeMismatch: return "E2101";
        case FailureKind::ElementTypeMismatch: return "E2102";
        case FailureKind::IndexOutOfRange: return "E2103";
        case FailureKind::NotATuple: return "E2104";
        case FailureKind::MalformedPattern: return "E2105";
    }
    return "E2199";
}

} // namespace tupl
