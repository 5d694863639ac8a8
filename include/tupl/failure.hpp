// Typed failure reasons returned by the tuple components.
#pragma once
#include "tupl/form.hpp"
#include "tupl/shape.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace tupl {

enum class FailureKind {
    MalformedShape,      // more than one open segment in an annotation, misplaced ellipsis
    SizeMismatch,        // arity mismatch (destructuring, assignability, specialization)
    ElementTypeMismatch, // position-specific element incompatibility
    IndexOutOfRange,     // literal index outside an exact shape, or any index into ()
    NotATuple,           // a union alternative / source that is not a tuple or iterable
    MalformedPattern     // more than one collect-rest target
};

const char* failure_kind_name(FailureKind k);
// Stable diagnostic code per kind (E2100..E2105).
const char* failure_code(FailureKind k);

// Structured data a caller needs to render a message. Unused fields keep their defaults.
struct Failure {
    FailureKind kind = FailureKind::SizeMismatch;
    int64_t position = -1;   // element position / index / target position
    size_t expected = 0;     // required count
    size_t actual = 0;       // provided (minimum) count
    bool at_least = false;   // `actual` is a lower bound (source has an open segment)
    bool expected_at_least = false; // `expected` is a minimum rather than an exact count
    int alternative = -1;    // union alternative the failure belongs to
    TypeId source = 0;
    TypeId target = 0;
};

inline Failure size_mismatch(size_t expected, size_t actual, bool at_least, bool expected_at_least = false){
    Failure f; f.kind = FailureKind::SizeMismatch; f.expected = expected; f.actual = actual;
    f.at_least = at_least; f.expected_at_least = expected_at_least; return f;
}
inline Failure element_mismatch(int64_t position, TypeId source, TypeId target){
    Failure f; f.kind = FailureKind::ElementTypeMismatch; f.position = position; f.source = source; f.target = target; return f;
}
inline Failure index_out_of_range(int64_t index, size_t length){
    Failure f; f.kind = FailureKind::IndexOutOfRange; f.position = index; f.actual = length; return f;
}

// Thrown while lowering an annotation form. Carries the failure kind and the offending
// element position so the analyzer can record it and fall back to Unknown.
struct shape_error : parse_error {
    FailureKind kind;
    int64_t position;
    shape_error(const std::string& what, FailureKind k = FailureKind::MalformedShape, int64_t pos = -1)
        : parse_error(what), kind(k), position(pos) {}
};

// Tag every failure with the union alternative it came from.
inline void tag_alternative(std::vector<Failure>& fs, size_t from, int alternative){
    for(size_t i = from; i < fs.size(); ++i) fs[i].alternative = alternative;
}

} // namespace tupl
