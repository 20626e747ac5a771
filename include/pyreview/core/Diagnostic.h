#pragma once

#include "pyreview/core/Severity.h"

#include <string>

namespace pyreview {

struct SourceLocation {
    std::string file;
    unsigned line = 0; // 1-based
};

// One finding. Holds no reference into the syntax tree it came from, so it
// outlives the per-file analysis that produced it.
struct Diagnostic {
    std::string    ruleID;
    std::string    category;
    Severity       severity = Severity::Low;
    std::string    message;
    SourceLocation location;
};

inline bool operator==(const Diagnostic &a, const Diagnostic &b) {
    return a.ruleID == b.ruleID && a.category == b.category &&
           a.severity == b.severity && a.message == b.message &&
           a.location.file == b.location.file &&
           a.location.line == b.location.line;
}

inline bool operator!=(const Diagnostic &a, const Diagnostic &b) {
    return !(a == b);
}

} // namespace pyreview
