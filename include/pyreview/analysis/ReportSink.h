#pragma once

#include "pyreview/core/Diagnostic.h"
#include "pyreview/core/Severity.h"

#include <cstddef>
#include <vector>

namespace pyreview {

// Accumulates Diagnostics across files in the order they are added.
class ReportSink {
public:
    explicit ReportSink(Severity minSeverity = Severity::Low)
        : minSeverity_(minSeverity) {}

    // Adds one file's results, dropping anything below the minimum severity.
    void add(std::vector<Diagnostic> fileDiagnostics);

    const std::vector<Diagnostic> &diagnostics() const { return diagnostics_; }
    size_t size() const { return diagnostics_.size(); }
    unsigned filesAdded() const { return filesAdded_; }

private:
    Severity minSeverity_;
    unsigned filesAdded_ = 0;
    std::vector<Diagnostic> diagnostics_;
};

} // namespace pyreview
