#include "pyreview/analysis/ReportSink.h"

namespace pyreview {

void ReportSink::add(std::vector<Diagnostic> fileDiagnostics) {
    ++filesAdded_;
    for (auto &d : fileDiagnostics) {
        if (d.severity >= minSeverity_)
            diagnostics_.push_back(std::move(d));
    }
}

} // namespace pyreview
