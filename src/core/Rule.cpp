#include "pyreview/core/Rule.h"

namespace pyreview {

void Rule::report(std::string message, unsigned line) {
    Diagnostic diag;
    diag.ruleID        = std::string(desc_.id);
    diag.category      = std::string(desc_.category);
    diag.severity      = desc_.severity;
    diag.message       = std::move(message);
    diag.location.file = filePath_;
    diag.location.line = line;
    diagnostics_.push_back(std::move(diag));
}

} // namespace pyreview
