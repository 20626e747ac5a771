#include "pyreview/output/OutputFormatter.h"

#include <sstream>

namespace pyreview {

std::string CLIOutputFormatter::format(const std::vector<Diagnostic> &diagnostics) {
    std::ostringstream os;

    for (const auto &d : diagnostics) {
        os << d.location.file << ":" << d.location.line << ": "
           << "[" << severityToString(d.severity) << "] " << d.ruleID
           << " (" << d.category << ") " << d.message << "\n";
    }

    if (diagnostics.empty())
        os << "pyreview: no issues found.\n";
    else
        os << "pyreview: " << diagnostics.size() << " issue(s) found.\n";

    return os.str();
}

} // namespace pyreview
