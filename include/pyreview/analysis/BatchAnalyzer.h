#pragma once

#include "pyreview/analysis/FileAnalyzer.h"
#include "pyreview/analysis/ReportSink.h"
#include "pyreview/core/Config.h"
#include "pyreview/core/RuleRegistry.h"

#include <string>
#include <vector>

namespace pyreview {

struct BatchStats {
    unsigned analyzed = 0;
    unsigned skipped  = 0; // not submitted because of the max_files budget
};

// Analyzes many files and feeds the sink in input order. With jobs > 1 the
// files are analyzed on a bounded set of worker threads; results are still
// collected in submission order.
class BatchAnalyzer {
public:
    explicit BatchAnalyzer(const Config &cfg,
                           const RuleRegistry &registry = RuleRegistry::builtin())
        : config_(cfg), analyzer_(cfg, registry) {}

    BatchStats run(const std::vector<std::string> &files, ReportSink &sink) const;

private:
    unsigned workerCount(size_t fileCount) const;

    const Config &config_;
    FileAnalyzer analyzer_;
};

} // namespace pyreview
