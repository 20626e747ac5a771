#pragma once

#include "pyreview/core/Severity.h"

#include <string>
#include <vector>

namespace pyreview {

struct Config {
    // Rule thresholds
    unsigned longFunctionMaxLines = 50;  // MAINT_001
    unsigned maxParameters        = 5;   // MAINT_002
    unsigned maxNestingDepth      = 3;   // SMELL_001
    unsigned largeFileMaxLines    = 500; // ORG_001

    // DEPR_001 denylist
    std::vector<std::string> deprecatedModules = {"imp", "optparse"};

    // Rule enable/disable
    std::vector<std::string> disabledRules;

    // Minimum severity to emit
    Severity minSeverity = Severity::Low;

    // Output
    std::string outputFile   = "report.json";
    std::string outputFormat = "json"; // json|cli

    // Scheduling
    unsigned jobs     = 1;
    unsigned maxFiles = 0; // 0 = no budget

    bool verbose = false;

    bool isRuleDisabled(const std::string &id) const;

    static Config loadFromFile(const std::string &path);
    static Config defaults();
};

} // namespace pyreview
