#pragma once

#include "pyreview/core/Diagnostic.h"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace pyreview {

class OutputFormatter {
public:
    virtual ~OutputFormatter() = default;
    virtual std::string format(const std::vector<Diagnostic> &diagnostics) = 0;
};

// Human-readable listing, one finding per line.
class CLIOutputFormatter : public OutputFormatter {
public:
    std::string format(const std::vector<Diagnostic> &diagnostics) override;
};

// Top-level JSON array of flat objects: file, rule_id, category, severity,
// message, line. No envelope, so existing report consumers keep working.
class JSONOutputFormatter : public OutputFormatter {
public:
    std::string format(const std::vector<Diagnostic> &diagnostics) override;
};

// Returns nullptr for an unknown format name.
std::unique_ptr<OutputFormatter> createFormatter(std::string_view name);

} // namespace pyreview
