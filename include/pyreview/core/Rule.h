#pragma once

#include "pyreview/core/Diagnostic.h"
#include "pyreview/core/Severity.h"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pyreview {

class Node;
struct SourceText;

// Static identity of a rule, shared by every instance and every file.
struct RuleDescriptor {
    std::string_view id;
    std::string_view category;
    Severity         severity;
    std::string_view summary;
};

struct VisitContext {
    // If/For/While constructs on the path from the root, counting the
    // visited node itself when it is one.
    unsigned nestingDepth = 0;
};

// One analysis concern. An instance is created per file, accumulates the
// Diagnostics for that file, and is discarded afterwards.
class Rule {
public:
    Rule(const RuleDescriptor &desc, std::string filePath)
        : desc_(desc), filePath_(std::move(filePath)) {}
    virtual ~Rule() = default;

    const RuleDescriptor &descriptor() const { return desc_; }
    std::string_view getID() const { return desc_.id; }

    // Rules that do not need a tree only get checkSource(), and get it even
    // when the file fails to parse.
    virtual bool requiresTree() const { return true; }

    virtual void checkSource(const SourceText & /*source*/) {}

    // Called once per node, pre-order, from a shared TreeWalker pass.
    virtual void visitNode(const Node & /*node*/,
                           const VisitContext & /*ctx*/) {}

    const std::vector<Diagnostic> &diagnostics() const { return diagnostics_; }
    std::vector<Diagnostic> takeDiagnostics() { return std::move(diagnostics_); }

protected:
    void report(std::string message, unsigned line);

    const std::string &filePath() const { return filePath_; }

private:
    const RuleDescriptor &desc_;
    std::string filePath_;
    std::vector<Diagnostic> diagnostics_;
};

} // namespace pyreview
