#include "pyreview/core/Config.h"
#include "pyreview/core/Rule.h"
#include "pyreview/core/RuleRegistry.h"
#include "pyreview/rules/BuiltinRules.h"
#include "pyreview/syntax/SyntaxTree.h"

namespace pyreview {

namespace {

// Depth comes from the walker: the count of If/For/While on the path to
// this node, itself included. Siblings do not accumulate.
class SMELL001_DeepNesting : public Rule {
public:
    static constexpr RuleDescriptor kDescriptor{
        "SMELL_001", "Code Smell", Severity::Medium,
        "Conditional or loop nested deeper than the configured maximum."};

    SMELL001_DeepNesting(std::string filePath, const Config &cfg)
        : Rule(kDescriptor, std::move(filePath)),
          maxDepth_(cfg.maxNestingDepth) {}

    void visitNode(const Node &node, const VisitContext &ctx) override {
        if (node.isBranch() && ctx.nestingDepth > maxDepth_)
            report("Deep nesting detected", node.getLine());
    }

private:
    unsigned maxDepth_;
};

} // anonymous namespace

PYREVIEW_DEFINE_RULE_ENTRY(SMELL001_DeepNesting)

} // namespace pyreview
