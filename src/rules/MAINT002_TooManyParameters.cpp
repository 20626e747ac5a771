#include "pyreview/core/Config.h"
#include "pyreview/core/Rule.h"
#include "pyreview/core/RuleRegistry.h"
#include "pyreview/rules/BuiltinRules.h"
#include "pyreview/syntax/SyntaxTree.h"

#include <string>

namespace pyreview {

namespace {

class MAINT002_TooManyParameters : public Rule {
public:
    static constexpr RuleDescriptor kDescriptor{
        "MAINT_002", "Maintainability", Severity::Medium,
        "Function declares more positional parameters than the maximum."};

    MAINT002_TooManyParameters(std::string filePath, const Config &cfg)
        : Rule(kDescriptor, std::move(filePath)),
          maxParams_(cfg.maxParameters) {}

    void visitNode(const Node &node, const VisitContext & /*ctx*/) override {
        if (node.getKind() != NodeKind::FunctionDef)
            return;

        // Positional-only, *args, keyword-only and **kwargs are not counted.
        const auto &FD = llvm::cast<FunctionDefNode>(node);
        unsigned count = FD.countParameters(ParamKind::PositionalOrKeyword);
        if (count <= maxParams_)
            return;

        report("Function '" + FD.getName() + "' has too many parameters (" +
                   std::to_string(count) + ")",
               FD.getLine());
    }

private:
    unsigned maxParams_;
};

} // anonymous namespace

PYREVIEW_DEFINE_RULE_ENTRY(MAINT002_TooManyParameters)

} // namespace pyreview
