#include "pyreview/core/Config.h"
#include "pyreview/core/Rule.h"
#include "pyreview/core/RuleRegistry.h"
#include "pyreview/rules/BuiltinRules.h"
#include "pyreview/syntax/SyntaxTree.h"

#include <sstream>

namespace pyreview {

namespace {

class MAINT001_LongFunction : public Rule {
public:
    static constexpr RuleDescriptor kDescriptor{
        "MAINT_001", "Maintainability", Severity::Medium,
        "Function body spans more lines than the configured maximum."};

    MAINT001_LongFunction(std::string filePath, const Config &cfg)
        : Rule(kDescriptor, std::move(filePath)),
          maxLines_(cfg.longFunctionMaxLines) {}

    void visitNode(const Node &node, const VisitContext & /*ctx*/) override {
        // Only plain `def`; coroutines are a separate node kind.
        if (node.getKind() != NodeKind::FunctionDef)
            return;

        const auto &FD = llvm::cast<FunctionDefNode>(node);
        unsigned length = FD.getEndLine() - FD.getLine();
        if (length <= maxLines_)
            return;

        std::ostringstream msg;
        msg << "Function '" << FD.getName() << "' too long (" << length
            << " lines)";
        report(msg.str(), FD.getLine());
    }

private:
    unsigned maxLines_;
};

} // anonymous namespace

PYREVIEW_DEFINE_RULE_ENTRY(MAINT001_LongFunction)

} // namespace pyreview
