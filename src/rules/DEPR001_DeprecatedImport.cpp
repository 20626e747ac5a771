#include "pyreview/core/Config.h"
#include "pyreview/core/Rule.h"
#include "pyreview/core/RuleRegistry.h"
#include "pyreview/rules/BuiltinRules.h"
#include "pyreview/syntax/SyntaxTree.h"

#include <llvm/ADT/StringSet.h>

namespace pyreview {

namespace {

class DEPR001_DeprecatedImport : public Rule {
public:
    static constexpr RuleDescriptor kDescriptor{
        "DEPR_001", "Deprecated", Severity::High,
        "Import of a module on the deprecated-module denylist."};

    DEPR001_DeprecatedImport(std::string filePath, const Config &cfg)
        : Rule(kDescriptor, std::move(filePath)) {
        for (const auto &mod : cfg.deprecatedModules)
            denylist_.insert(mod);
    }

    void visitNode(const Node &node, const VisitContext & /*ctx*/) override {
        const auto *IN = llvm::dyn_cast<ImportNode>(&node);
        if (!IN)
            return;

        // `import a, b` reports per alias; `from a import x, y` once.
        for (const auto &mod : IN->moduleNames()) {
            if (denylist_.contains(mod))
                report("Deprecated module '" + mod + "' used", IN->getLine());
        }
    }

private:
    llvm::StringSet<> denylist_;
};

} // anonymous namespace

PYREVIEW_DEFINE_RULE_ENTRY(DEPR001_DeprecatedImport)

} // namespace pyreview
