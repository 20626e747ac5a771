#include "pyreview/analysis/TreeWalker.h"
#include "pyreview/syntax/SyntaxTree.h"

namespace pyreview {

void TreeWalker::walk(const SyntaxTree &tree) const {
    if (rules_.empty())
        return;
    visit(tree.root(), 0);
}

void TreeWalker::visit(const Node &node, unsigned nestingDepth) const {
    unsigned depth = node.isBranch() ? nestingDepth + 1 : nestingDepth;

    VisitContext ctx;
    ctx.nestingDepth = depth;
    for (auto *rule : rules_)
        rule->visitNode(node, ctx);

    for (const auto &child : node.children())
        visit(*child, depth);
}

std::vector<Diagnostic> TreeWalker::run(Rule &rule, const SyntaxTree &tree) {
    TreeWalker walker;
    walker.addRule(rule);
    walker.walk(tree);
    return rule.takeDiagnostics();
}

} // namespace pyreview
