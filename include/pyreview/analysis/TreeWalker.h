#pragma once

#include "pyreview/core/Diagnostic.h"
#include "pyreview/core/Rule.h"

#include <vector>

namespace pyreview {

class Node;
class SyntaxTree;

// Single pre-order traversal shared by every tree rule. Nesting depth is
// threaded through the recursion as a parameter; rules see it read-only in
// their VisitContext.
class TreeWalker {
public:
    void addRule(Rule &rule) { rules_.push_back(&rule); }

    void walk(const SyntaxTree &tree) const;

    // Runs one rule alone over `tree` and returns what it reported.
    static std::vector<Diagnostic> run(Rule &rule, const SyntaxTree &tree);

private:
    void visit(const Node &node, unsigned nestingDepth) const;

    std::vector<Rule *> rules_;
};

} // namespace pyreview
