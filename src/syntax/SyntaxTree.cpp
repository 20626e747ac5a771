#include "pyreview/syntax/SyntaxTree.h"

#include <llvm/Support/raw_ostream.h>

#include <algorithm>

namespace pyreview {

std::string_view nodeKindName(NodeKind kind) {
    switch (kind) {
        case NodeKind::Module:           return "Module";
        case NodeKind::FunctionDef:      return "FunctionDef";
        case NodeKind::AsyncFunctionDef: return "AsyncFunctionDef";
        case NodeKind::ClassDef:         return "ClassDef";
        case NodeKind::If:               return "If";
        case NodeKind::For:              return "For";
        case NodeKind::AsyncFor:         return "AsyncFor";
        case NodeKind::While:            return "While";
        case NodeKind::With:             return "With";
        case NodeKind::AsyncWith:        return "AsyncWith";
        case NodeKind::Try:              return "Try";
        case NodeKind::ExceptHandler:    return "ExceptHandler";
        case NodeKind::Match:            return "Match";
        case NodeKind::MatchCase:        return "MatchCase";
        case NodeKind::Import:           return "Import";
        case NodeKind::ImportFrom:       return "ImportFrom";
        case NodeKind::Return:           return "Return";
        case NodeKind::Raise:            return "Raise";
        case NodeKind::Pass:             return "Pass";
        case NodeKind::Break:            return "Break";
        case NodeKind::Continue:         return "Continue";
        case NodeKind::Delete:           return "Delete";
        case NodeKind::Assert:           return "Assert";
        case NodeKind::Global:           return "Global";
        case NodeKind::Nonlocal:         return "Nonlocal";
        case NodeKind::TypeAlias:        return "TypeAlias";
        case NodeKind::Expression:       return "Expression";
    }
    return "Unknown";
}

unsigned FunctionDefNode::countParameters(ParamKind kind) const {
    return static_cast<unsigned>(
        std::count_if(params_.begin(), params_.end(),
                      [kind](const Parameter &p) { return p.kind == kind; }));
}

std::vector<std::string> ImportNode::moduleNames() const {
    std::vector<std::string> out;
    if (isFromImport()) {
        if (!module_.empty())
            out.push_back(module_);
        return out;
    }
    for (const auto &n : names_)
        out.push_back(n.name);
    return out;
}

namespace {

void dumpNode(const Node &node, unsigned depth, llvm::raw_ostream &os) {
    os.indent(depth * 2) << nodeKindName(node.getKind()) << " "
                         << node.getLine() << "-" << node.getEndLine();
    if (const auto *FD = llvm::dyn_cast<FunctionDefNode>(&node))
        os << " " << FD->getName() << "/" << FD->parameters().size();
    else if (const auto *CD = llvm::dyn_cast<ClassDefNode>(&node))
        os << " " << CD->getName();
    else if (const auto *IN = llvm::dyn_cast<ImportNode>(&node)) {
        for (const auto &m : IN->moduleNames())
            os << " " << m;
    }
    os << "\n";
    for (const auto &child : node.children())
        dumpNode(*child, depth + 1, os);
}

} // anonymous namespace

std::string SyntaxTree::dump() const {
    std::string out;
    llvm::raw_string_ostream os(out);
    dumpNode(*root_, 0, os);
    os.flush();
    return out;
}

} // namespace pyreview
