#pragma once

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Casting.h>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace pyreview {

enum class NodeKind : uint8_t {
    Module,

    // Compound statements
    FunctionDef,
    AsyncFunctionDef,
    ClassDef,
    If,
    For,
    AsyncFor,
    While,
    With,
    AsyncWith,
    Try,
    ExceptHandler,
    Match,
    MatchCase,

    // Simple statements
    Import,
    ImportFrom,
    Return,
    Raise,
    Pass,
    Break,
    Continue,
    Delete,
    Assert,
    Global,
    Nonlocal,
    TypeAlias,
    Expression,
};

std::string_view nodeKindName(NodeKind kind);

class Node {
public:
    Node(NodeKind kind, unsigned line)
        : kind_(kind), line_(line), endLine_(line) {}
    virtual ~Node() = default;

    Node(const Node &) = delete;
    Node &operator=(const Node &) = delete;

    NodeKind getKind() const { return kind_; }
    unsigned getLine() const { return line_; }
    unsigned getEndLine() const { return endLine_; }
    void setEndLine(unsigned line) { endLine_ = line < line_ ? line_ : line; }

    // Children in source order: body first, then orelse/handlers/finally.
    const std::vector<std::unique_ptr<Node>> &children() const {
        return children_;
    }
    Node &addChild(std::unique_ptr<Node> child) {
        children_.push_back(std::move(child));
        return *children_.back();
    }

    // If/For/While: the constructs that count toward nesting depth.
    bool isBranch() const {
        return kind_ == NodeKind::If || kind_ == NodeKind::For ||
               kind_ == NodeKind::While;
    }

private:
    NodeKind kind_;
    unsigned line_;
    unsigned endLine_;
    std::vector<std::unique_ptr<Node>> children_;
};

enum class ParamKind : uint8_t {
    PositionalOnly,
    PositionalOrKeyword,
    VarPositional,
    KeywordOnly,
    VarKeyword,
};

struct Parameter {
    std::string name;
    ParamKind   kind = ParamKind::PositionalOrKeyword;
};

class FunctionDefNode : public Node {
public:
    FunctionDefNode(bool isAsync, unsigned line, std::string name,
                    std::vector<Parameter> params)
        : Node(isAsync ? NodeKind::AsyncFunctionDef : NodeKind::FunctionDef,
               line),
          name_(std::move(name)), params_(std::move(params)) {}

    const std::string &getName() const { return name_; }
    const std::vector<Parameter> &parameters() const { return params_; }
    bool isAsync() const { return getKind() == NodeKind::AsyncFunctionDef; }

    unsigned countParameters(ParamKind kind) const;

    static bool classof(const Node *N) {
        return N->getKind() == NodeKind::FunctionDef ||
               N->getKind() == NodeKind::AsyncFunctionDef;
    }

private:
    std::string name_;
    std::vector<Parameter> params_;
};

class ClassDefNode : public Node {
public:
    ClassDefNode(unsigned line, std::string name)
        : Node(NodeKind::ClassDef, line), name_(std::move(name)) {}

    const std::string &getName() const { return name_; }

    static bool classof(const Node *N) {
        return N->getKind() == NodeKind::ClassDef;
    }

private:
    std::string name_;
};

struct ImportedName {
    std::string name;   // dotted for `import a.b`, bare for from-imports
    std::string asName; // empty when not aliased
};

// `import a.b as c, d` and `from ..pkg import x as y`.
class ImportNode : public Node {
public:
    // Plain import.
    ImportNode(unsigned line, std::vector<ImportedName> names)
        : Node(NodeKind::Import, line), names_(std::move(names)) {}

    // From-import. `module` is empty for `from . import x`.
    ImportNode(unsigned line, std::string module, unsigned level,
               std::vector<ImportedName> names)
        : Node(NodeKind::ImportFrom, line), module_(std::move(module)),
          level_(level), names_(std::move(names)) {}

    bool isFromImport() const { return getKind() == NodeKind::ImportFrom; }
    const std::string &getModule() const { return module_; }
    unsigned getLevel() const { return level_; }
    const std::vector<ImportedName> &names() const { return names_; }

    // Modules this statement imports: each alias for a plain import, the
    // source module for a from-import.
    std::vector<std::string> moduleNames() const;

    static bool classof(const Node *N) {
        return N->getKind() == NodeKind::Import ||
               N->getKind() == NodeKind::ImportFrom;
    }

private:
    std::string module_;
    unsigned level_ = 0;
    std::vector<ImportedName> names_;
};

// Owns the tree for one parsed file. Movable, not copyable.
class SyntaxTree {
public:
    explicit SyntaxTree(std::unique_ptr<Node> root) : root_(std::move(root)) {}

    SyntaxTree(SyntaxTree &&) = default;
    SyntaxTree &operator=(SyntaxTree &&) = default;

    const Node &root() const { return *root_; }

    // Debug dump, one node per line, indented by depth.
    std::string dump() const;

private:
    std::unique_ptr<Node> root_;
};

} // namespace pyreview
