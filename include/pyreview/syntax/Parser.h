#pragma once

#include "pyreview/syntax/SyntaxTree.h"
#include "pyreview/syntax/TreeSitter.h"

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>

#include <memory>
#include <string>
#include <vector>

namespace pyreview {

// Parses Python 3 source into a SyntaxTree, or fails with ParseError.
// Never returns a partial tree.
llvm::Expected<SyntaxTree> parse(llvm::StringRef source);

// Wraps a tree-sitter parser loaded with the Python grammar. The concrete
// tree is validated with checkSyntax(), then lowered to statement-level
// Nodes; expressions are not kept, since no rule looks inside them.
class Parser {
public:
    Parser();

    llvm::Expected<SyntaxTree> parseModule(llvm::StringRef source);

    // CPython refuses a 100th level of indentation.
    static constexpr unsigned kMaxIndentDepth = 99;

private:
    bool buildSuite(Node &owner, TSNode suite, unsigned indentDepth);
    bool buildStatement(Node &parent, TSNode stmt, unsigned indentDepth);
    bool buildClauses(Node &node, TSNode stmt, unsigned indentDepth);
    bool buildIf(Node &parent, TSNode stmt, unsigned indentDepth);
    bool buildFunction(Node &parent, TSNode fn, unsigned indentDepth);
    bool buildClass(Node &parent, TSNode cls, unsigned indentDepth);
    void buildImport(Node &parent, TSNode stmt);

    std::vector<Parameter> collectParameters(TSNode params) const;
    std::string parameterName(TSNode param) const;
    std::string dottedName(TSNode name) const;
    ImportedName importedName(TSNode item) const;

    llvm::StringRef text(TSNode N) const { return ts::text(N, source_); }
    bool fail(std::string message, TSNode at);

    ts::ParserPtr parser_;
    llvm::StringRef source_;

    bool failed_ = false;
    std::string errMessage_;
    unsigned errLine_   = 0;
    unsigned errColumn_ = 0;
};

} // namespace pyreview
