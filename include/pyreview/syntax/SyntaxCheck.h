#pragma once

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>

#include <tree_sitter/api.h>

namespace pyreview {

// Returns a ParseError for the first construct, in source order, that
// CPython's parser rejects. That covers tree-sitter's ERROR and MISSING
// nodes and the forms tree-sitter-python accepts for compatibility or
// recovery: Python 2 statements and operators, misordered parameters and
// call arguments, illegal assignment and deletion targets, malformed
// numeric literals, empty suites and inconsistent indentation.
//
// The walk is iterative, so arbitrarily deep trees are safe.
llvm::Error checkSyntax(TSNode root, llvm::StringRef source);

} // namespace pyreview
