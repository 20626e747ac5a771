#pragma once

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>

#include <string>
#include <vector>

namespace pyreview {

bool isPythonSource(llvm::StringRef path);

// Resolves the user-supplied root to the Python files to analyze.
// A file root yields itself when it has a .py extension, nothing otherwise.
// A directory root is walked recursively without following directory
// symlinks. The result is sorted lexicographically. A missing root is an
// error.
llvm::Expected<std::vector<std::string>> collectSourceFiles(llvm::StringRef root);

} // namespace pyreview
