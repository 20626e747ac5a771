#pragma once

#include "pyreview/core/Config.h"
#include "pyreview/core/Diagnostic.h"
#include "pyreview/core/RuleRegistry.h"

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/raw_ostream.h>

#include <string>
#include <vector>

namespace pyreview {

// What one file produced. Log lines travel with the result so that only
// the thread collecting results writes to stderr.
struct FileResult {
    std::vector<Diagnostic>  diagnostics;
    std::vector<std::string> messages; // complete "pyreview: ..." lines

    void printMessages(llvm::raw_ostream &OS) const;
};

// Runs every registered rule over one file. Never fails: an unreadable file
// yields no Diagnostics, and a file that does not parse yields only the
// results of rules that need no tree.
class FileAnalyzer {
public:
    explicit FileAnalyzer(const Config &cfg,
                          const RuleRegistry &registry = RuleRegistry::builtin())
        : config_(cfg), registry_(registry) {}

    // Safe to call from worker threads; writes nothing.
    FileResult analyzeFile(const std::string &filePath) const;
    FileResult analyzeText(const std::string &filePath,
                           llvm::StringRef text) const;

    // analyzeFile() / analyzeText() with the messages printed to stderr.
    std::vector<Diagnostic> analyze(const std::string &filePath) const;
    std::vector<Diagnostic> analyzeSource(const std::string &filePath,
                                          llvm::StringRef text) const;

private:
    const Config &config_;
    const RuleRegistry &registry_;
};

} // namespace pyreview
