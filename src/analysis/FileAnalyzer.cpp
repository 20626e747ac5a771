#include "pyreview/analysis/FileAnalyzer.h"
#include "pyreview/analysis/TreeWalker.h"
#include "pyreview/syntax/ParseError.h"
#include "pyreview/syntax/Parser.h"
#include "pyreview/syntax/SourceText.h"

#include <llvm/Support/MemoryBuffer.h>

#include <iterator>

namespace pyreview {

void FileResult::printMessages(llvm::raw_ostream &OS) const {
    for (const auto &line : messages)
        OS << line << "\n";
}

FileResult FileAnalyzer::analyzeFile(const std::string &filePath) const {
    auto bufOrErr = llvm::MemoryBuffer::getFile(filePath, /*IsText=*/true);
    if (!bufOrErr) {
        FileResult result;
        result.messages.push_back("pyreview: warning: cannot read '" + filePath +
                                  "': " + bufOrErr.getError().message() +
                                  ", skipping");
        return result;
    }
    return analyzeText(filePath, bufOrErr.get()->getBuffer());
}

FileResult FileAnalyzer::analyzeText(const std::string &filePath,
                                     llvm::StringRef text) const {
    FileResult result;
    auto rules = registry_.instantiate(filePath, config_);

    SourceText source{filePath, text};
    for (auto &rule : rules) {
        if (!rule->requiresTree())
            rule->checkSource(source);
    }

    auto tree = parse(text);
    if (tree) {
        TreeWalker walker;
        for (auto &rule : rules) {
            if (rule->requiresTree())
                walker.addRule(*rule);
        }
        walker.walk(*tree);
    } else {
        // Tree rules are skipped for this file; no diagnostic records it.
        llvm::handleAllErrors(
            tree.takeError(),
            [&](const ParseError &PE) {
                if (config_.verbose)
                    result.messages.push_back(
                        "pyreview: note: skipping tree rules for '" + filePath +
                        "': " + PE.message());
            },
            [&](const llvm::ErrorInfoBase &EIB) {
                result.messages.push_back("pyreview: warning: '" + filePath +
                                          "': " + EIB.message());
            });
    }

    for (auto &rule : rules) {
        auto diags = rule->takeDiagnostics();
        result.diagnostics.insert(result.diagnostics.end(),
                                  std::make_move_iterator(diags.begin()),
                                  std::make_move_iterator(diags.end()));
    }
    return result;
}

std::vector<Diagnostic> FileAnalyzer::analyze(const std::string &filePath) const {
    FileResult result = analyzeFile(filePath);
    result.printMessages(llvm::errs());
    return std::move(result.diagnostics);
}

std::vector<Diagnostic> FileAnalyzer::analyzeSource(const std::string &filePath,
                                                    llvm::StringRef text) const {
    FileResult result = analyzeText(filePath, text);
    result.printMessages(llvm::errs());
    return std::move(result.diagnostics);
}

} // namespace pyreview
