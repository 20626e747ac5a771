#pragma once

#include <llvm/ADT/StringRef.h>

#include <string>

namespace pyreview {

// Raw contents of one file, before (and independent of) parsing.
struct SourceText {
    std::string     path;
    llvm::StringRef text;

    unsigned lineCount() const;
};

// Lines as a text-mode reader sees them: "\n", "\r\n" and "\r" each end a
// line, and a final unterminated line still counts.
unsigned countLines(llvm::StringRef text);

} // namespace pyreview
