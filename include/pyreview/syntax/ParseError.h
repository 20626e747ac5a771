#pragma once

#include <llvm/Support/Error.h>
#include <llvm/Support/raw_ostream.h>

#include <string>
#include <system_error>

namespace pyreview {

// Malformed source. Carries the position of the first offending token.
class ParseError : public llvm::ErrorInfo<ParseError> {
public:
    static char ID;

    ParseError(std::string message, unsigned line, unsigned column)
        : message_(std::move(message)), line_(line), column_(column) {}

    void log(llvm::raw_ostream &OS) const override;
    std::error_code convertToErrorCode() const override;

    const std::string &getMessage() const { return message_; }
    unsigned getLine() const { return line_; }
    unsigned getColumn() const { return column_; }

private:
    std::string message_;
    unsigned line_;
    unsigned column_;
};

} // namespace pyreview
