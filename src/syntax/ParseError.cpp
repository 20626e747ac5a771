#include "pyreview/syntax/ParseError.h"

namespace pyreview {

char ParseError::ID = 0;

void ParseError::log(llvm::raw_ostream &OS) const {
    OS << "line " << line_ << ":" << column_ << ": " << message_;
}

std::error_code ParseError::convertToErrorCode() const {
    return llvm::inconvertibleErrorCode();
}

} // namespace pyreview
