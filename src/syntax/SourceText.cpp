#include "pyreview/syntax/SourceText.h"

namespace pyreview {

unsigned SourceText::lineCount() const {
    return countLines(text);
}

unsigned countLines(llvm::StringRef text) {
    unsigned lines = 0;
    size_t i = 0;
    while (i < text.size()) {
        char c = text[i++];
        if (c == '\n') {
            ++lines;
        } else if (c == '\r') {
            if (i < text.size() && text[i] == '\n')
                ++i;
            ++lines;
        }
    }
    if (!text.empty() && text.back() != '\n' && text.back() != '\r')
        ++lines;
    return lines;
}

} // namespace pyreview
