#pragma once

#include <llvm/ADT/SmallVector.h>
#include <llvm/ADT/StringRef.h>

#include <tree_sitter/api.h>

#include <memory>

extern "C" {
const TSLanguage *tree_sitter_python(void);
}

namespace pyreview::ts {

struct ParserDeleter {
    void operator()(TSParser *P) const { ts_parser_delete(P); }
};
struct TreeDeleter {
    void operator()(TSTree *T) const { ts_tree_delete(T); }
};

using ParserPtr = std::unique_ptr<TSParser, ParserDeleter>;
using TreePtr   = std::unique_ptr<TSTree, TreeDeleter>;

// Cursor owned for the duration of a scope.
class Cursor {
public:
    explicit Cursor(TSNode N) : C_(ts_tree_cursor_new(N)) {}
    ~Cursor() { ts_tree_cursor_delete(&C_); }

    Cursor(const Cursor &) = delete;
    Cursor &operator=(const Cursor &) = delete;

    TSTreeCursor *get() { return &C_; }
    TSNode node() const { return ts_tree_cursor_current_node(&C_); }

private:
    TSTreeCursor C_;
};

inline llvm::StringRef type(TSNode N) { return ts_node_type(N); }

inline bool is(TSNode N, llvm::StringRef T) {
    return !ts_node_is_null(N) && type(N) == T;
}

// 1-based line and column of the first byte of N.
inline unsigned line(TSNode N) { return ts_node_start_point(N).row + 1; }
inline unsigned column(TSNode N) { return ts_node_start_point(N).column + 1; }

// 1-based line of the last byte of N.
inline unsigned endLine(TSNode N) {
    TSPoint start = ts_node_start_point(N);
    TSPoint end   = ts_node_end_point(N);
    if (end.column == 0 && end.row > start.row)
        return end.row;
    return end.row + 1;
}

inline llvm::StringRef text(TSNode N, llvm::StringRef source) {
    return source.slice(ts_node_start_byte(N), ts_node_end_byte(N));
}

inline TSNode field(TSNode N, llvm::StringRef name) {
    return ts_node_child_by_field_name(N, name.data(),
                                       static_cast<uint32_t>(name.size()));
}

// All children, anonymous tokens included.
llvm::SmallVector<TSNode, 8> children(TSNode N);

// Named children without comments.
llvm::SmallVector<TSNode, 8> namedChildren(TSNode N);

// First named child of type T, or a null node.
TSNode childOfType(TSNode N, llvm::StringRef T);

// True when N has a direct child, named or not, of type T.
bool hasChild(TSNode N, llvm::StringRef T);

// True when `block`'s statements start on a line after the `:` that opens
// it, so the block adds one indentation level.
bool isIndentedBlock(TSNode block);

} // namespace pyreview::ts
