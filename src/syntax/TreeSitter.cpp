#include "pyreview/syntax/TreeSitter.h"

namespace pyreview::ts {

llvm::SmallVector<TSNode, 8> children(TSNode N) {
    llvm::SmallVector<TSNode, 8> out;
    Cursor C(N);
    if (!ts_tree_cursor_goto_first_child(C.get()))
        return out;
    do {
        out.push_back(C.node());
    } while (ts_tree_cursor_goto_next_sibling(C.get()));
    return out;
}

llvm::SmallVector<TSNode, 8> namedChildren(TSNode N) {
    llvm::SmallVector<TSNode, 8> out;
    Cursor C(N);
    if (!ts_tree_cursor_goto_first_child(C.get()))
        return out;
    do {
        TSNode child = C.node();
        if (ts_node_is_named(child) && type(child) != "comment")
            out.push_back(child);
    } while (ts_tree_cursor_goto_next_sibling(C.get()));
    return out;
}

TSNode childOfType(TSNode N, llvm::StringRef T) {
    for (TSNode child : namedChildren(N)) {
        if (type(child) == T)
            return child;
    }
    return TSNode{};
}

bool hasChild(TSNode N, llvm::StringRef T) {
    for (TSNode child : children(N)) {
        if (type(child) == T)
            return true;
    }
    return false;
}

bool isIndentedBlock(TSNode block) {
    auto stmts = namedChildren(block);
    if (stmts.empty())
        return true;

    TSNode opener = ts_node_prev_sibling(block);
    while (!ts_node_is_null(opener) && type(opener) == "comment")
        opener = ts_node_prev_sibling(opener);
    if (ts_node_is_null(opener))
        return true;

    return ts_node_start_point(stmts.front()).row >
           ts_node_end_point(opener).row;
}

} // namespace pyreview::ts
