#include "pyreview/syntax/SyntaxCheck.h"
#include "pyreview/syntax/ParseError.h"
#include "pyreview/syntax/TreeSitter.h"

#include <llvm/ADT/SmallVector.h>
#include <llvm/ADT/StringExtras.h>
#include <llvm/ADT/StringSwitch.h>

#include <optional>
#include <string>

namespace pyreview {

namespace {

struct Violation {
    std::string message;
    TSNode      at;
};

using Result = std::optional<Violation>;

Result violation(std::string message, TSNode at) {
    return Violation{std::move(message), at};
}

bool isDigitIn(char c, unsigned base) {
    switch (base) {
        case 2:  return c == '0' || c == '1';
        case 8:  return c >= '0' && c <= '7';
        case 16: return llvm::isHexDigit(c);
        default: return llvm::isDigit(c);
    }
}

// tree-sitter lexes `1_`, `1L` and `0777` as numbers; CPython does not.
Result checkNumber(TSNode N, llvm::StringRef source) {
    llvm::StringRef lit = ts::text(N, source);
    bool isFloat = ts::type(N) == "float";

    unsigned base  = 10;
    size_t   start = 0;
    if (!isFloat && lit.size() > 1 && lit[0] == '0') {
        switch (lit[1]) {
            case 'x': case 'X': base = 16; start = 2; break;
            case 'o': case 'O': base = 8;  start = 2; break;
            case 'b': case 'B': base = 2;  start = 2; break;
            default: break;
        }
    }

    std::string invalid = base == 16  ? "invalid hexadecimal literal"
                          : base == 8 ? "invalid octal literal"
                          : base == 2 ? "invalid binary literal"
                                      : "invalid decimal literal";

    if (lit.endswith("l") || lit.endswith("L"))
        return violation(invalid, N);

    bool imaginary = base == 10 && (lit.endswith("j") || lit.endswith("J"));
    llvm::StringRef body = lit.drop_front(start);
    if (imaginary)
        body = body.drop_back();

    // An underscore sits between two digits, or right after the base prefix.
    for (size_t i = 0; i < body.size(); ++i) {
        if (body[i] != '_')
            continue;
        bool before = i == 0 ? start != 0 : isDigitIn(body[i - 1], base);
        bool after  = i + 1 < body.size() && isDigitIn(body[i + 1], base);
        if (!before || !after)
            return violation(invalid, N);
    }

    if (base == 10 && !isFloat && !imaginary && body.size() > 1 &&
        body[0] == '0' && body.find_first_not_of("0_") != llvm::StringRef::npos)
        return violation("leading zeros in decimal integer literals are not "
                         "permitted; use an 0o prefix for octal integers",
                         N);
    return std::nullopt;
}

Result checkParameters(TSNode params) {
    bool isLambda       = ts::type(params) == "lambda_parameters";
    bool sawSlash       = false;
    bool sawStar        = false;
    bool bareStar       = false;
    bool namedAfterStar = false;
    bool sawVarKeyword  = false;
    bool sawDefault     = false;
    unsigned positional = 0;

    for (TSNode p : ts::namedChildren(params)) {
        if (sawVarKeyword)
            return violation("arguments cannot follow var-keyword argument", p);

        llvm::StringRef kind = ts::type(p);
        // `*args: T` and `**kw: T` wrap the splat pattern.
        llvm::StringRef head = kind;
        if (kind == "typed_parameter") {
            auto inner = ts::namedChildren(p);
            if (!inner.empty())
                head = ts::type(inner.front());
        }

        if (kind == "positional_separator") {
            if (sawSlash)
                return violation("/ may appear only once", p);
            if (sawStar)
                return violation("/ must be ahead of *", p);
            if (positional == 0)
                return violation("at least one argument must precede /", p);
            sawSlash = true;
        } else if (kind == "keyword_separator" || head == "list_splat_pattern") {
            if (sawStar)
                return violation("* argument may appear only once", p);
            sawStar  = true;
            bareStar = kind == "keyword_separator";
        } else if (head == "dictionary_splat_pattern") {
            if (bareStar && !namedAfterStar)
                return violation("named arguments must follow bare *", p);
            sawVarKeyword = true;
        } else if (head == "tuple_pattern" ||
                   ts::is(ts::field(p, "name"), "tuple_pattern")) {
            return violation(isLambda
                                 ? "Lambda expression parameters cannot be parenthesized"
                                 : "Function parameters cannot be parenthesized",
                             p);
        } else if (sawStar) {
            namedAfterStar = true;
        } else {
            bool hasDefault = kind == "default_parameter" ||
                              kind == "typed_default_parameter";
            if (hasDefault)
                sawDefault = true;
            else if (sawDefault)
                return violation("non-default argument follows default argument", p);
            ++positional;
        }
    }

    if (bareStar && !namedAfterStar)
        return violation("named arguments must follow bare *", params);
    return std::nullopt;
}

Result checkArguments(TSNode args) {
    bool sawKeyword  = false;
    bool sawKwUnpack = false;
    for (TSNode a : ts::namedChildren(args)) {
        llvm::StringRef kind = ts::type(a);
        if (kind == "keyword_argument") {
            sawKeyword = true;
        } else if (kind == "dictionary_splat") {
            sawKwUnpack = true;
        } else if (kind == "list_splat" || kind == "parenthesized_list_splat") {
            if (sawKwUnpack)
                return violation("iterable argument unpacking follows keyword "
                                 "argument unpacking",
                                 a);
        } else if (sawKwUnpack) {
            return violation("positional argument follows keyword argument unpacking", a);
        } else if (sawKeyword) {
            return violation("positional argument follows keyword argument", a);
        }
    }
    return std::nullopt;
}

bool isTargetContainer(llvm::StringRef kind) {
    return llvm::StringSwitch<bool>(kind)
        .Cases("pattern_list", "tuple_pattern", "list_pattern", "expression_list", true)
        .Cases("tuple", "list", "parenthesized_expression", true)
        .Cases("list_splat_pattern", "list_splat", "as_pattern_target", true)
        .Default(false);
}

// What CPython calls an expression that cannot be bound or deleted, or an
// empty string for a valid target.
llvm::StringRef illegalTargetKind(llvm::StringRef kind) {
    return llvm::StringSwitch<llvm::StringRef>(kind)
        .Case("call", "function call")
        .Case("none", "None")
        .Case("true", "True")
        .Case("false", "False")
        .Cases("integer", "float", "string", "concatenated_string", "ellipsis", "literal")
        .Case("lambda", "lambda")
        .Case("comparison_operator", "comparison")
        .Case("named_expression", "named expression")
        .Cases("binary_operator", "unary_operator", "boolean_operator", "expression")
        .Cases("not_operator", "conditional_expression", "await", "expression")
        .Default("");
}

// `verb` is "assign to" or "delete".
Result checkTarget(TSNode target, llvm::StringRef verb) {
    llvm::SmallVector<TSNode, 8> pending{target};
    while (!pending.empty()) {
        TSNode N = pending.pop_back_val();
        llvm::StringRef kind = ts::type(N);
        if (kind == "as_pattern_target" && !ts_node_is_null(ts::field(N, "arguments")))
            return violation(("cannot " + verb + " function call").str(), N);
        if (isTargetContainer(kind)) {
            for (TSNode child : ts::namedChildren(N))
                pending.push_back(child);
            continue;
        }
        llvm::StringRef what = illegalTargetKind(kind);
        if (!what.empty())
            return violation(("cannot " + verb + " " + what).str(), N);
    }
    return std::nullopt;
}

Result checkAugmentedTarget(TSNode target) {
    llvm::StringRef what =
        llvm::StringSwitch<llvm::StringRef>(ts::type(target))
            .Cases("pattern_list", "tuple_pattern", "tuple", "expression_list", "tuple")
            .Cases("list_pattern", "list", "list")
            .Cases("list_splat_pattern", "list_splat", "starred")
            .Default("");
    if (!what.empty())
        return violation(("'" + what + "' is an illegal expression for augmented assignment").str(),
                         target);
    return checkTarget(target, "assign to");
}

// Statements of a suite share one indentation column; a suite is never
// empty. Statements continuing a line (after `;` or inside a one-line
// body) are exempt.
Result checkSuite(TSNode suite) {
    bool isModule = ts::type(suite) == "module";
    auto stmts = ts::namedChildren(suite);
    if (stmts.empty()) {
        if (isModule)
            return std::nullopt;
        return violation("expected an indented block", suite);
    }
    if (!isModule && !ts::isIndentedBlock(suite))
        return std::nullopt;

    uint32_t expected = isModule ? 0 : ts_node_start_point(stmts.front()).column;
    for (size_t i = 0; i < stmts.size(); ++i) {
        TSPoint at = ts_node_start_point(stmts[i]);
        if (i > 0 && at.row <= ts_node_end_point(stmts[i - 1]).row)
            continue;
        if (at.column > expected)
            return violation("unexpected indent", stmts[i]);
        if (at.column < expected)
            return violation("unindent does not match any outer indentation level",
                             stmts[i]);
    }
    return std::nullopt;
}

Result checkNode(TSNode N, llvm::StringRef source) {
    if (ts_node_is_missing(N))
        return violation(("expected '" + ts::type(N) + "'").str(), N);

    llvm::StringRef kind = ts::type(N);
    if (kind == "ERROR")
        return violation("invalid syntax", N);

    if (kind == "module" || kind == "block")
        return checkSuite(N);
    if (kind == "integer" || kind == "float")
        return checkNumber(N, source);
    if (kind == "parameters" || kind == "lambda_parameters")
        return checkParameters(N);
    if (kind == "argument_list")
        return checkArguments(N);

    if (kind == "print_statement" || kind == "exec_statement") {
        llvm::StringRef name = kind.take_until([](char c) { return c == '_'; });
        return violation(("Missing parentheses in call to '" + name +
                          "'. Did you mean " + name + "(...)?")
                             .str(),
                         N);
    }

    if (kind == "comparison_operator" && ts::hasChild(N, "<>"))
        return violation("invalid syntax", N);

    if (kind == "list_splat" || kind == "dictionary_splat") {
        llvm::StringRef parent = ts::type(ts_node_parent(N));
        if (parent == "binary_operator" || parent == "unary_operator" ||
            parent == "boolean_operator" || parent == "comparison_operator" ||
            parent == "not_operator")
            return violation("invalid syntax", N);
    }

    if (kind == "raise_statement" &&
        !ts_node_is_null(ts::childOfType(N, "expression_list")))
        return violation("invalid syntax", N);

    if (kind == "except_clause" &&
        (ts::hasChild(N, ",") || ts::is(ts::field(N, "value"), "expression_list")))
        return violation("multiple exception types must be parenthesized", N);

    if (kind == "expression_statement" &&
        !ts_node_is_null(ts::childOfType(N, "named_expression")))
        return violation("invalid syntax", N);

    if (kind == "assignment") {
        TSNode right = ts::field(N, "right");
        if (ts::is(right, "augmented_assignment") || ts::is(right, "named_expression"))
            return violation("invalid syntax", right);
        TSNode left = ts::field(N, "left");
        if (!ts_node_is_null(left))
            return checkTarget(left, "assign to");
        return std::nullopt;
    }

    if (kind == "augmented_assignment") {
        TSNode left = ts::field(N, "left");
        if (!ts_node_is_null(left))
            return checkAugmentedTarget(left);
        return std::nullopt;
    }

    if (kind == "for_statement") {
        TSNode left = ts::field(N, "left");
        if (!ts_node_is_null(left))
            return checkTarget(left, "assign to");
        return std::nullopt;
    }

    if (kind == "as_pattern" && ts::is(ts_node_parent(N), "with_item")) {
        TSNode alias = ts::field(N, "alias");
        if (!ts_node_is_null(alias))
            return checkTarget(alias, "assign to");
        return std::nullopt;
    }

    if (kind == "delete_statement") {
        for (TSNode target : ts::namedChildren(N)) {
            if (Result r = checkTarget(target, "delete"))
                return r;
        }
    }

    return std::nullopt;
}

} // anonymous namespace

llvm::Error checkSyntax(TSNode root, llvm::StringRef source) {
    ts::Cursor C(root);
    while (true) {
        if (Result v = checkNode(C.node(), source))
            return llvm::make_error<ParseError>(std::move(v->message),
                                                ts::line(v->at),
                                                ts::column(v->at));

        if (ts_tree_cursor_goto_first_child(C.get()))
            continue;
        while (!ts_tree_cursor_goto_next_sibling(C.get())) {
            if (!ts_tree_cursor_goto_parent(C.get()))
                return llvm::Error::success();
        }
    }
}

} // namespace pyreview
