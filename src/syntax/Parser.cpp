#include "pyreview/syntax/Parser.h"
#include "pyreview/syntax/ParseError.h"
#include "pyreview/syntax/SyntaxCheck.h"

#include <llvm/ADT/SmallVector.h>
#include <llvm/ADT/StringSwitch.h>
#include <llvm/Support/ConvertUTF.h>

#include <cstdint>
#include <optional>

namespace pyreview {

namespace {

constexpr llvm::StringLiteral kUTF8BOM("\xEF\xBB\xBF");

std::optional<NodeKind> simpleStatementKind(llvm::StringRef kind) {
    return llvm::StringSwitch<std::optional<NodeKind>>(kind)
        .Case("expression_statement", NodeKind::Expression)
        .Case("return_statement", NodeKind::Return)
        .Case("raise_statement", NodeKind::Raise)
        .Case("pass_statement", NodeKind::Pass)
        .Case("break_statement", NodeKind::Break)
        .Case("continue_statement", NodeKind::Continue)
        .Case("delete_statement", NodeKind::Delete)
        .Case("assert_statement", NodeKind::Assert)
        .Case("global_statement", NodeKind::Global)
        .Case("nonlocal_statement", NodeKind::Nonlocal)
        .Case("type_alias_statement", NodeKind::TypeAlias)
        .Default(std::nullopt);
}

std::optional<NodeKind> compoundStatementKind(llvm::StringRef kind, bool isAsync) {
    if (kind == "for_statement")
        return isAsync ? NodeKind::AsyncFor : NodeKind::For;
    if (kind == "with_statement")
        return isAsync ? NodeKind::AsyncWith : NodeKind::With;
    return llvm::StringSwitch<std::optional<NodeKind>>(kind)
        .Case("while_statement", NodeKind::While)
        .Case("try_statement", NodeKind::Try)
        .Case("match_statement", NodeKind::Match)
        .Case("case_clause", NodeKind::MatchCase)
        .Default(std::nullopt);
}

// A compound statement ends where its last nested statement ends.
void closeCompound(Node &node) {
    if (!node.children().empty())
        node.setEndLine(node.children().back()->getEndLine());
}

// CPython decodes source as UTF-8 and refuses NUL bytes.
llvm::Error checkEncoding(llvm::StringRef text) {
    size_t nul = text.find('\0');
    if (nul != llvm::StringRef::npos) {
        unsigned line = 1 + static_cast<unsigned>(text.take_front(nul).count('\n'));
        return llvm::make_error<ParseError>("source code cannot contain null bytes",
                                            line, 0);
    }

    const auto *begin  = reinterpret_cast<const llvm::UTF8 *>(text.data());
    const auto *cursor = begin;
    if (llvm::isLegalUTF8String(&cursor, begin + text.size()))
        return llvm::Error::success();

    size_t offset = static_cast<size_t>(cursor - begin);
    llvm::StringRef before = text.take_front(offset);
    size_t lineStart = before.find_last_of('\n');
    unsigned line   = 1 + static_cast<unsigned>(before.count('\n'));
    unsigned column = static_cast<unsigned>(
        lineStart == llvm::StringRef::npos ? offset + 1 : offset - lineStart);
    return llvm::make_error<ParseError>("source is not valid UTF-8", line, column);
}

// Universal newlines: "\r\n" and a lone "\r" both become "\n", which keeps
// every line number unchanged.
std::string normalizeNewlines(llvm::StringRef text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '\r') {
            if (i + 1 < text.size() && text[i + 1] == '\n')
                ++i;
            out.push_back('\n');
        } else {
            out.push_back(c);
        }
    }
    return out;
}

} // anonymous namespace

llvm::Expected<SyntaxTree> parse(llvm::StringRef source) {
    Parser parser;
    return parser.parseModule(source);
}

Parser::Parser() : parser_(ts_parser_new()) {
    ts_parser_set_language(parser_.get(), tree_sitter_python());
}

llvm::Expected<SyntaxTree> Parser::parseModule(llvm::StringRef source) {
    failed_ = false;
    errMessage_.clear();

    source.consume_front(kUTF8BOM);
    if (llvm::Error err = checkEncoding(source))
        return std::move(err);

    std::string normalized;
    if (source.contains('\r')) {
        normalized = normalizeNewlines(source);
        source = normalized;
    }
    if (source.size() > UINT32_MAX)
        return llvm::make_error<ParseError>("source file is too large", 1, 0);
    source_ = source;

    ts::TreePtr tree(ts_parser_parse_string(parser_.get(), nullptr,
                                            source_.data(),
                                            static_cast<uint32_t>(source_.size())));
    if (!tree)
        return llvm::make_error<ParseError>(
            "tree-sitter could not parse the source", 1, 0);

    TSNode root = ts_tree_root_node(tree.get());
    if (llvm::Error err = checkSyntax(root, source_))
        return std::move(err);

    auto module = std::make_unique<Node>(NodeKind::Module, 1);
    if (!buildSuite(*module, root, 0))
        return llvm::make_error<ParseError>(errMessage_, errLine_, errColumn_);
    closeCompound(*module);
    return SyntaxTree(std::move(module));
}

bool Parser::fail(std::string message, TSNode at) {
    if (!failed_) {
        failed_     = true;
        errMessage_ = std::move(message);
        errLine_    = ts::line(at);
        errColumn_  = ts::column(at);
    }
    return false;
}

// `suite` is the module or a block. Nesting is counted in indented blocks,
// the way CPython's tokenizer counts INDENT tokens.
bool Parser::buildSuite(Node &owner, TSNode suite, unsigned indentDepth) {
    if (ts::is(suite, "block") && ts::isIndentedBlock(suite)) {
        if (++indentDepth > kMaxIndentDepth)
            return fail("too many levels of indentation", suite);
    }
    for (TSNode stmt : ts::namedChildren(suite)) {
        if (!buildStatement(owner, stmt, indentDepth))
            return false;
    }
    return true;
}

bool Parser::buildStatement(Node &parent, TSNode stmt, unsigned indentDepth) {
    llvm::StringRef kind = ts::type(stmt);

    if (kind == "decorated_definition") {
        TSNode def = ts::field(stmt, "definition");
        if (ts_node_is_null(def))
            return fail("invalid syntax", stmt);
        return buildStatement(parent, def, indentDepth);
    }
    if (kind == "function_definition")
        return buildFunction(parent, stmt, indentDepth);
    if (kind == "class_definition")
        return buildClass(parent, stmt, indentDepth);
    if (kind == "if_statement")
        return buildIf(parent, stmt, indentDepth);
    if (kind == "import_statement" || kind == "import_from_statement" ||
        kind == "future_import_statement") {
        buildImport(parent, stmt);
        return true;
    }

    if (auto simple = simpleStatementKind(kind)) {
        Node &node = parent.addChild(std::make_unique<Node>(*simple, ts::line(stmt)));
        node.setEndLine(ts::endLine(stmt));
        return true;
    }

    if (auto compound = compoundStatementKind(kind, ts::hasChild(stmt, "async"))) {
        Node &node = parent.addChild(std::make_unique<Node>(*compound, ts::line(stmt)));
        if (!buildClauses(node, stmt, indentDepth))
            return false;
        closeCompound(node);
        return true;
    }

    return fail("invalid syntax", stmt);
}

// Lowers the suites of one compound statement, in source order, into
// `node`: its own block, then else/finally bodies, with each except
// clause becoming an ExceptHandler.
bool Parser::buildClauses(Node &node, TSNode stmt, unsigned indentDepth) {
    for (TSNode child : ts::namedChildren(stmt)) {
        llvm::StringRef kind = ts::type(child);
        if (kind == "block") {
            if (!buildSuite(node, child, indentDepth))
                return false;
        } else if (kind == "else_clause" || kind == "finally_clause") {
            TSNode body = ts::childOfType(child, "block");
            if (!ts_node_is_null(body) && !buildSuite(node, body, indentDepth))
                return false;
        } else if (kind == "except_clause" || kind == "except_group_clause") {
            Node &handler = node.addChild(
                std::make_unique<Node>(NodeKind::ExceptHandler, ts::line(child)));
            if (!buildClauses(handler, child, indentDepth))
                return false;
            closeCompound(handler);
        }
    }
    return true;
}

// `elif` becomes an If nested as the last child of the previous branch.
// The chain is built iteratively so long elif ladders cost no stack.
bool Parser::buildIf(Node &parent, TSNode stmt, unsigned indentDepth) {
    Node &top = parent.addChild(std::make_unique<Node>(NodeKind::If, ts::line(stmt)));
    llvm::SmallVector<Node *, 4> chain{&top};

    for (TSNode child : ts::namedChildren(stmt)) {
        llvm::StringRef kind = ts::type(child);
        if (kind == "block") {
            if (!buildSuite(*chain.back(), child, indentDepth))
                return false;
        } else if (kind == "elif_clause") {
            Node &nested = chain.back()->addChild(
                std::make_unique<Node>(NodeKind::If, ts::line(child)));
            chain.push_back(&nested);
            TSNode body = ts::childOfType(child, "block");
            if (!ts_node_is_null(body) && !buildSuite(nested, body, indentDepth))
                return false;
        } else if (kind == "else_clause") {
            TSNode body = ts::childOfType(child, "block");
            if (!ts_node_is_null(body) && !buildSuite(*chain.back(), body, indentDepth))
                return false;
        }
    }

    for (auto it = chain.rbegin(); it != chain.rend(); ++it)
        closeCompound(**it);
    return true;
}

bool Parser::buildFunction(Node &parent, TSNode fn, unsigned indentDepth) {
    TSNode name = ts::field(fn, "name");
    auto node = std::make_unique<FunctionDefNode>(
        ts::hasChild(fn, "async"), ts::line(fn),
        ts_node_is_null(name) ? std::string() : text(name).str(),
        collectParameters(ts::field(fn, "parameters")));

    Node &ref = parent.addChild(std::move(node));
    if (!buildClauses(ref, fn, indentDepth))
        return false;
    closeCompound(ref);
    return true;
}

bool Parser::buildClass(Node &parent, TSNode cls, unsigned indentDepth) {
    TSNode name = ts::field(cls, "name");
    Node &ref = parent.addChild(std::make_unique<ClassDefNode>(
        ts::line(cls), ts_node_is_null(name) ? std::string() : text(name).str()));
    if (!buildClauses(ref, cls, indentDepth))
        return false;
    closeCompound(ref);
    return true;
}

std::vector<Parameter> Parser::collectParameters(TSNode params) const {
    std::vector<Parameter> out;
    if (ts_node_is_null(params))
        return out;

    ParamKind current = ParamKind::PositionalOrKeyword;
    for (TSNode p : ts::namedChildren(params)) {
        llvm::StringRef kind = ts::type(p);
        llvm::StringRef head = kind;
        if (kind == "typed_parameter") {
            auto inner = ts::namedChildren(p);
            if (!inner.empty())
                head = ts::type(inner.front());
        }

        if (kind == "positional_separator") {
            for (auto &prev : out) {
                if (prev.kind == ParamKind::PositionalOrKeyword)
                    prev.kind = ParamKind::PositionalOnly;
            }
            continue;
        }
        if (kind == "keyword_separator") {
            current = ParamKind::KeywordOnly;
            continue;
        }

        Parameter param;
        param.name = parameterName(p);
        if (head == "list_splat_pattern") {
            param.kind = ParamKind::VarPositional;
            current    = ParamKind::KeywordOnly;
        } else if (head == "dictionary_splat_pattern") {
            param.kind = ParamKind::VarKeyword;
        } else {
            param.kind = current;
        }
        out.push_back(std::move(param));
    }
    return out;
}

std::string Parser::parameterName(TSNode param) const {
    llvm::StringRef kind = ts::type(param);
    if (kind == "identifier")
        return text(param).str();
    if (kind == "default_parameter" || kind == "typed_default_parameter") {
        TSNode name = ts::field(param, "name");
        return ts_node_is_null(name) ? std::string() : text(name).str();
    }
    // typed_parameter and the splat patterns wrap the identifier.
    auto inner = ts::namedChildren(param);
    if (!inner.empty())
        return parameterName(inner.front());
    return std::string();
}

// `a . b` is legal Python; the name is rebuilt from its identifiers.
std::string Parser::dottedName(TSNode name) const {
    if (!ts::is(name, "dotted_name"))
        return text(name).str();
    std::string out;
    for (TSNode part : ts::namedChildren(name)) {
        if (!out.empty())
            out += '.';
        out += text(part).str();
    }
    return out;
}

ImportedName Parser::importedName(TSNode item) const {
    ImportedName out;
    if (ts::is(item, "aliased_import")) {
        TSNode name  = ts::field(item, "name");
        TSNode alias = ts::field(item, "alias");
        if (!ts_node_is_null(name))
            out.name = dottedName(name);
        if (!ts_node_is_null(alias))
            out.asName = text(alias).str();
        return out;
    }
    if (ts::is(item, "wildcard_import")) {
        out.name = "*";
        return out;
    }
    out.name = dottedName(item);
    return out;
}

void Parser::buildImport(Node &parent, TSNode stmt) {
    llvm::StringRef kind = ts::type(stmt);
    unsigned line = ts::line(stmt);

    if (kind == "import_statement") {
        std::vector<ImportedName> names;
        for (TSNode item : ts::namedChildren(stmt))
            names.push_back(importedName(item));
        Node &node = parent.addChild(std::make_unique<ImportNode>(line, std::move(names)));
        node.setEndLine(ts::endLine(stmt));
        return;
    }

    std::string module;
    unsigned level = 0;
    TSNode moduleNode = ts::field(stmt, "module_name");
    if (kind == "future_import_statement") {
        module = "__future__";
    } else if (ts::is(moduleNode, "relative_import")) {
        for (TSNode part : ts::namedChildren(moduleNode)) {
            if (ts::is(part, "import_prefix"))
                level = static_cast<unsigned>(text(part).count('.'));
            else if (ts::is(part, "dotted_name"))
                module = dottedName(part);
        }
    } else if (!ts_node_is_null(moduleNode)) {
        module = dottedName(moduleNode);
    }

    std::vector<ImportedName> names;
    for (TSNode item : ts::namedChildren(stmt)) {
        if (!ts_node_is_null(moduleNode) && ts_node_eq(item, moduleNode))
            continue;
        names.push_back(importedName(item));
    }

    Node &node = parent.addChild(std::make_unique<ImportNode>(
        line, std::move(module), level, std::move(names)));
    node.setEndLine(ts::endLine(stmt));
}

} // namespace pyreview
