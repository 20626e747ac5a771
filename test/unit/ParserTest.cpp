#include "pyreview/syntax/ParseError.h"
#include "pyreview/syntax/Parser.h"
#include "pyreview/syntax/SyntaxTree.h"

#include <llvm/Support/Casting.h>
#include <llvm/Support/Error.h>
#include <llvm/Support/MemoryBuffer.h>

#include <gtest/gtest.h>

#include <string>

using namespace pyreview;

namespace {

std::string dumpOf(const std::string &code) {
    auto tree = parse(code);
    if (!tree)
        return "error: " + llvm::toString(tree.takeError());
    return tree->dump();
}

std::string errorOf(const std::string &code) {
    auto tree = parse(code);
    if (tree)
        return "";
    std::string message;
    llvm::handleAllErrors(tree.takeError(), [&](const ParseError &PE) {
        message = PE.getMessage();
    });
    return message;
}

} // anonymous namespace

// --- Tree shape ---

TEST(ParserTest, FunctionDefinition) {
    EXPECT_EQ(dumpOf("def f(a, b):\n"
                     "    return a + b\n"),
              "Module 1-2\n"
              "  FunctionDef 1-2 f/2\n"
              "    Return 2-2\n");
}

TEST(ParserTest, DecoratedFunctionStartsAtDef) {
    EXPECT_EQ(dumpOf("@dec\n"
                     "@other(arg=1)\n"
                     "def f():\n"
                     "    pass\n"),
              "Module 1-4\n"
              "  FunctionDef 3-4 f/0\n"
              "    Pass 4-4\n");
}

TEST(ParserTest, EndLineIgnoresTrailingCommentsAndBlanks) {
    EXPECT_EQ(dumpOf("def f():\n"
                     "    x = 1\n"
                     "\n"
                     "    # trailing\n"
                     "\n"
                     "y = 2\n"),
              "Module 1-6\n"
              "  FunctionDef 1-2 f/0\n"
              "    Expression 2-2\n"
              "  Expression 6-6\n");
}

TEST(ParserTest, MultiLineStringExtendsEndLine) {
    EXPECT_EQ(dumpOf("def f():\n"
                     "    \"\"\"doc\n"
                     "    more\n"
                     "    \"\"\"\n"),
              "Module 1-4\n"
              "  FunctionDef 1-4 f/0\n"
              "    Expression 2-4\n");
}

TEST(ParserTest, ElifNestsInOrElse) {
    EXPECT_EQ(dumpOf("if a:\n"
                     "    pass\n"
                     "elif b:\n"
                     "    pass\n"
                     "else:\n"
                     "    pass\n"),
              "Module 1-6\n"
              "  If 1-6\n"
              "    Pass 2-2\n"
              "    If 3-6\n"
              "      Pass 4-4\n"
              "      Pass 6-6\n");
}

TEST(ParserTest, LoopsWithElse) {
    EXPECT_EQ(dumpOf("for i in range(3):\n"
                     "    pass\n"
                     "else:\n"
                     "    pass\n"
                     "while x:\n"
                     "    break\n"),
              "Module 1-6\n"
              "  For 1-4\n"
              "    Pass 2-2\n"
              "    Pass 4-4\n"
              "  While 5-6\n"
              "    Break 6-6\n");
}

TEST(ParserTest, ClassWithMethod) {
    EXPECT_EQ(dumpOf("class A(B, metaclass=M):\n"
                     "    x = 1\n"
                     "    def m(self):\n"
                     "        return 1\n"),
              "Module 1-4\n"
              "  ClassDef 1-4 A\n"
              "    Expression 2-2\n"
              "    FunctionDef 3-4 m/1\n"
              "      Return 4-4\n");
}

TEST(ParserTest, TryWithHandlersElseFinally) {
    EXPECT_EQ(dumpOf("try:\n"
                     "    pass\n"
                     "except (A, B) as e:\n"
                     "    pass\n"
                     "except C:\n"
                     "    pass\n"
                     "else:\n"
                     "    pass\n"
                     "finally:\n"
                     "    pass\n"),
              "Module 1-10\n"
              "  Try 1-10\n"
              "    Pass 2-2\n"
              "    ExceptHandler 3-4\n"
              "      Pass 4-4\n"
              "    ExceptHandler 5-6\n"
              "      Pass 6-6\n"
              "    Pass 8-8\n"
              "    Pass 10-10\n");
}

TEST(ParserTest, AsyncConstructs) {
    EXPECT_EQ(dumpOf("async def f():\n"
                     "    async for x in y:\n"
                     "        pass\n"
                     "    async with a as b:\n"
                     "        pass\n"),
              "Module 1-5\n"
              "  AsyncFunctionDef 1-5 f/0\n"
              "    AsyncFor 2-3\n"
              "      Pass 3-3\n"
              "    AsyncWith 4-5\n"
              "      Pass 5-5\n");
}

TEST(ParserTest, MatchStatement) {
    EXPECT_EQ(dumpOf("match cmd:\n"
                     "    case [a, b]:\n"
                     "        pass\n"
                     "    case _:\n"
                     "        pass\n"),
              "Module 1-5\n"
              "  Match 1-5\n"
              "    MatchCase 2-3\n"
              "      Pass 3-3\n"
              "    MatchCase 4-5\n"
              "      Pass 5-5\n");
}

TEST(ParserTest, MatchAsPlainName) {
    EXPECT_EQ(dumpOf("match = 3\n"
                     "match.group()\n"
                     "match(x)\n"),
              "Module 1-3\n"
              "  Expression 1-1\n"
              "  Expression 2-2\n"
              "  Expression 3-3\n");
}

TEST(ParserTest, OneLineCompoundBody) {
    EXPECT_EQ(dumpOf("if x: y = 1; z = 2\n"),
              "Module 1-1\n"
              "  If 1-1\n"
              "    Expression 1-1\n"
              "    Expression 1-1\n");
}

TEST(ParserTest, SimpleStatementKinds) {
    EXPECT_EQ(dumpOf("def f():\n"
                     "    global a, b\n"
                     "    nonlocal c\n"
                     "    del a\n"
                     "    assert b, 'msg'\n"
                     "    raise ValueError('x') from None\n"
                     "type Point = tuple[int, int]\n"),
              "Module 1-7\n"
              "  FunctionDef 1-6 f/0\n"
              "    Global 2-2\n"
              "    Nonlocal 3-3\n"
              "    Delete 4-4\n"
              "    Assert 5-5\n"
              "    Raise 6-6\n"
              "  TypeAlias 7-7\n");
}

TEST(ParserTest, ExpressionForms) {
    auto tree = parse("x: int = 5\n"
                      "y = [i for i in range(3) if i]\n"
                      "z = lambda a, b=1: a if b else -a\n"
                      "w = {'k': v async for v in s}\n"
                      "s = 'a' 'b' f'{c}'\n"
                      "print(*args, **kw)\n"
                      "n = (yield)\n"
                      "if (m := 3) > 2: pass\n"
                      "q = not a and b or c is not d\n"
                      "t = a[1:2, ...]\n");
    ASSERT_TRUE(static_cast<bool>(tree)) << llvm::toString(tree.takeError());
    EXPECT_EQ(tree->root().children().size(), 10u);
}

TEST(ParserTest, EmptyModule) {
    EXPECT_EQ(dumpOf(""), "Module 1-1\n");
    EXPECT_EQ(dumpOf("# only a comment\n\n"), "Module 1-1\n");
}

// --- Parameters ---

TEST(ParserTest, ParameterKinds) {
    auto tree = parse("def f(a, /, b, *args, c, d=1, **kw):\n    pass\n");
    ASSERT_TRUE(static_cast<bool>(tree)) << llvm::toString(tree.takeError());

    const auto &fn = *tree->root().children().front();
    const auto *FD = llvm::dyn_cast<FunctionDefNode>(&fn);
    ASSERT_NE(FD, nullptr);
    ASSERT_EQ(FD->parameters().size(), 6u);
    EXPECT_EQ(FD->parameters()[0].kind, ParamKind::PositionalOnly);
    EXPECT_EQ(FD->parameters()[1].kind, ParamKind::PositionalOrKeyword);
    EXPECT_EQ(FD->parameters()[2].kind, ParamKind::VarPositional);
    EXPECT_EQ(FD->parameters()[3].kind, ParamKind::KeywordOnly);
    EXPECT_EQ(FD->parameters()[4].kind, ParamKind::KeywordOnly);
    EXPECT_EQ(FD->parameters()[5].kind, ParamKind::VarKeyword);
    EXPECT_EQ(FD->countParameters(ParamKind::PositionalOrKeyword), 1u);
}

TEST(ParserTest, AnnotationsDefaultsAndLambdas) {
    auto tree = parse("def g(x: int = 3, y=lambda p, q: p, *, z: 'str' = \"a\")"
                      " -> dict[str, int]:\n"
                      "    pass\n");
    ASSERT_TRUE(static_cast<bool>(tree)) << llvm::toString(tree.takeError());

    const auto *FD =
        llvm::dyn_cast<FunctionDefNode>(tree->root().children().front().get());
    ASSERT_NE(FD, nullptr);
    ASSERT_EQ(FD->parameters().size(), 3u);
    EXPECT_EQ(FD->parameters()[0].name, "x");
    EXPECT_EQ(FD->parameters()[1].name, "y");
    EXPECT_EQ(FD->parameters()[2].name, "z");
    EXPECT_EQ(FD->parameters()[2].kind, ParamKind::KeywordOnly);
}

// --- Imports ---

TEST(ParserTest, ImportStatements) {
    auto tree = parse("import os.path, imp as i\n"
                      "from . import x\n"
                      "from ..pkg.mod import (a, b,)\n"
                      "from optparse import *\n");
    ASSERT_TRUE(static_cast<bool>(tree)) << llvm::toString(tree.takeError());

    const auto &stmts = tree->root().children();
    ASSERT_EQ(stmts.size(), 4u);

    const auto *plain = llvm::dyn_cast<ImportNode>(stmts[0].get());
    ASSERT_NE(plain, nullptr);
    EXPECT_FALSE(plain->isFromImport());
    ASSERT_EQ(plain->names().size(), 2u);
    EXPECT_EQ(plain->names()[0].name, "os.path");
    EXPECT_EQ(plain->names()[1].name, "imp");
    EXPECT_EQ(plain->names()[1].asName, "i");
    EXPECT_EQ(plain->moduleNames(), (std::vector<std::string>{"os.path", "imp"}));

    const auto *relative = llvm::dyn_cast<ImportNode>(stmts[1].get());
    ASSERT_NE(relative, nullptr);
    EXPECT_TRUE(relative->isFromImport());
    EXPECT_EQ(relative->getLevel(), 1u);
    EXPECT_TRUE(relative->getModule().empty());
    EXPECT_TRUE(relative->moduleNames().empty());

    const auto *parent = llvm::dyn_cast<ImportNode>(stmts[2].get());
    ASSERT_NE(parent, nullptr);
    EXPECT_EQ(parent->getLevel(), 2u);
    EXPECT_EQ(parent->getModule(), "pkg.mod");
    EXPECT_EQ(parent->names().size(), 2u);

    const auto *star = llvm::dyn_cast<ImportNode>(stmts[3].get());
    ASSERT_NE(star, nullptr);
    EXPECT_EQ(star->moduleNames(), (std::vector<std::string>{"optparse"}));
    EXPECT_EQ(star->getLine(), 4u);
}

// --- Lexical forms ---

TEST(ParserTest, AcceptsLexicalVariants) {
    const char *accepted[] = {
        "if x:\n\tpass\n",
        "x = 1\r\ny = 2\r\n",
        "x = 1\ry = 2\r",
        "\xef\xbb\xbfx = 1\n",
        "caf\xc3\xa9 = 1\n",
        "x = f'{a!r:>{width}}' + rb'\\d' + u'x'\n",
        "x = 0_0 + 00 + 07j + 09.5 + 0x_1f + 1e1_0 + 1_000.5\n",
        "*a, = 1,\n",
        "f(a=1, *b)\n",
        "f(**k, a=1)\n",
        "x = (1 +\n     2)\n",
        "x = 1 + \\\n    2\n",
        "s = '''a\nb'''\n",
    };
    for (const char *code : accepted)
        EXPECT_EQ(errorOf(code), "") << code;
}

TEST(ParserTest, LineEndingsDoNotShiftLines) {
    EXPECT_EQ(dumpOf("def f():\r\n    pass\r\n\r\ny = 2\r\n"),
              "Module 1-4\n"
              "  FunctionDef 1-2 f/0\n"
              "    Pass 2-2\n"
              "  Expression 4-4\n");
}

TEST(ParserTest, RejectsNullBytes) {
    EXPECT_EQ(errorOf(std::string("x = 1\0\n", 7)),
              "source code cannot contain null bytes");
}

TEST(ParserTest, RejectsInvalidUTF8) {
    auto tree = parse("x = 1\ny = 'caf\xe9'\n");
    ASSERT_FALSE(static_cast<bool>(tree));
    unsigned line = 0;
    std::string message;
    llvm::handleAllErrors(tree.takeError(), [&](const ParseError &PE) {
        line    = PE.getLine();
        message = PE.getMessage();
    });
    EXPECT_EQ(message, "source is not valid UTF-8");
    EXPECT_EQ(line, 2u);
}

// --- Errors ---

// Every entry is a SyntaxError under CPython 3.11.
TEST(ParserTest, RejectsInvalidPython) {
    const char *rejected[] = {
        // Malformed expressions.
        "x = [1, 2,, 3]\n",
        "x = a..b\n",
        "x = {1: 2, 3}\n",
        "f(**)\n",
        "x = a[]\n",
        "x = a if b\n",
        "x = a not b\n",
        "[i for i in]\n",
        "(,)\n",
        "x = a + * b\n",
        "x = \n",
        "x = 1 +\n",
        "x = a and\n",
        "x = return\n",
        "y = = 2\n",
        // Python 2 forms.
        "x <> y\n",
        "raise E, 'x'\n",
        "print \"hello\"\n",
        "exec 'code'\n",
        "try:\n    pass\nexcept ValueError, e:\n    pass\n",
        "lambda (a, b): a\n",
        "def f((a, b)):\n    pass\n",
        "x = 1L\n",
        "x = 0777\n",
        // Numeric literals.
        "x = 1__0\n",
        "x = 0b2\n",
        "x = 1_\n",
        "x = 0x_\n",
        "x = 1_.5\n",
        // Parameters and arguments.
        "def f(a=1, b): pass\n",
        "def f(**k, a): pass\n",
        "def f(*): pass\n",
        "def f(*a, *b): pass\n",
        "def f(a, /, b, /): pass\n",
        "def f(/, a):\n    pass\n",
        "def f(a b):\n    pass\n",
        "f(a=1, 2)\n",
        "f(**k, a)\n",
        "f(**k, *a)\n",
        "f(x for x in y, 1)\n",
        // Targets.
        "f() = 1\n",
        "1 = x\n",
        "None = 1\n",
        "a + b = 1\n",
        "a, b += 1\n",
        "[a] += 1\n",
        "del f()\n",
        "del 1\n",
        "x := 1\n",
        "a = b += 1\n",
        "for f() in y:\n    pass\n",
        "with a as f():\n    pass\n",
        // Layout.
        "if x\n    pass\n",
        "def f():\nreturn 1\n",
        "  x = 1\n",
        "x = 1\n    y = 2\n",
        "if x:\n        a\n    b\n",
        "else:\n    pass\n",
        "try:\n    pass\nx = 1\n",
        "x = 1; if y: pass\n",
        // Tokens.
        "x = (1,\n",
        "x = 'abc\n",
        "x = \"\"\"abc\n",
        "x = $\n",
        "x = a ? b\n",
    };
    for (const char *code : rejected)
        EXPECT_NE(errorOf(code), "") << code;
}

TEST(ParserTest, Python2PrintSuggestsParentheses) {
    EXPECT_EQ(errorOf("print \"hello\"\n"),
              "Missing parentheses in call to 'print'. Did you mean print(...)?");
}

TEST(ParserTest, ParameterOrderMessages) {
    EXPECT_EQ(errorOf("def f(a=1, b): pass\n"),
              "non-default argument follows default argument");
    EXPECT_EQ(errorOf("def f(**k, a): pass\n"),
              "arguments cannot follow var-keyword argument");
    EXPECT_EQ(errorOf("f(a=1, 2)\n"),
              "positional argument follows keyword argument");
}

TEST(ParserTest, DeleteTargetMessage) {
    EXPECT_EQ(errorOf("del f()\n"), "cannot delete function call");
    EXPECT_EQ(errorOf("del 1\n"), "cannot delete literal");
}

TEST(ParserTest, NumericLiteralMessages) {
    EXPECT_EQ(errorOf("x = 0777\n"),
              "leading zeros in decimal integer literals are not permitted; "
              "use an 0o prefix for octal integers");
    EXPECT_EQ(errorOf("x = 1_\n"), "invalid decimal literal");
    EXPECT_EQ(errorOf("x = 1L\n"), "invalid decimal literal");
}

TEST(ParserTest, ReportsErrorPosition) {
    auto tree = parse("x = 1\ny = = 2\n");
    ASSERT_FALSE(static_cast<bool>(tree));
    unsigned line = 0;
    llvm::handleAllErrors(tree.takeError(), [&](const ParseError &PE) {
        line = PE.getLine();
    });
    EXPECT_EQ(line, 2u);
}

TEST(ParserTest, UnclosedBracketIsParseError) {
    auto tree = parse("x = (1,\n");
    ASSERT_FALSE(static_cast<bool>(tree));
    EXPECT_TRUE(tree.errorIsA<ParseError>());
    llvm::consumeError(tree.takeError());
}

// --- Indentation depth ---

namespace {

// `depth` nested if statements, one space per level.
std::string nestedIfs(unsigned depth) {
    std::string code;
    for (unsigned i = 0; i < depth; ++i)
        code += std::string(i, ' ') + "if x:\n";
    code += std::string(depth, ' ') + "pass\n";
    return code;
}

} // anonymous namespace

TEST(ParserTest, AcceptsDeepestIndentation) {
    auto tree = parse(nestedIfs(Parser::kMaxIndentDepth));
    ASSERT_TRUE(static_cast<bool>(tree)) << llvm::toString(tree.takeError());
    EXPECT_EQ(tree->root().children().size(), 1u);
}

TEST(ParserTest, RejectsTooManyIndentationLevels) {
    EXPECT_EQ(errorOf(nestedIfs(Parser::kMaxIndentDepth + 1)),
              "too many levels of indentation");
}

TEST(ParserTest, VeryDeepNestingFailsCleanly) {
    EXPECT_NE(errorOf(nestedIfs(3000)), "");
}

// --- Samples ---

TEST(ParserTest, ParsesSampleFiles) {
    for (const char *name : {"clean_module.py", "legacy_cli.py"}) {
        std::string path = std::string(PYREVIEW_SAMPLES_DIR) + "/" + name;
        auto buf = llvm::MemoryBuffer::getFile(path);
        ASSERT_TRUE(static_cast<bool>(buf)) << path;

        auto tree = parse(buf.get()->getBuffer());
        ASSERT_TRUE(static_cast<bool>(tree))
            << name << ": " << llvm::toString(tree.takeError());
        EXPECT_FALSE(tree->root().children().empty());
    }
}
