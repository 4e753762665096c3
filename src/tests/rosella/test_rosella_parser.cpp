//===----------------------------------------------------------------------===//
//
// Part of the Rosella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Parser tests. Successful parses are checked through the AST printer so
// the expected trees read top-down; failures check kind, position and the
// "expected X, got Y" wording.
//
//===----------------------------------------------------------------------===//

#include "frontends/script/AstPrinter.hpp"
#include "frontends/script/Lexer.hpp"
#include "frontends/script/Parser.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace rosella::frontends::script;

namespace
{

struct ParseOutcome
{
    Program program;
    bool failed = false;
    CompileError error;
};

ParseOutcome parseSource(const std::string &source)
{
    Lexer lexer(source, 1);
    auto tokens = lexer.tokenize();
    EXPECT_FALSE(lexer.hasError()) << lexer.error().message;

    Parser parser(std::move(tokens));
    ParseOutcome outcome;
    outcome.program = parser.parseProgram();
    if (parser.hasError())
    {
        outcome.failed = true;
        outcome.error = parser.error();
    }
    return outcome;
}

std::string dumpOf(const std::string &source)
{
    ParseOutcome outcome = parseSource(source);
    EXPECT_FALSE(outcome.failed) << outcome.error.message;
    return AstPrinter(false).dump(outcome.program);
}

} // namespace

TEST(RosellaParser, EmptyProgram)
{
    EXPECT_EQ(dumpOf(""), "Program\n");
    EXPECT_EQ(dumpOf("  // nothing here\n"), "Program\n");
}

TEST(RosellaParser, VariableDeclarations)
{
    EXPECT_EQ(dumpOf("let int x = 5; let s = \"hi\"; let str t = s;"),
              "Program\n"
              "  VarDecl int \"x\"\n"
              "    IntLiteral 5\n"
              "  VarDecl \"s\"\n"
              "    StringLiteral \"hi\"\n"
              "  VarDecl \"t\"\n"
              "    IdentExpr \"s\"\n");
}

TEST(RosellaParser, MultiplicationBindsTighterThanAddition)
{
    EXPECT_EQ(dumpOf("let int x = 1 + 2 * 3;"),
              "Program\n"
              "  VarDecl int \"x\"\n"
              "    BinaryExpr (+)\n"
              "      IntLiteral 1\n"
              "      BinaryExpr (*)\n"
              "        IntLiteral 2\n"
              "        IntLiteral 3\n");
}

TEST(RosellaParser, SubtractionIsLeftAssociative)
{
    EXPECT_EQ(dumpOf("let int x = 10 - 3 - 2;"),
              "Program\n"
              "  VarDecl int \"x\"\n"
              "    BinaryExpr (-)\n"
              "      BinaryExpr (-)\n"
              "        IntLiteral 10\n"
              "        IntLiteral 3\n"
              "      IntLiteral 2\n");
}

TEST(RosellaParser, ParenthesesAndUnaryMinus)
{
    EXPECT_EQ(dumpOf("let int x = -(1 + 2);"),
              "Program\n"
              "  VarDecl int \"x\"\n"
              "    UnaryExpr (-)\n"
              "      BinaryExpr (+)\n"
              "        IntLiteral 1\n"
              "        IntLiteral 2\n");
}

TEST(RosellaParser, FunctionDeclarationAndCall)
{
    EXPECT_EQ(dumpOf("fn add(int x, y) { print(x); }\nadd(1, \"a\");"),
              "Program\n"
              "  FunctionDecl \"add\"\n"
              "    Param int \"x\"\n"
              "    Param \"y\"\n"
              "    Block\n"
              "      PrintStmt\n"
              "        IdentExpr \"x\"\n"
              "  ExprStmt\n"
              "    CallExpr \"add\"\n"
              "      IntLiteral 1\n"
              "      StringLiteral \"a\"\n");
}

TEST(RosellaParser, WhileWithComparison)
{
    EXPECT_EQ(dumpOf("while int(i < 3) { i = i + 1; }"),
              "Program\n"
              "  WhileStmt int\n"
              "    BinaryExpr (<)\n"
              "      IdentExpr \"i\"\n"
              "      IntLiteral 3\n"
              "    Block\n"
              "      AssignStmt \"i\"\n"
              "        BinaryExpr (+)\n"
              "          IdentExpr \"i\"\n"
              "          IntLiteral 1\n");
}

TEST(RosellaParser, ElseIfChainNestsInElse)
{
    EXPECT_EQ(dumpOf("if str(a == \"x\") { } else if int(b) { } else { print(); }"),
              "Program\n"
              "  IfStmt str\n"
              "    BinaryExpr (==)\n"
              "      IdentExpr \"a\"\n"
              "      StringLiteral \"x\"\n"
              "    Block\n"
              "    Else:\n"
              "      IfStmt int\n"
              "        IdentExpr \"b\"\n"
              "        Block\n"
              "        Else:\n"
              "          Block\n"
              "            PrintStmt\n");
}

TEST(RosellaParser, WithAcceptsNameOrString)
{
    EXPECT_EQ(dumpOf("with batch { } with \"shell\" { }"),
              "Program\n"
              "  WithStmt \"batch\"\n"
              "    Block\n"
              "  WithStmt \"shell\"\n"
              "    Block\n");
}

TEST(RosellaParser, RawPassthroughKeepsLines)
{
    EXPECT_EQ(dumpOf("|> \"echo hi\", \"ls -l\";"),
              "Program\n"
              "  RawStmt\n"
              "    Line \"echo hi\"\n"
              "    Line \"ls -l\"\n");
}

TEST(RosellaParser, NestedBlocksAreStatements)
{
    EXPECT_EQ(dumpOf("{ { let x = 1; } }"),
              "Program\n"
              "  Block\n"
              "    Block\n"
              "      VarDecl \"x\"\n"
              "        IntLiteral 1\n");
}

TEST(RosellaParser, NodeLocations)
{
    ParseOutcome outcome = parseSource("let int x =\n  1 + 2;");
    ASSERT_FALSE(outcome.failed);
    const Program &program = outcome.program;
    ASSERT_EQ(program.topLevel.size(), 1u);
    const Stmt &decl = program.stmt(program.topLevel[0]);
    EXPECT_EQ(decl.loc.line, 1u);
    EXPECT_EQ(decl.loc.column, 1u);
    const Expr &sum = program.expr(decl.as<VarDeclStmt>().init);
    EXPECT_EQ(sum.kind(), ExprKind::Binary);
    EXPECT_EQ(sum.loc.line, 2u);
    EXPECT_EQ(sum.loc.column, 5u);
}

TEST(RosellaParser, MissingSemicolonAtEnd)
{
    ParseOutcome outcome = parseSource("let x = 1");
    ASSERT_TRUE(outcome.failed);
    EXPECT_EQ(outcome.error.kind, ErrorKind::Syntax);
    EXPECT_EQ(outcome.error.message, "expected ';', got end of input");
    EXPECT_EQ(outcome.error.subject, "end of input");
    EXPECT_EQ(outcome.error.expected, "';'");
    EXPECT_EQ(outcome.error.code, "R2001");
}

TEST(RosellaParser, MissingExpression)
{
    ParseOutcome outcome = parseSource("let x = ;");
    ASSERT_TRUE(outcome.failed);
    EXPECT_EQ(outcome.error.message, "expected expression, got ';'");
    EXPECT_EQ(outcome.error.loc.column, 9u);
    EXPECT_EQ(outcome.error.code, "R2004");
}

TEST(RosellaParser, NestedFunctionRejected)
{
    ParseOutcome outcome = parseSource("fn outer() {\n  fn inner() { }\n}");
    ASSERT_TRUE(outcome.failed);
    EXPECT_EQ(outcome.error.message, "function declarations are only allowed at top level");
    EXPECT_EQ(outcome.error.code, "R2002");
    EXPECT_EQ(outcome.error.loc.line, 2u);
    EXPECT_EQ(outcome.error.loc.column, 3u);
}

TEST(RosellaParser, ConditionNeedsMarker)
{
    ParseOutcome outcome = parseSource("while (x < 3) { }");
    ASSERT_TRUE(outcome.failed);
    EXPECT_EQ(outcome.error.message, "expected 'int(' or 'str(' condition, got '('");
}

TEST(RosellaParser, BareIdentifierStatement)
{
    ParseOutcome outcome = parseSource("x;");
    ASSERT_TRUE(outcome.failed);
    EXPECT_EQ(outcome.error.message, "expected '=' or '(' after identifier, got ';'");
}

TEST(RosellaParser, StrayTokenIsNotAStatement)
{
    ParseOutcome outcome = parseSource("let x = 1;\n42;");
    ASSERT_TRUE(outcome.failed);
    EXPECT_EQ(outcome.error.message, "expected statement, got integer literal '42'");
    EXPECT_EQ(outcome.error.code, "R2003");
    EXPECT_EQ(outcome.error.loc.line, 2u);
}

TEST(RosellaParser, UnclosedBlock)
{
    ParseOutcome outcome = parseSource("{ let x = 1;");
    ASSERT_TRUE(outcome.failed);
    EXPECT_EQ(outcome.error.message, "expected '}', got end of input");
}
