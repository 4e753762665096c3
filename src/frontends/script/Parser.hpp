//===----------------------------------------------------------------------===//
//
// Part of the Rosella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser.hpp
/// @brief Recursive descent parser for Rosella scripts.
///
/// @details The parser consumes the token vector produced by Lexer::tokenize
/// and appends nodes to a Program arena. Statements dispatch on their
/// leading token. Expressions use one function per precedence level:
///
/// | Level | Operators | Function |
/// |-------|-----------|----------|
/// | 1 | `==` `!=` | parseEquality |
/// | 2 | `<` `>` `<=` `>=` | parseRelational |
/// | 3 | `+` `-` | parseAdditive |
/// | 4 | `*` `/` | parseMultiplicative |
/// | 5 | unary `-` | parseUnary |
///
/// All binary levels are left-associative. Parsing stops at the first
/// syntax error; parse functions then return kInvalidId and callers unwind.
///
/// @invariant After an error, hasError() stays true and no further
///            diagnostics are recorded.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/script/AST.hpp"
#include "frontends/script/CompileError.hpp"
#include "frontends/script/Token.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rosella::frontends::script
{

class Parser
{
  public:
    /// @brief Create a parser over @p tokens, which must end with Eof.
    explicit Parser(std::vector<Token> tokens);

    /// @brief Parse the whole token stream.
    /// @return The program; incomplete when hasError() is true.
    Program parseProgram();

    bool hasError() const
    {
        return hasError_;
    }

    /// @brief The recorded SyntaxError; requires hasError().
    const CompileError &error() const
    {
        return *error_;
    }

  private:
    /// Deepest nesting of blocks, parenthesized expressions or `else if`
    /// links accepted.
    static constexpr unsigned kMaxNestingDepth = 256;

    /// Tallest expression tree accepted, counting every operator on the
    /// longest path; a flat `a + b + ...` chain is as tall as it is long.
    static constexpr unsigned kMaxExpressionHeight = 1024;

    //=========================================================================
    /// @name Token Handling
    /// @{
    //=========================================================================

    /// @brief Token @p offset positions ahead; clamps to the final token.
    const Token &peek(size_t offset = 0) const;

    /// @brief Consume and return the current token.
    Token advance();

    bool check(TokenKind kind, size_t offset = 0) const;

    /// @brief Consume the current token if it has @p kind.
    bool match(TokenKind kind, Token *out = nullptr);

    /// @brief Consume a token of @p kind or report "expected <what>, got <found>".
    bool expect(TokenKind kind, const char *what, Token *out = nullptr);

    /// @}
    //=========================================================================
    /// @name Error Handling
    /// @{
    //=========================================================================

    /// @brief Report an error at the current token.
    void error(const std::string &message, std::string_view code);

    /// @brief Report that @p expected was wanted where the current token sits.
    void errorExpected(const std::string &expected, std::string_view code);

    void errorAt(const Token &tok, const std::string &message, std::string_view code,
                 std::string expected = {});

    /// @}
    //=========================================================================
    /// @name Statement Parsing
    /// @{
    //=========================================================================

    StmtId parseStatement();
    StmtId parseFunctionDecl();
    StmtId parseBlock();
    StmtId parseVarDecl();
    StmtId parseWhileStmt();
    StmtId parseIfStmt();
    StmtId parseWithStmt();
    StmtId parsePrintStmt();
    StmtId parseRawStmt();

    /// @brief Assignment or call statement starting with an identifier.
    StmtId parseIdentifierStmt();

    /// @brief Optional `int` / `str` type keyword before a binding name.
    TypeTag parseOptionalType();

    /// @brief `int(expr)` or `str(expr)`.
    bool parseCondition(Condition &out);

    /// @}
    //=========================================================================
    /// @name Expression Parsing
    /// @{
    //=========================================================================

    ExprId parseExpression();
    ExprId parseEquality();
    ExprId parseRelational();
    ExprId parseAdditive();
    ExprId parseMultiplicative();
    ExprId parseUnary();
    ExprId parsePrimary();

    /// @brief `( [expr {, expr}] )`, shared by calls and print.
    bool parseCallArgs(std::vector<ExprId> &args);

    ExprId makeBinary(const Token &opTok, BinaryOp op, ExprId lhs, ExprId rhs);
    ExprId makeUnary(const Token &opTok, ExprId operand);

    /// @brief Height of the tree rooted at @p id; leaves are 1.
    unsigned heightOf(ExprId id) const;

    /// @brief Record the height of a new operator node, or report it too tall.
    bool trackHeight(const Token &opTok, unsigned height);

    /// @}

    std::vector<Token> tokens_;
    size_t tokenPos_ = 0;
    Program program_;
    bool hasError_ = false;
    std::optional<CompileError> error_;
    unsigned depth_ = 0;
    std::vector<unsigned> exprHeights_; ///< Indexed by ExprId; 0 for leaves.
};

} // namespace rosella::frontends::script
