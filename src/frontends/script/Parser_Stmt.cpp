//===----------------------------------------------------------------------===//
//
// Part of the Rosella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser_Stmt.cpp
/// @brief Statement parsing for the Rosella parser.
///
/// @details Each statement form is selected by its first token. Statements
/// that end in an expression (`let`, assignment, call, `print`, `|>`) need a
/// terminating semicolon. Brace-delimited forms (`fn`, `while`, `if`,
/// `with`, blocks) do not.
///
//===----------------------------------------------------------------------===//

#include "frontends/script/DiagnosticCodes.hpp"
#include "frontends/script/Parser.hpp"

namespace rosella::frontends::script
{

StmtId Parser::parseStatement()
{
    switch (peek().kind)
    {
        case TokenKind::KwLet:
            return parseVarDecl();
        case TokenKind::KwWhile:
            return parseWhileStmt();
        case TokenKind::KwIf:
            return parseIfStmt();
        case TokenKind::KwWith:
            return parseWithStmt();
        case TokenKind::KwPrint:
            return parsePrintStmt();
        case TokenKind::PipeGreater:
            return parseRawStmt();
        case TokenKind::LBrace:
            return parseBlock();
        case TokenKind::Identifier:
            return parseIdentifierStmt();
        case TokenKind::KwFn:
            error("function declarations are only allowed at top level", diag::NestedFunction);
            return kInvalidId;
        default:
            errorExpected("statement", diag::ExpectedStatement);
            return kInvalidId;
    }
}

/// @brief Parse `fn name(params) { body }`.
///
/// Parameters may carry an `int` or `str` type keyword. The body is always a
/// block so the checker can open the function scope on it.
StmtId Parser::parseFunctionDecl()
{
    Token fnTok = advance(); // consume 'fn'

    Token nameTok;
    if (!expect(TokenKind::Identifier, "function name", &nameTok))
        return kInvalidId;
    if (!expect(TokenKind::LParen, "'('"))
        return kInvalidId;

    FunctionDecl decl;
    decl.name = nameTok.text;

    if (!check(TokenKind::RParen))
    {
        do
        {
            Param param;
            param.type = parseOptionalType();
            Token paramTok;
            if (!expect(TokenKind::Identifier, "parameter name", &paramTok))
                return kInvalidId;
            param.name = paramTok.text;
            param.loc = paramTok.loc;
            decl.params.push_back(std::move(param));
        } while (match(TokenKind::Comma));
    }

    if (!expect(TokenKind::RParen, "')'"))
        return kInvalidId;

    if (!check(TokenKind::LBrace))
    {
        errorExpected("'{'", diag::UnexpectedToken);
        return kInvalidId;
    }
    decl.body = parseBlock();
    if (decl.body == kInvalidId)
        return kInvalidId;

    return program_.addStmt(fnTok.loc, std::move(decl));
}

StmtId Parser::parseBlock()
{
    Token open;
    if (!expect(TokenKind::LBrace, "'{'", &open))
        return kInvalidId;

    if (++depth_ > kMaxNestingDepth)
    {
        errorAt(open, "blocks nested too deeply", diag::NestingTooDeep);
        --depth_;
        return kInvalidId;
    }

    BlockStmt block;
    while (!check(TokenKind::RBrace) && !check(TokenKind::Eof))
    {
        StmtId stmt = parseStatement();
        if (stmt == kInvalidId)
        {
            --depth_;
            return kInvalidId;
        }
        block.stmts.push_back(stmt);
    }
    --depth_;

    if (!expect(TokenKind::RBrace, "'}'"))
        return kInvalidId;
    return program_.addStmt(open.loc, std::move(block));
}

TypeTag Parser::parseOptionalType()
{
    if (match(TokenKind::KwInt))
        return TypeTag::Int;
    match(TokenKind::KwStr);
    return TypeTag::Untyped;
}

StmtId Parser::parseVarDecl()
{
    Token letTok = advance(); // consume 'let'

    VarDeclStmt decl;
    decl.type = parseOptionalType();

    Token nameTok;
    if (!expect(TokenKind::Identifier, "variable name", &nameTok))
        return kInvalidId;
    decl.name = nameTok.text;

    if (!expect(TokenKind::Equal, "'='"))
        return kInvalidId;

    decl.init = parseExpression();
    if (decl.init == kInvalidId)
        return kInvalidId;

    if (!expect(TokenKind::Semicolon, "';'"))
        return kInvalidId;

    return program_.addStmt(letTok.loc, std::move(decl));
}

/// @brief Parse the boolean-context wrapper `int(expr)` or `str(expr)`.
///
/// `int` and `str` are keywords, so the wrapper can never be mistaken for a
/// call; only the inner expression and the marker are kept.
bool Parser::parseCondition(Condition &out)
{
    if (match(TokenKind::KwInt))
        out.marker = ConditionKind::Int;
    else if (match(TokenKind::KwStr))
        out.marker = ConditionKind::Str;
    else
    {
        errorExpected("'int(' or 'str(' condition", diag::UnexpectedToken);
        return false;
    }

    if (!expect(TokenKind::LParen, "'('"))
        return false;
    out.expr = parseExpression();
    if (out.expr == kInvalidId)
        return false;
    return expect(TokenKind::RParen, "')'");
}

StmtId Parser::parseWhileStmt()
{
    Token whileTok = advance(); // consume 'while'

    WhileStmt stmt;
    if (!parseCondition(stmt.cond))
        return kInvalidId;

    stmt.body = parseBlock();
    if (stmt.body == kInvalidId)
        return kInvalidId;

    return program_.addStmt(whileTok.loc, std::move(stmt));
}

StmtId Parser::parseIfStmt()
{
    Token ifTok = advance(); // consume 'if'

    IfStmt stmt;
    if (!parseCondition(stmt.cond))
        return kInvalidId;

    stmt.thenBody = parseBlock();
    if (stmt.thenBody == kInvalidId)
        return kInvalidId;

    Token elseTok;
    if (match(TokenKind::KwElse, &elseTok))
    {
        if (check(TokenKind::KwIf))
        {
            // Each `else if` link nests one IfStmt inside the previous one.
            if (++depth_ > kMaxNestingDepth)
            {
                errorAt(elseTok, "too many 'else if' branches in one chain", diag::NestingTooDeep);
                --depth_;
                return kInvalidId;
            }
            stmt.elseBody = parseIfStmt();
            --depth_;
        }
        else
        {
            stmt.elseBody = parseBlock();
        }
        if (stmt.elseBody == kInvalidId)
            return kInvalidId;
    }

    return program_.addStmt(ifTok.loc, std::move(stmt));
}

/// @brief Parse `with <target> { ... }` where the target is a bare name or a string.
StmtId Parser::parseWithStmt()
{
    Token withTok = advance(); // consume 'with'

    WithStmt stmt;
    Token targetTok;
    if (match(TokenKind::Identifier, &targetTok))
        stmt.target = targetTok.text;
    else if (match(TokenKind::StringLiteral, &targetTok))
        stmt.target = targetTok.stringValue;
    else
    {
        errorExpected("target name", diag::UnexpectedToken);
        return kInvalidId;
    }

    stmt.body = parseBlock();
    if (stmt.body == kInvalidId)
        return kInvalidId;

    return program_.addStmt(withTok.loc, std::move(stmt));
}

StmtId Parser::parsePrintStmt()
{
    Token printTok = advance(); // consume 'print'

    PrintStmt stmt;
    if (!parseCallArgs(stmt.args))
        return kInvalidId;
    if (!expect(TokenKind::Semicolon, "';'"))
        return kInvalidId;

    return program_.addStmt(printTok.loc, std::move(stmt));
}

/// @brief Parse `|> "line" {, "line"} ;`.
StmtId Parser::parseRawStmt()
{
    Token rawTok = advance(); // consume '|>'

    RawStmt stmt;
    do
    {
        Token lineTok;
        if (!expect(TokenKind::StringLiteral, "string literal", &lineTok))
            return kInvalidId;
        stmt.lines.push_back(lineTok.stringValue);
    } while (match(TokenKind::Comma));

    if (!expect(TokenKind::Semicolon, "';'"))
        return kInvalidId;

    return program_.addStmt(rawTok.loc, std::move(stmt));
}

/// @brief Parse `name = expr;` or `name(args);`.
///
/// One token of lookahead after the identifier decides between the two.
StmtId Parser::parseIdentifierStmt()
{
    if (check(TokenKind::Equal, 1))
    {
        Token nameTok = advance();
        advance(); // consume '='

        AssignStmt stmt;
        stmt.name = nameTok.text;
        stmt.value = parseExpression();
        if (stmt.value == kInvalidId)
            return kInvalidId;
        if (!expect(TokenKind::Semicolon, "';'"))
            return kInvalidId;
        return program_.addStmt(nameTok.loc, std::move(stmt));
    }

    if (check(TokenKind::LParen, 1))
    {
        Token nameTok = advance();

        CallExpr call;
        call.callee = nameTok.text;
        if (!parseCallArgs(call.args))
            return kInvalidId;
        if (!expect(TokenKind::Semicolon, "';'"))
            return kInvalidId;

        ExprId callId = program_.addExpr(nameTok.loc, std::move(call));
        return program_.addStmt(nameTok.loc, ExprStmt{callId});
    }

    advance();
    errorExpected("'=' or '(' after identifier", diag::UnexpectedToken);
    return kInvalidId;
}

} // namespace rosella::frontends::script
