//===----------------------------------------------------------------------===//
//
// Part of the Rosella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser.cpp
/// @brief Token handling, error reporting and the program entry point of the
///        Rosella parser.
///
//===----------------------------------------------------------------------===//

#include "frontends/script/Parser.hpp"
#include "frontends/script/DiagnosticCodes.hpp"

namespace rosella::frontends::script
{

Parser::Parser(std::vector<Token> tokens) : tokens_(std::move(tokens))
{
    if (tokens_.empty() || !tokens_.back().isOneOf(TokenKind::Eof, TokenKind::Error))
    {
        Token eofTok;
        eofTok.kind = TokenKind::Eof;
        if (!tokens_.empty())
            eofTok.loc = tokens_.back().loc;
        tokens_.push_back(std::move(eofTok));
    }
}

Program Parser::parseProgram()
{
    while (!hasError_ && !check(TokenKind::Eof))
    {
        StmtId stmt = check(TokenKind::KwFn) ? parseFunctionDecl() : parseStatement();
        if (stmt == kInvalidId)
            break;
        program_.topLevel.push_back(stmt);
    }
    return std::move(program_);
}

//===----------------------------------------------------------------------===//
// Token Handling
//===----------------------------------------------------------------------===//

const Token &Parser::peek(size_t offset) const
{
    if (tokenPos_ + offset >= tokens_.size())
        return tokens_.back();
    return tokens_[tokenPos_ + offset];
}

Token Parser::advance()
{
    Token cur = peek();
    if (tokenPos_ < tokens_.size() - 1)
        ++tokenPos_;
    return cur;
}

bool Parser::check(TokenKind kind, size_t offset) const
{
    return peek(offset).kind == kind;
}

bool Parser::match(TokenKind kind, Token *out)
{
    if (check(kind))
    {
        Token tok = advance();
        if (out)
            *out = tok;
        return true;
    }
    return false;
}

bool Parser::expect(TokenKind kind, const char *what, Token *out)
{
    if (check(kind))
    {
        Token tok = advance();
        if (out)
            *out = tok;
        return true;
    }
    errorExpected(what, diag::UnexpectedToken);
    return false;
}

//===----------------------------------------------------------------------===//
// Error Handling
//===----------------------------------------------------------------------===//

void Parser::error(const std::string &message, std::string_view code)
{
    errorAt(peek(), message, code);
}

void Parser::errorExpected(const std::string &expected, std::string_view code)
{
    const Token &found = peek();
    std::string foundText = tokenKindToString(found.kind);
    if (found.isOneOf(TokenKind::Identifier, TokenKind::IntegerLiteral, TokenKind::StringLiteral))
        foundText += " '" + found.text + "'";
    errorAt(found, "expected " + expected + ", got " + foundText, code, expected);
}

void Parser::errorAt(const Token &tok, const std::string &message, std::string_view code,
                     std::string expected)
{
    if (hasError_)
        return;
    hasError_ = true;

    CompileError err;
    err.kind = ErrorKind::Syntax;
    err.loc = tok.loc;
    err.message = message;
    err.subject = tok.is(TokenKind::Eof) ? tokenKindToString(tok.kind) : tok.text;
    err.expected = std::move(expected);
    err.code = code;
    error_ = std::move(err);
}

} // namespace rosella::frontends::script
