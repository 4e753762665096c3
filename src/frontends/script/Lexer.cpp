//===----------------------------------------------------------------------===//
//
// Part of the Rosella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Lexer.cpp
/// @brief Implementation of the Rosella script lexer.
///
/// @details Keywords are stored in a sorted array (kKeywordTable) and found
/// by binary search after an identifier has been scanned, so the scanning
/// loop itself never special-cases them.
///
/// String literals keep their raw body: `\"`, `\\` and `\/` are recognised
/// only so the closing quote can be found. Any other backslash is an
/// ordinary character, which keeps Windows paths such as `"C:\temp"`
/// writable without doubling.
///
//===----------------------------------------------------------------------===//

#include "frontends/script/Lexer.hpp"
#include "frontends/common/CharUtils.hpp"
#include "frontends/common/NumberParsing.hpp"
#include "frontends/script/DiagnosticCodes.hpp"

#include <algorithm>
#include <array>
#include <cstdio>
#include <string_view>

namespace rosella::frontends::script
{

const char *tokenKindToString(TokenKind kind)
{
    switch (kind)
    {
        case TokenKind::Eof:
            return "end of input";
        case TokenKind::Error:
            return "invalid token";
        case TokenKind::IntegerLiteral:
            return "integer literal";
        case TokenKind::StringLiteral:
            return "string literal";
        case TokenKind::Identifier:
            return "identifier";
        case TokenKind::KwElse:
            return "'else'";
        case TokenKind::KwFn:
            return "'fn'";
        case TokenKind::KwIf:
            return "'if'";
        case TokenKind::KwInt:
            return "'int'";
        case TokenKind::KwLet:
            return "'let'";
        case TokenKind::KwPrint:
            return "'print'";
        case TokenKind::KwStr:
            return "'str'";
        case TokenKind::KwWhile:
            return "'while'";
        case TokenKind::KwWith:
            return "'with'";
        case TokenKind::Plus:
            return "'+'";
        case TokenKind::Minus:
            return "'-'";
        case TokenKind::Star:
            return "'*'";
        case TokenKind::Slash:
            return "'/'";
        case TokenKind::Equal:
            return "'='";
        case TokenKind::EqualEqual:
            return "'=='";
        case TokenKind::NotEqual:
            return "'!='";
        case TokenKind::Less:
            return "'<'";
        case TokenKind::Greater:
            return "'>'";
        case TokenKind::LessEqual:
            return "'<='";
        case TokenKind::GreaterEqual:
            return "'>='";
        case TokenKind::PipeGreater:
            return "'|>'";
        case TokenKind::LParen:
            return "'('";
        case TokenKind::RParen:
            return "')'";
        case TokenKind::LBrace:
            return "'{'";
        case TokenKind::RBrace:
            return "'}'";
        case TokenKind::Comma:
            return "','";
        case TokenKind::Semicolon:
            return "';'";
    }
    return "unknown";
}

//===----------------------------------------------------------------------===//
// Keyword lookup table
//===----------------------------------------------------------------------===//

namespace
{

struct KeywordEntry
{
    std::string_view key;
    TokenKind kind;
};

// Sorted for binary search
constexpr std::array<KeywordEntry, 9> kKeywordTable = {{
    {"else", TokenKind::KwElse},
    {"fn", TokenKind::KwFn},
    {"if", TokenKind::KwIf},
    {"int", TokenKind::KwInt},
    {"let", TokenKind::KwLet},
    {"print", TokenKind::KwPrint},
    {"str", TokenKind::KwStr},
    {"while", TokenKind::KwWhile},
    {"with", TokenKind::KwWith},
}};

using common::char_utils::isDigit;
using common::char_utils::isHorizontalWhitespace;
using common::char_utils::isIdentifierContinue;
using common::char_utils::isIdentifierStart;
using common::char_utils::isNewline;

/// @brief Printable form of a stray character for diagnostics.
std::string describeChar(char c)
{
    const auto byte = static_cast<unsigned char>(c);
    if (byte >= 0x20 && byte < 0x7F)
        return std::string("'") + c + "'";
    char buf[8];
    std::snprintf(buf, sizeof(buf), "0x%02X", byte);
    return buf;
}

} // anonymous namespace

std::optional<TokenKind> Lexer::lookupKeyword(const std::string &name)
{
    auto it = std::lower_bound(kKeywordTable.begin(),
                               kKeywordTable.end(),
                               name,
                               [](const KeywordEntry &entry, const std::string &key)
                               { return entry.key < key; });
    if (it != kKeywordTable.end() && it->key == name)
        return it->kind;
    return std::nullopt;
}

//===----------------------------------------------------------------------===//
// Lexer implementation
//===----------------------------------------------------------------------===//

Lexer::Lexer(std::string source, uint32_t fileId) : source_(std::move(source)), fileId_(fileId)
{
}

char Lexer::peekChar() const
{
    if (pos_ >= source_.size())
        return '\0';
    return source_[pos_];
}

char Lexer::peekChar(size_t offset) const
{
    if (pos_ + offset >= source_.size())
        return '\0';
    return source_[pos_ + offset];
}

char Lexer::getChar()
{
    if (pos_ >= source_.size())
        return '\0';
    char c = source_[pos_++];
    if (c == '\n')
    {
        ++line_;
        column_ = 1;
    }
    else
    {
        ++column_;
    }
    return c;
}

bool Lexer::eof() const
{
    return pos_ >= source_.size();
}

support::SourceLoc Lexer::currentLoc() const
{
    return support::SourceLoc{fileId_, line_, column_};
}

void Lexer::reportError(support::SourceLoc loc, std::string message, std::string_view code)
{
    if (error_)
        return;
    CompileError err;
    err.kind = ErrorKind::Lex;
    err.loc = loc;
    err.message = std::move(message);
    err.code = code;
    error_ = std::move(err);
}

void Lexer::skipLineComment()
{
    getChar();
    getChar();
    while (!eof() && peekChar() != '\n')
    {
        getChar();
    }
}

bool Lexer::skipBlockComment()
{
    support::SourceLoc startLoc = currentLoc();

    getChar();
    getChar();

    int depth = 1; // nested comments are allowed
    while (!eof() && depth > 0)
    {
        char c = getChar();
        if (c == '/' && peekChar() == '*')
        {
            getChar();
            ++depth;
        }
        else if (c == '*' && peekChar() == '/')
        {
            getChar();
            --depth;
        }
    }

    if (depth > 0)
    {
        reportError(startLoc, "unterminated block comment", diag::UnterminatedComment);
        return false;
    }
    return true;
}

void Lexer::skipWhitespaceAndComments()
{
    while (!eof())
    {
        char c = peekChar();

        if (isHorizontalWhitespace(c) || isNewline(c))
        {
            getChar();
            continue;
        }

        if (c == '/' && peekChar(1) == '/')
        {
            skipLineComment();
            continue;
        }

        if (c == '/' && peekChar(1) == '*')
        {
            if (!skipBlockComment())
                return;
            continue;
        }

        break;
    }
}

Token Lexer::makeError(support::SourceLoc loc)
{
    Token tok;
    tok.kind = TokenKind::Error;
    tok.loc = loc;
    return tok;
}

Token Lexer::lexIdentifierOrKeyword()
{
    Token tok;
    tok.loc = currentLoc();
    tok.text.reserve(16);

    while (!eof() && isIdentifierContinue(peekChar()))
    {
        tok.text.push_back(getChar());
    }

    if (auto kw = lookupKeyword(tok.text))
    {
        tok.kind = *kw;
        return tok;
    }

    tok.kind = TokenKind::Identifier;
    return tok;
}

Token Lexer::lexNumber()
{
    Token tok;
    tok.loc = currentLoc();
    tok.kind = TokenKind::IntegerLiteral;

    while (!eof() && isDigit(peekChar()))
    {
        tok.text.push_back(getChar());
    }

    // `12abc` is one malformed token, not a number followed by a name.
    if (isIdentifierStart(peekChar()))
    {
        reportError(currentLoc(),
                    "unexpected character " + describeChar(peekChar()) + " in integer literal",
                    diag::UnexpectedCharacter);
        return makeError(tok.loc);
    }

    auto parsed = common::number_parsing::parseDecimalLiteral(tok.text);
    if (!parsed.valid)
    {
        reportError(tok.loc,
                    "integer literal " + tok.text + " exceeds the maximum of " +
                        std::to_string(common::number_parsing::kMaxIntLiteral),
                    diag::IntegerTooLarge);
        return makeError(tok.loc);
    }
    tok.intValue = parsed.intValue;
    return tok;
}

Token Lexer::lexString()
{
    Token tok;
    tok.loc = currentLoc();
    tok.kind = TokenKind::StringLiteral;

    tok.text.push_back(getChar()); // opening "

    while (!eof())
    {
        char c = peekChar();

        if (c == '"')
        {
            tok.text.push_back(getChar());
            return tok;
        }

        if (isNewline(c))
            break;

        if (c == '\\')
        {
            char escaped = peekChar(1);
            if (escaped == '"' || escaped == '\\' || escaped == '/')
            {
                tok.text.push_back(getChar());
                tok.stringValue.push_back('\\');
                tok.text.push_back(getChar());
                tok.stringValue.push_back(escaped);
                continue;
            }
        }

        tok.text.push_back(getChar());
        tok.stringValue.push_back(c);
    }

    reportError(tok.loc, "unterminated string literal", diag::UnterminatedString);
    return makeError(tok.loc);
}

Token Lexer::next()
{
    if (error_)
        return makeError(currentLoc());

    skipWhitespaceAndComments();
    if (error_)
        return makeError(error_->loc);

    if (eof())
    {
        Token tok;
        tok.kind = TokenKind::Eof;
        tok.loc = currentLoc();
        return tok;
    }

    char c = peekChar();

    if (isIdentifierStart(c))
        return lexIdentifierOrKeyword();

    if (isDigit(c))
        return lexNumber();

    if (c == '"')
        return lexString();

    Token tok;
    tok.loc = currentLoc();

    auto single = [&](TokenKind kind)
    {
        tok.kind = kind;
        tok.text.push_back(getChar());
        return tok;
    };

    auto withEqual = [&](TokenKind plain, TokenKind paired)
    {
        tok.text.push_back(getChar());
        if (peekChar() == '=')
        {
            tok.text.push_back(getChar());
            tok.kind = paired;
        }
        else
        {
            tok.kind = plain;
        }
        return tok;
    };

    switch (c)
    {
        case '+':
            return single(TokenKind::Plus);
        case '-':
            return single(TokenKind::Minus);
        case '*':
            return single(TokenKind::Star);
        case '/':
            return single(TokenKind::Slash);
        case '(':
            return single(TokenKind::LParen);
        case ')':
            return single(TokenKind::RParen);
        case '{':
            return single(TokenKind::LBrace);
        case '}':
            return single(TokenKind::RBrace);
        case ',':
            return single(TokenKind::Comma);
        case ';':
            return single(TokenKind::Semicolon);
        case '=':
            return withEqual(TokenKind::Equal, TokenKind::EqualEqual);
        case '<':
            return withEqual(TokenKind::Less, TokenKind::LessEqual);
        case '>':
            return withEqual(TokenKind::Greater, TokenKind::GreaterEqual);
        case '!':
            if (peekChar(1) == '=')
            {
                tok.text.push_back(getChar());
                tok.text.push_back(getChar());
                tok.kind = TokenKind::NotEqual;
                return tok;
            }
            break;
        case '|':
            if (peekChar(1) == '>')
            {
                tok.text.push_back(getChar());
                tok.text.push_back(getChar());
                tok.kind = TokenKind::PipeGreater;
                return tok;
            }
            break;
        default:
            break;
    }

    reportError(tok.loc, "unexpected character " + describeChar(c), diag::UnexpectedCharacter);
    return makeError(tok.loc);
}

std::vector<Token> Lexer::tokenize()
{
    std::vector<Token> tokens;
    while (true)
    {
        tokens.push_back(next());
        const TokenKind kind = tokens.back().kind;
        if (kind == TokenKind::Eof || kind == TokenKind::Error)
            break;
    }
    return tokens;
}

} // namespace rosella::frontends::script
