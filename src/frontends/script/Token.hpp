//===----------------------------------------------------------------------===//
//
// Part of the Rosella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Token.hpp
/// @brief Token definitions for the Rosella script lexer.
///
/// @details Tokens are value types that own their text. The lexer produces
/// the complete token vector for a source buffer before parsing starts, and
/// the parser indexes into it with a fixed lookahead.
///
/// @invariant Each token has a valid TokenKind and SourceLoc.
/// @invariant IntegerLiteral tokens have @ref Token::intValue populated and
///            StringLiteral tokens have @ref Token::stringValue populated.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <cstdint>
#include <string>

namespace rosella::frontends::script
{

/// @brief Enumeration of all token kinds recognized by the lexer.
enum class TokenKind
{
    /// @name Special Tokens
    /// @{
    Eof,   ///< End of input.
    Error, ///< Malformed input; the lexer stops after producing one.
    /// @}

    /// @name Literals and Names
    /// @{
    IntegerLiteral, ///< Unsigned decimal digits; sign is an operator.
    StringLiteral,  ///< Double-quoted text; stringValue holds the raw body.
    Identifier,     ///< `[A-Za-z_][A-Za-z0-9_]*` that is not a keyword.
    /// @}

    /// @name Keywords
    /// @brief Kept in alphabetical order; see isKeyword().
    /// @{
    KwElse,
    KwFn,
    KwIf,
    KwInt,
    KwLet,
    KwPrint,
    KwStr,
    KwWhile,
    KwWith,
    /// @}

    /// @name Operators
    /// @{
    Plus,         ///< `+`
    Minus,        ///< `-`
    Star,         ///< `*`
    Slash,        ///< `/`
    Equal,        ///< `=`
    EqualEqual,   ///< `==`
    NotEqual,     ///< `!=`
    Less,         ///< `<`
    Greater,      ///< `>`
    LessEqual,    ///< `<=`
    GreaterEqual, ///< `>=`
    PipeGreater,  ///< `|>` raw passthrough
    /// @}

    /// @name Punctuation
    /// @{
    LParen,
    RParen,
    LBrace,
    RBrace,
    Comma,
    Semicolon,
    /// @}
};

/// @brief Human-readable spelling used in diagnostics ("';'", "identifier").
const char *tokenKindToString(TokenKind kind);

/// @brief A single lexical unit.
struct Token
{
    TokenKind kind = TokenKind::Eof;

    /// @brief Position of the first character of the token.
    support::SourceLoc loc{};

    /// @brief Exact source text, including quotes for string literals.
    std::string text;

    /// @brief Parsed value for IntegerLiteral tokens.
    int64_t intValue = 0;

    /// @brief Body of a string literal between the quotes, escapes not yet
    ///        decoded. Decoding happens in the path normalizer because
    ///        `\/` must survive until the target separator is known.
    std::string stringValue;

    bool is(TokenKind k) const
    {
        return kind == k;
    }

    template <typename... Kinds> bool isOneOf(Kinds... kinds) const
    {
        return ((kind == kinds) || ...);
    }

    /// @brief True for `else` through `with`.
    bool isKeyword() const
    {
        return kind >= TokenKind::KwElse && kind <= TokenKind::KwWith;
    }
};

} // namespace rosella::frontends::script
