//===----------------------------------------------------------------------===//
//
// Part of the Rosella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/script/Lexer.hpp
// Purpose: Declares the lexer converting script source into tokens.
// Key invariants: pos_ <= source_.size(); once an error is recorded the
//                 lexer only produces Eof.
// Ownership/Lifetime: The lexer copies the source text it is given.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/script/CompileError.hpp"
#include "frontends/script/Token.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rosella::frontends::script
{

/// @brief Lexical analyzer for Rosella script source.
///
/// @details Whitespace, `//` line comments and `/* */` block comments are
/// skipped. Keywords are scanned as identifiers and then looked up in a
/// sorted table. The first malformed token is recorded as a LexError and
/// terminates the stream.
class Lexer
{
  public:
    /// @brief Create a lexer for @p source; @p fileId is stamped into every location.
    Lexer(std::string source, uint32_t fileId);

    /// @brief Get the next token from the source, consuming it.
    Token next();

    /// @brief Lex the whole buffer.
    /// @return Every token up to and including Eof, or up to and including
    ///         the Error token when lexing failed.
    std::vector<Token> tokenize();

    /// @brief True once a lexical error has been recorded.
    bool hasError() const
    {
        return error_.has_value();
    }

    /// @brief The recorded error; requires hasError().
    const CompileError &error() const
    {
        return *error_;
    }

    /// @brief Keyword kind for @p name, or nullopt when @p name is an identifier.
    static std::optional<TokenKind> lookupKeyword(const std::string &name);

  private:
    /// @name Character Access
    /// @{
    char peekChar() const;
    char peekChar(size_t offset) const;

    /// @brief Consume one character, updating line and column.
    char getChar();

    bool eof() const;
    support::SourceLoc currentLoc() const;
    /// @}

    /// @brief Record the first lexical error; later calls are ignored.
    void reportError(support::SourceLoc loc, std::string message, std::string_view code);

    /// @name Whitespace and Comments
    /// @{
    void skipWhitespaceAndComments();
    void skipLineComment();
    bool skipBlockComment();
    /// @}

    /// @name Token Lexing
    /// @{
    Token lexIdentifierOrKeyword();
    Token lexNumber();
    Token lexString();
    Token makeError(support::SourceLoc loc);
    /// @}

    std::string source_;
    uint32_t fileId_;
    size_t pos_ = 0;
    uint32_t line_ = 1;
    uint32_t column_ = 1;
    std::optional<CompileError> error_;
};

} // namespace rosella::frontends::script
