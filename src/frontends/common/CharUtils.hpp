//===----------------------------------------------------------------------===//
//
// Part of the Rosella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/common/CharUtils.hpp
// Purpose: Character classification utilities for the lexer and the name
//          allocators.
//
// Only ASCII is classified; every byte >= 0x80 is rejected by the lexer
// outside of string literals and comments.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string>
#include <string_view>

namespace rosella::frontends::common::char_utils
{

/// @brief Check if character is an ASCII letter (A-Z, a-z).
[[nodiscard]] constexpr bool isLetter(char c) noexcept
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

/// @brief Check if character is a decimal digit (0-9).
[[nodiscard]] constexpr bool isDigit(char c) noexcept
{
    return c >= '0' && c <= '9';
}

/// @brief Check if character can start an identifier (letter or underscore).
[[nodiscard]] constexpr bool isIdentifierStart(char c) noexcept
{
    return isLetter(c) || c == '_';
}

/// @brief Check if character can continue an identifier (letter, digit, or underscore).
[[nodiscard]] constexpr bool isIdentifierContinue(char c) noexcept
{
    return isLetter(c) || isDigit(c) || c == '_';
}

/// @brief Check if character is horizontal whitespace (space or tab).
[[nodiscard]] constexpr bool isHorizontalWhitespace(char c) noexcept
{
    return c == ' ' || c == '\t';
}

/// @brief Check if character is a newline (CR or LF).
[[nodiscard]] constexpr bool isNewline(char c) noexcept
{
    return c == '\r' || c == '\n';
}

/// @brief Convert ASCII character to lowercase.
[[nodiscard]] constexpr char toLower(char c) noexcept
{
    if (c >= 'A' && c <= 'Z')
        return static_cast<char>(c + ('a' - 'A'));
    return c;
}

/// @brief Convert string to lowercase (ASCII only).
[[nodiscard]] inline std::string toLowercase(std::string_view s)
{
    std::string result;
    result.reserve(s.size());
    for (char c : s)
    {
        result.push_back(toLower(c));
    }
    return result;
}

} // namespace rosella::frontends::common::char_utils
