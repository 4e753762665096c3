//===----------------------------------------------------------------------===//
//
// Part of the Rosella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/common/NumberParsing.hpp
// Purpose: Parsing of unsigned decimal integer literals.
//
// Literals must fit the 32-bit signed range because batch `set /a`
// arithmetic is 32-bit; the shell target would accept more, but the two
// dialects have to agree on every value a program can spell.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <charconv>
#include <cstdint>
#include <string_view>
#include <system_error>

namespace rosella::frontends::common::number_parsing
{

/// @brief Largest integer literal accepted by the language.
inline constexpr int64_t kMaxIntLiteral = 2147483647;

/// @brief Result of parsing a numeric literal.
struct ParsedNumber
{
    int64_t intValue = 0;  ///< Parsed value (valid when @ref valid)
    bool overflow = false; ///< True if value exceeds kMaxIntLiteral
    bool valid = true;     ///< True if parsing succeeded
};

/// @brief Parse an unsigned decimal integer literal from @p text.
[[nodiscard]] inline ParsedNumber parseDecimalLiteral(std::string_view text)
{
    ParsedNumber result;

    if (text.empty())
    {
        result.valid = false;
        return result;
    }

    uint64_t unsignedValue = 0;
    auto parseResult = std::from_chars(text.data(), text.data() + text.size(), unsignedValue);

    if (parseResult.ec == std::errc::result_out_of_range ||
        (parseResult.ec == std::errc{} && unsignedValue > static_cast<uint64_t>(kMaxIntLiteral)))
    {
        result.overflow = true;
        result.valid = false;
    }
    else if (parseResult.ec != std::errc{} || parseResult.ptr != text.data() + text.size())
    {
        result.valid = false;
    }
    else
    {
        result.intValue = static_cast<int64_t>(unsignedValue);
    }

    return result;
}

} // namespace rosella::frontends::common::number_parsing
