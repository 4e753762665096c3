//===----------------------------------------------------------------------===//
//
// Part of the Rosella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/script/PathNormalizer.hpp
// Purpose: Decode string literal bodies and rewrite path separators for the
//          active target.
// Key invariants: Escaped characters (`\\`, `\"`, `\/`) are decoded verbatim
//                 and never rewritten.
// Ownership/Lifetime: Stateless free functions.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/script/Options.hpp"

#include <string>
#include <string_view>

namespace rosella::codegen::script
{

using frontends::script::Target;

/// @brief Decode the escapes of a raw literal body without touching separators.
std::string decodeStringLiteral(std::string_view raw);

/// @brief Decode @p raw and rewrite every unescaped `/` or `\` to the
///        separator of @p target (`\` for Batch, `/` for Shell).
std::string normalizePathLiteral(std::string_view raw, Target target);

} // namespace rosella::codegen::script
