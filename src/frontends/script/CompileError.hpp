//===----------------------------------------------------------------------===//
//
// Part of the Rosella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/script/CompileError.hpp
// Purpose: The single error value produced by a failed compilation.
// Key invariants: Every stage stops at its first error; a compilation carries
//                 at most one CompileError.
// Ownership/Lifetime: Value type.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diagnostics.hpp"
#include "support/source_location.hpp"

#include <string>
#include <string_view>

namespace rosella::frontends::script
{

/// @brief Stage that rejected the program.
enum class ErrorKind
{
    Lex,     ///< Malformed token.
    Syntax,  ///< Grammar violation.
    Name,    ///< Undeclared or conflicting identifier.
    Type,    ///< Operator or call applied to incompatible types.
    Codegen, ///< AST shape with no rendering in the target dialect.
};

/// @brief Printable name of @p kind, e.g. "NameError".
const char *errorKindName(ErrorKind kind);

/// @brief Error reported by any compilation stage.
struct CompileError
{
    ErrorKind kind = ErrorKind::Syntax;
    support::SourceLoc loc{};

    /// Human-readable description without position or kind prefix.
    std::string message;

    /// Offending identifier (NameError) or found token text (SyntaxError).
    std::string subject{};

    /// What the parser expected instead; empty for other kinds.
    std::string expected{};

    /// Stable code from DiagnosticCodes.hpp.
    std::string_view code{};

    /// @brief One-line rendering: "NameError: use of undeclared identifier 'y'".
    std::string describe() const;

    /// @brief Convert to an error-severity diagnostic carrying @ref code.
    support::Diagnostic toDiagnostic() const;
};

} // namespace rosella::frontends::script
