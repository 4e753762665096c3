//===----------------------------------------------------------------------===//
//
// Part of the Rosella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Options.hpp
/// @brief Compiler options and target dialect selection.
///
/// @details CompilerOptions is populated from command-line flags by the
/// rosella driver and passed by const reference through the pipeline. The
/// emitter receives the subset it needs as EmitOptions.
///
/// @invariant Default-constructed CompilerOptions target the shell dialect
///            with path normalization enabled.
///
//===----------------------------------------------------------------------===//

#pragma once

#include <optional>
#include <string_view>

namespace rosella::frontends::script
{

/// @brief Output dialect.
enum class Target
{
    Shell, ///< POSIX sh.
    Batch, ///< Windows cmd.exe batch.
};

/// @brief Canonical lowercase name: "shell" or "batch".
const char *targetName(Target target);

/// @brief Output file extension including the dot: ".sh" or ".bat".
const char *targetExtension(Target target);

/// @brief Map a dialect name or alias (case-insensitive) to a Target.
/// @details Shell: shell, sh, bash, linux, unix. Batch: batch, bat, cmd, windows.
std::optional<Target> parseTargetName(std::string_view name);

/// @brief Options controlling one compilation.
struct CompilerOptions
{
    /// @brief Dialect of the generated script.
    Target target{Target::Shell};

    /// @brief Rewrite unescaped slashes in string literals to the target separator.
    bool normalizePaths{true};

    /// @brief Terminate batch lines with CRLF.
    bool batchCrlf{true};

    /// @brief Dump the token stream after lexing (for debugging).
    bool dumpTokens{false};

    /// @brief Dump AST after parsing (for debugging).
    bool dumpAst{false};
};

} // namespace rosella::frontends::script
