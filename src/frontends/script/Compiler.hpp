//===----------------------------------------------------------------------===//
//
// Part of the Rosella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Compiler.hpp
/// @brief Rosella compiler driver - runs the complete compilation pipeline.
///
/// @details The pipeline is:
///
/// 1. **Lexing** - Tokenize the whole source (Lexer)
/// 2. **Parsing** - Build the arena AST (Parser)
/// 3. **Semantic Analysis** - Scopes, storage names and types (Sema)
/// 4. **Emission** - Render the script for the selected target (ScriptEmitter)
///
/// Each phase stops at its first error. The error is returned in
/// CompilerResult::error and also reported to CompilerResult::diagnostics
/// as a single error diagnostic carrying its R-code.
///
/// ## Usage
///
/// ```cpp
/// SourceManager sm;
/// CompilerInput input{.source = text, .path = "hello.rsl"};
/// CompilerOptions options{};
/// options.target = Target::Batch;
/// CompilerResult result = compile(input, options, sm);
/// if (result.succeeded())
///     write(result.script);
/// else
///     result.diagnostics.printAll(std::cerr, &sm);
/// ```
///
/// Setting the environment variable `ROSELLA_DEBUG_COMPILE` prints the time
/// spent in each phase to stderr.
///
/// @invariant script is non-empty only when succeeded() is true.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/script/CompileError.hpp"
#include "frontends/script/Options.hpp"
#include "support/diagnostics.hpp"
#include "support/source_manager.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace rosella::frontends::script
{

/// @brief Input parameters describing the source to compile.
struct CompilerInput
{
    /// @brief Rosella source code to compile.
    std::string_view source;

    /// @brief Path used for diagnostics; defaults to "<input>" when empty.
    std::string_view path{"<input>"};

    /// @brief Existing file id within the supplied source manager, if any.
    std::optional<uint32_t> fileId{};
};

/// @brief Aggregated result of compiling Rosella source.
struct CompilerResult
{
    /// @brief Diagnostics reported during compilation (at most one error).
    support::DiagnosticEngine diagnostics{};

    /// @brief File identifier used for the compiled source.
    uint32_t fileId{0};

    /// @brief Generated script text.
    std::string script{};

    /// @brief The error that stopped compilation, if any.
    std::optional<CompileError> error{};

    /// @brief Helper indicating whether compilation succeeded without errors.
    [[nodiscard]] bool succeeded() const;
};

/// @brief Compile Rosella source text into a script.
/// @param input Source information describing the buffer to compile.
/// @param options Options selecting the target and emission details.
/// @param sm Source manager used for diagnostics.
/// @return Script text and diagnostics.
CompilerResult compile(const CompilerInput &input,
                       const CompilerOptions &options,
                       support::SourceManager &sm);

/// @brief Compile @p source for @p target with default options.
/// @details Uses a private SourceManager; locations in the result refer to
///          "<input>".
CompilerResult compile(std::string_view source, Target target);

} // namespace rosella::frontends::script
