//===----------------------------------------------------------------------===//
//
// Part of the Rosella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/rosella/cli.hpp
// Purpose: Command-line parsing and the `compile` command of the rosella tool.
// Key invariants: Every requested target is compiled before any output file
//                 is written; a failure writes nothing.
// Ownership/Lifetime: Configurations are plain values owned by the caller.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/script/Options.hpp"
#include "support/diag_expected.hpp"

#include <string>
#include <vector>

namespace rosella::tools
{

/// @brief Process exit codes of the rosella tool.
enum ExitCode : int
{
    kExitSuccess = 0,
    kExitCompileError = 1, ///< Compile error or I/O failure.
    kExitUsageError = 2,
};

enum class CliAction
{
    Compile,
    Help,
    Version,
};

/// @brief Settings of one `rosella compile` invocation.
struct CompileConfig
{
    std::string inputPath;
    /// Explicit output path; empty selects `<stem><ext>` next to the input.
    std::string outputPath;
    /// Targets in output order; shell first when both are requested.
    std::vector<frontends::script::Target> targets;
    /// Shared options; the target field is set per compilation.
    frontends::script::CompilerOptions options;
};

struct CliCommand
{
    CliAction action = CliAction::Help;
    CompileConfig compile;
};

/// @brief Parse the full argument vector, program name included.
/// @return The command, or a diagnostic describing the usage error.
support::Expected<CliCommand> parseCommandLine(int argc, char **argv);

/// @brief `<dir>/<stem>.sh` or `<dir>/<stem>.bat` for @p inputPath.
std::string defaultOutputPath(const std::string &inputPath, frontends::script::Target target);

/// @brief Compile the input for every target, then write the outputs.
/// @return kExitSuccess, or kExitCompileError after printing a diagnostic.
int runCompile(const CompileConfig &config);

/// @brief Entry point shared by main() and the tests.
int runRosella(int argc, char **argv);

} // namespace rosella::tools
