//===----------------------------------------------------------------------===//
//
// Part of the Rosella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements usage and version output for the `rosella` CLI tool.

#include "usage.hpp"
#include "rosella/version.hpp"

#include <iostream>

namespace rosella::tools
{

void printVersion()
{
    std::cout << "rosella v" << ROSELLA_VERSION_STR << "\n";
    std::cout << "Rosella script compiler (targets: shell, batch)\n";
}

/// @brief Print usage information for the `rosella` command.
/// @details Usage errors print this to stderr; `--help` prints it to stdout.
void printUsage(std::ostream &os)
{
    os << "rosella v" << ROSELLA_VERSION_STR << " - Rosella Script Compiler\n"
       << "\n"
       << "Usage: rosella compile -i <file.rsl> [options]\n"
       << "       rosella --help | --version\n"
       << "\n"
       << "Options:\n"
       << "  -i, --input FILE               Source file to compile\n"
       << "  -o, --output FILE              Output file (single target only)\n"
       << "  --target shell|batch|both      Dialect to generate (default: both)\n"
       << "  --no-normalize-paths           Keep slashes in string literals as written\n"
       << "  --lf                           Use LF line endings for batch output\n"
       << "  --dump-tokens                  Print the token stream to stderr\n"
       << "  --dump-ast                     Print the parsed AST to stderr\n"
       << "  -h, --help                     Show this help message\n"
       << "  --version                      Show version information\n"
       << "\n"
       << "Without -o, outputs are written next to the input as <stem>.sh and\n"
       << "<stem>.bat.\n"
       << "\n"
       << "Examples:\n"
       << "  rosella compile -i hello.rsl                     Write hello.sh and hello.bat\n"
       << "  rosella compile -i hello.rsl --target sh -o run  Write ./run as POSIX sh\n"
       << "\n"
       << "Exit status: 0 on success, 1 on a compile or I/O error, 2 on a usage error.\n";
}

} // namespace rosella::tools
