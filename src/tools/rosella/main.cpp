//===----------------------------------------------------------------------===//
//
// Part of the Rosella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Main entry point for the rosella command-line tool.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Entry point for the `rosella` CLI tool.

#include "cli.hpp"

int main(int argc, char **argv)
{
    return rosella::tools::runRosella(argc, argv);
}
