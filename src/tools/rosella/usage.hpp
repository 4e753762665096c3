//===----------------------------------------------------------------------===//
//
// Part of the Rosella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/rosella/usage.hpp
// Purpose: Declarations for rosella help and version text.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <ostream>

namespace rosella::tools
{

/// @brief Print the synopsis and option list to @p os.
void printUsage(std::ostream &os);

/// @brief Print the version banner to stdout.
void printVersion();

} // namespace rosella::tools
