//===----------------------------------------------------------------------===//
//
// Part of the Rosella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AstPrinter.hpp
/// @brief Debug printer producing an indented tree dump of a Program.
///
/// @details Each node is printed on its own line with its kind, relevant
/// attributes and, optionally, its source location. Children are indented
/// two spaces deeper than their parent.
///
/// Example output:
/// @code
///   Program
///     FunctionDecl "add" (1:1)
///       Param "x" (1:8)
///       Param int "y" (1:15)
///       Block (1:18)
///         PrintStmt (2:5)
///           BinaryExpr (+) (2:13)
///             IdentExpr "x" (2:11)
///             IdentExpr "y" (2:15)
/// @endcode
///
/// @invariant Output is deterministic for reproducible test results.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/script/AST.hpp"

#include <string>

namespace rosella::frontends::script
{

/// @brief Produces a human-readable dump of a Program.
class AstPrinter
{
  public:
    /// @param showLocations Append "(line:col)" to every node.
    explicit AstPrinter(bool showLocations = true) : showLocations_(showLocations) {}

    /// @brief Dump the whole program tree.
    std::string dump(const Program &program) const;

  private:
    bool showLocations_;
};

} // namespace rosella::frontends::script
