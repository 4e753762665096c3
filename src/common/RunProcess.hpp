//===----------------------------------------------------------------------===//
//
// Part of the Rosella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: common/RunProcess.hpp
// Purpose: Declare the process execution helper used by the end-to-end and
//          CLI tests to run generated scripts and the rosella binary.
// Key invariants: RunResult captures the exit code and the output text.
// Ownership/Lifetime: Callers own argument buffers; the helper copies the
//                     command text it builds.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rosella::common
{

/// @brief Result of launching a subprocess.
struct RunResult
{
    int exit_code;   ///< Process exit code, or -1 when the launch failed.
    std::string out; ///< Captured standard output text.
    std::string err; ///< Captured standard error text.
};

/// @brief Spawn a subprocess through the host `/bin/sh`.
/// @param argv Command-line arguments including the executable at index zero.
/// @param cwd Optional working directory for the child.
/// @param env Environment variables set for the child only.
/// @return Captured process result including exit code and both streams.
RunResult run_process(const std::vector<std::string> &argv,
                      std::optional<std::string> cwd = std::nullopt,
                      const std::vector<std::pair<std::string, std::string>> &env = {});

/// @brief Quote @p arg for a POSIX shell command line.
std::string quote_posix_argument(const std::string &arg);

} // namespace rosella::common
