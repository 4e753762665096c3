//===----------------------------------------------------------------------===//
//
// Part of the Rosella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/common/source_loader.hpp
// Purpose: Load a Rosella source file and register it for diagnostics.
// Key invariants: LoadedSource captures the complete file contents and its
//                 SourceManager id.
// Ownership/Lifetime: The caller owns the returned LoadedSource.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"
#include "support/source_manager.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace rosella::tools::common
{

/// @brief Largest source file the tool accepts.
inline constexpr std::size_t kMaxSourceSize = 16u * 1024 * 1024;

/// @brief Result of loading a source file into memory.
struct LoadedSource
{
    std::string buffer; ///< Full contents of the source file.
    uint32_t fileId{0}; ///< Identifier assigned by SourceManager.
};

/// @brief Load @p path into memory and register it with @p sm.
/// @return The buffer and file id; otherwise an R0001 diagnostic describing
///         the I/O failure, the size limit, or SourceManager overflow.
support::Expected<LoadedSource> loadSourceBuffer(const std::string &path,
                                                 support::SourceManager &sm);

} // namespace rosella::tools::common
