//===----------------------------------------------------------------------===//
//
// Part of the Rosella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Out-of-line validity query for SourceLoc. Lines and columns are optional and
// surfaced through hasLine() and hasColumn(); a location counts as valid only
// when it refers to a buffer registered with the SourceManager.
//
//===----------------------------------------------------------------------===//

#include "support/source_location.hpp"

namespace rosella::support
{
/// @brief Determine whether the location carries a registered file id.
/// @return True when the location originated from a tracked source buffer.
bool SourceLoc::isValid() const
{
    return file_id != 0;
}
} // namespace rosella::support
