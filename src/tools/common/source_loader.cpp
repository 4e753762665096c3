//===----------------------------------------------------------------------===//
//
// Part of the Rosella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/common/source_loader.cpp
// Purpose: Read a source file into memory for the rosella tool.
// Key invariants: A file is registered with the SourceManager only after it
//                 was read completely.
//
//===----------------------------------------------------------------------===//

#include "tools/common/source_loader.hpp"
#include "frontends/script/DiagnosticCodes.hpp"

#include <fstream>
#include <sstream>

namespace rosella::tools::common
{

namespace
{

support::Diagnostic ioError(std::string message)
{
    return support::makeError(
        {}, std::move(message), std::string(frontends::script::diag::UnreadableFile));
}

} // namespace

support::Expected<LoadedSource> loadSourceBuffer(const std::string &path,
                                                 support::SourceManager &sm)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return support::Expected<LoadedSource>(ioError("unable to open " + path));

    in.seekg(0, std::ios::end);
    const auto fileSize = in.tellg();
    in.seekg(0, std::ios::beg);
    if (fileSize < 0 || static_cast<std::size_t>(fileSize) > kMaxSourceSize)
        return support::Expected<LoadedSource>(
            ioError("source file too large: " + path + " (limit: 16 MB)"));

    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad())
        return support::Expected<LoadedSource>(ioError("error reading " + path));

    const uint32_t fileId = sm.addFile(path);
    if (fileId == 0)
        return support::Expected<LoadedSource>(ioError("too many source files"));

    LoadedSource source{};
    source.buffer = ss.str();
    source.fileId = fileId;
    return support::Expected<LoadedSource>(std::move(source));
}

} // namespace rosella::tools::common
