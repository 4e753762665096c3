//===----------------------------------------------------------------------===//
//
// Part of the Rosella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Both helpers walk the raw literal body once. A backslash followed by `\`,
// `"` or `/` is an escape and yields the second character unchanged; any
// other backslash is an ordinary character and, when normalizing, a path
// separator.
//
//===----------------------------------------------------------------------===//

#include "codegen/script/PathNormalizer.hpp"

namespace rosella::codegen::script
{

namespace
{

bool isEscapable(char c)
{
    return c == '\\' || c == '"' || c == '/';
}

std::string decode(std::string_view raw, bool normalize, Target target)
{
    const char separator = target == Target::Batch ? '\\' : '/';

    std::string out;
    out.reserve(raw.size());
    for (size_t i = 0; i < raw.size(); ++i)
    {
        const char c = raw[i];
        if (c == '\\' && i + 1 < raw.size() && isEscapable(raw[i + 1]))
        {
            out.push_back(raw[++i]);
            continue;
        }
        if (normalize && (c == '/' || c == '\\'))
        {
            out.push_back(separator);
            continue;
        }
        out.push_back(c);
    }
    return out;
}

} // namespace

std::string decodeStringLiteral(std::string_view raw)
{
    return decode(raw, false, Target::Shell);
}

std::string normalizePathLiteral(std::string_view raw, Target target)
{
    return decode(raw, true, target);
}

} // namespace rosella::codegen::script
