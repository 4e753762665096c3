//===----------------------------------------------------------------------===//
//
// Part of the Rosella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "frontends/script/Options.hpp"
#include "frontends/common/CharUtils.hpp"

#include <array>
#include <string>

namespace rosella::frontends::script
{

namespace
{

struct TargetAlias
{
    std::string_view name;
    Target target;
};

constexpr std::array<TargetAlias, 9> kTargetAliases = {{
    {"bash", Target::Shell},
    {"bat", Target::Batch},
    {"batch", Target::Batch},
    {"cmd", Target::Batch},
    {"linux", Target::Shell},
    {"sh", Target::Shell},
    {"shell", Target::Shell},
    {"unix", Target::Shell},
    {"windows", Target::Batch},
}};

} // namespace

const char *targetName(Target target)
{
    return target == Target::Batch ? "batch" : "shell";
}

const char *targetExtension(Target target)
{
    return target == Target::Batch ? ".bat" : ".sh";
}

std::optional<Target> parseTargetName(std::string_view name)
{
    const std::string lowered = common::char_utils::toLowercase(name);
    for (const auto &alias : kTargetAliases)
    {
        if (alias.name == lowered)
            return alias.target;
    }
    return std::nullopt;
}

} // namespace rosella::frontends::script
