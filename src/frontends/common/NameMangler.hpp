//===----------------------------------------------------------------------===//
//
// Part of the Rosella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/common/NameMangler.hpp
// Purpose: Deterministic generator for target-level names.
//
// Three kinds of names are produced:
// - storage names for user bindings, unique case-insensitively because batch
//   variable names ignore case;
// - per-statement temporaries (`__t1`, `__t2`, ...);
// - paired control-flow labels (`while_1`, `if_2`, ...).
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/common/CharUtils.hpp"

#include <string>
#include <unordered_map>
#include <unordered_set>

namespace rosella::frontends::common
{

/// @brief Generates deterministic names for storage, temporaries and labels.
/// @invariant A name returned by unique() is never returned again, in any case.
class NameMangler
{
  public:
    /// @brief Mark @p name as unavailable without handing it out.
    void reserve(const std::string &name)
    {
        taken_.insert(char_utils::toLowercase(name));
    }

    /// @brief Claim @p base if free, otherwise the first free `base_N` (N >= 1).
    std::string unique(const std::string &base)
    {
        std::string candidate = base;
        for (unsigned n = 1; taken_.contains(char_utils::toLowercase(candidate)); ++n)
            candidate = base + "_" + std::to_string(n);
        taken_.insert(char_utils::toLowercase(candidate));
        return candidate;
    }

    /// @brief Return next temporary name (e.g., "__t1", "__t2", ...).
    std::string nextTemp()
    {
        return tempPrefix_ + std::to_string(++tempCounter_);
    }

    /// @brief Restart temporary numbering; temporaries live for one statement.
    void resetTemps()
    {
        tempCounter_ = 0;
    }

    /// @brief Return a label based on @p hint, e.g. "while_1" then "while_2".
    std::string block(const std::string &hint)
    {
        auto &count = blockCounters_[hint];
        ++count;
        return hint + "_" + std::to_string(count);
    }

  private:
    std::string tempPrefix_ = "__t";

    unsigned tempCounter_ = 0;

    std::unordered_map<std::string, unsigned> blockCounters_;

    /// Lowercased names already handed out or reserved.
    std::unordered_set<std::string> taken_;
};

} // namespace rosella::frontends::common
