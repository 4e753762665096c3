//===----------------------------------------------------------------------===//
//
// Part of the Rosella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/common/ScopeTracker.hpp
// Purpose: Lexical scope stack mapping source names to symbol ids.
//
// Key features:
// - Scope stack: push/pop frames for blocks, function bodies and loop bodies
// - Shadowing: binding a name again replaces it in the innermost frame only
// - Name resolution: look up names from innermost to outermost frame
// - RAII scope guards: automatic scope management via ScopedScope
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace rosella::frontends::common
{

/// @brief Lexical scope tracker resolving names to symbol ids.
/// @details Each frame maps a source name to the id of the binding currently
///          visible under that name. Outer frames are never modified by
///          binds performed in inner frames.
class ScopeTracker
{
  public:
    using SymbolId = uint32_t;

    /// @brief RAII guard pushing a frame on construction and popping it on destruction.
    class ScopedScope
    {
      public:
        explicit ScopedScope(ScopeTracker &st) : st_(st)
        {
            st_.pushScope();
        }

        ~ScopedScope()
        {
            st_.popScope();
        }

        ScopedScope(const ScopedScope &) = delete;
        ScopedScope &operator=(const ScopedScope &) = delete;
        ScopedScope(ScopedScope &&) = delete;
        ScopedScope &operator=(ScopedScope &&) = delete;

      private:
        ScopeTracker &st_;
    };

    void reset()
    {
        stack_.clear();
    }

    /// @brief Push a new empty scope onto the stack.
    void pushScope()
    {
        stack_.emplace_back();
    }

    /// @brief Pop the innermost scope if one exists.
    void popScope()
    {
        if (!stack_.empty())
            stack_.pop_back();
    }

    /// @brief Bind @p name to @p id in the innermost scope, replacing any
    ///        earlier binding of the same name in that scope.
    void bind(const std::string &name, SymbolId id)
    {
        if (!stack_.empty())
            stack_.back()[name] = id;
    }

    /// @brief Check if a name is declared in the current (innermost) scope.
    [[nodiscard]] bool isDeclaredInCurrentScope(const std::string &name) const
    {
        return !stack_.empty() && stack_.back().contains(name);
    }

    /// @brief Resolve a name by searching from innermost to outermost scope.
    [[nodiscard]] std::optional<SymbolId> resolve(const std::string &name) const
    {
        for (auto it = stack_.rbegin(); it != stack_.rend(); ++it)
        {
            auto found = it->find(name);
            if (found != it->end())
                return found->second;
        }
        return std::nullopt;
    }

    /// @brief Number of scopes on the stack; 1 means the global frame.
    [[nodiscard]] std::size_t depth() const
    {
        return stack_.size();
    }

  private:
    std::vector<std::unordered_map<std::string, SymbolId>> stack_;
};

} // namespace rosella::frontends::common
