//===----------------------------------------------------------------------===//
//
// Part of the Rosella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/common/ArgvView.hpp
// Purpose: Non-owning cursor over argv-style argument arrays.
// Key invariants: Never modifies or owns the underlying argument storage;
//                 the cursor never moves past argc.
// Ownership/Lifetime: Borrows pointers from the C runtime; callers must ensure
//                     validity through the view's lifetime.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <optional>
#include <string_view>

namespace rosella::tools
{

/// @brief Cursor over the arguments of one command invocation.
/// @details Flag parsers consume arguments left to right with next() and pull
///          the operand of a flag such as `-i <file>` with value().
class ArgvView
{
  public:
    ArgvView(int argc, char **argv) : argc_(argc < 0 ? 0 : argc), argv_(argv) {}

    /// @brief True when every argument has been consumed.
    [[nodiscard]] bool done() const
    {
        return argv_ == nullptr || pos_ >= argc_;
    }

    /// @brief Argument under the cursor, or an empty view when done.
    [[nodiscard]] std::string_view peek() const
    {
        return done() ? std::string_view{} : std::string_view(argv_[pos_]);
    }

    /// @brief Consume and return the argument under the cursor.
    std::string_view next()
    {
        std::string_view arg = peek();
        if (!done())
            ++pos_;
        return arg;
    }

    /// @brief Consume the operand following a flag.
    /// @return The operand, or std::nullopt when the arguments ran out.
    std::optional<std::string_view> value()
    {
        if (done())
            return std::nullopt;
        return next();
    }

    /// @brief Skip @p count arguments (e.g. the program name).
    ArgvView &skip(int count = 1)
    {
        pos_ = pos_ + count > argc_ ? argc_ : pos_ + count;
        return *this;
    }

  private:
    int argc_;
    char **argv_;
    int pos_ = 0;
};

} // namespace rosella::tools
