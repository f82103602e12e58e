//===----------------------------------------------------------------------===//
//
// Part of the Isle project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/common/ArgvView.hpp
// Purpose: Borrowed view of a main()-style argument vector.
// Key invariants: A null vector or a non-positive count is an empty view.
// Ownership/Lifetime: The strings belong to the caller and must outlive the view.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <string_view>

namespace isle::tools
{

class ArgvView
{
  public:
    ArgvView(int argc, char **argv)
        : args_(argv), count_(argv != nullptr && argc > 0 ? static_cast<size_t>(argc) : 0)
    {
    }

    size_t size() const
    {
        return count_;
    }

    bool empty() const
    {
        return count_ == 0;
    }

    /// @brief Program name, or "" when the runtime supplied none.
    std::string_view program() const
    {
        return (*this)[0];
    }

    /// @brief Argument @p i; out-of-range or null entries read as "".
    std::string_view operator[](size_t i) const
    {
        if (i >= count_ || args_[i] == nullptr)
            return {};
        return args_[i];
    }

    /// @brief The arguments after the program name.
    ArgvView operands() const
    {
        if (count_ <= 1)
            return ArgvView(0, nullptr);
        return ArgvView(static_cast<int>(count_ - 1), args_ + 1);
    }

  private:
    char **args_;
    size_t count_;
};

} // namespace isle::tools
