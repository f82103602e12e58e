//===----------------------------------------------------------------------===//
//
// Part of the Isle project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diag_expected.hpp
// Purpose: Expected<T>, the return type of operations that either produce a
//          value or fail with a single diagnostic (file loading, argument
//          parsing).
// Key invariants: Exactly one of value and diagnostic is present.
// Ownership/Lifetime: Owns whichever alternative it holds.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diagnostics.hpp"

#include <type_traits>
#include <utility>
#include <variant>

namespace isle::support
{

using Diag = Diagnostic;

/// @brief A value of type @p T, or the diagnostic explaining why there is none.
template <class T> class Expected
{
  public:
    /// @brief Success. Disabled for Diag so the failure constructor is chosen.
    template <class U = T,
              class = std::enable_if_t<!std::is_same_v<std::decay_t<U>, Diag> &&
                                       !std::is_same_v<std::decay_t<U>, Expected>>>
    Expected(U &&value) : state_(std::in_place_index<0>, std::forward<U>(value))
    {
    }

    /// @brief Failure carrying @p diag.
    Expected(Diag diag) : state_(std::in_place_index<1>, std::move(diag)) {}

    [[nodiscard]] bool hasValue() const
    {
        return state_.index() == 0;
    }

    explicit operator bool() const
    {
        return hasValue();
    }

    /// @pre hasValue()
    T &value()
    {
        return std::get<0>(state_);
    }

    /// @pre hasValue()
    const T &value() const
    {
        return std::get<0>(state_);
    }

    /// @pre !hasValue()
    const Diag &error() const
    {
        return std::get<1>(state_);
    }

  private:
    std::variant<T, Diag> state_;
};

} // namespace isle::support
