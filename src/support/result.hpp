//===----------------------------------------------------------------------===//
//
// Part of the Isle project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/result.hpp
// Purpose: Result<T, E>, a value or an error payload of any type. Used where
//          a failure carries more than one diagnostic, such as a whole
//          compilation run.
// Key invariants: Holds exactly one alternative, even when T and E coincide.
// Ownership/Lifetime: Owns the alternative it holds.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <variant>

namespace isle::support
{

template <typename T, typename E = std::string> class Result
{
  public:
    template <typename U> static Result success(U &&value)
    {
        return Result(std::in_place_index<0>, std::forward<U>(value));
    }

    template <typename U> static Result failure(U &&error)
    {
        return Result(std::in_place_index<1>, std::forward<U>(error));
    }

    bool isOk() const
    {
        return alt_.index() == 0;
    }

    /// @pre isOk()
    T &value()
    {
        return std::get<0>(alt_);
    }

    /// @pre isOk()
    const T &value() const
    {
        return std::get<0>(alt_);
    }

    /// @pre !isOk()
    const E &error() const
    {
        return std::get<1>(alt_);
    }

  private:
    template <size_t I, typename U>
    Result(std::in_place_index_t<I> which, U &&payload) : alt_(which, std::forward<U>(payload))
    {
    }

    std::variant<T, E> alt_;
};

} // namespace isle::support
