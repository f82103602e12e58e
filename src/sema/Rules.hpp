//===----------------------------------------------------------------------===//
//
// Part of the Isle project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: sema/Rules.hpp
// Purpose: Declares the type-checked rule representation consumed by code
//          generation.
// Key invariants: Every pattern and expression carries its resolved TypeId;
//                 extractor macros are already expanded; variables are
//                 numbered densely per rule.
// Ownership/Lifetime: Nodes own their children by value.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "dsl/Lexer.hpp"
#include "sema/Env.hpp"
#include "support/source_location.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace isle::sema
{

using VarId = uint32_t;

/// @brief Variable introduced by a pattern or let binding.
struct VarInfo
{
    std::string name;
    TypeId type{kBoolType};
};

/// @brief Type-checked pattern.
struct CheckedPattern
{
    enum class Kind
    {
        Wildcard,  ///< Matches anything.
        BindVar,   ///< Binds `var`, then matches args[0] when present.
        EqVar,     ///< Value must equal the earlier binding of `var`.
        ConstInt,  ///< Value must equal `intValue`.
        ConstBool, ///< Value must equal `boolValue`.
        Variant,   ///< Enum tag test of `term`; args match the fields.
        Extractor, ///< Extern extractor `term`; args match its results.
        And,       ///< All args must match.
    };

    Kind kind{Kind::Wildcard};
    TypeId type{kBoolType};
    isle::support::SourceLoc loc;
    VarId var{0};
    dsl::IntLiteral intValue;
    bool boolValue{false};
    TermId term{0};
    std::vector<CheckedPattern> args;
};

struct CheckedLet;

/// @brief Type-checked expression.
struct CheckedExpr
{
    enum class Kind
    {
        Var,
        ConstInt,
        ConstBool,
        Call, ///< Constructor call of `term`.
        Let,  ///< Bindings in `lets`, body in args[0].
    };

    Kind kind{Kind::Var};
    TypeId type{kBoolType};
    isle::support::SourceLoc loc;
    VarId var{0};
    dsl::IntLiteral intValue;
    bool boolValue{false};
    TermId term{0};
    std::vector<CheckedExpr> args;
    std::vector<CheckedLet> lets;
};

struct CheckedLet
{
    VarId var{0};
    CheckedExpr value;
};

/// @brief Type-checked `(if-let pat expr)` guard.
struct CheckedGuard
{
    CheckedPattern pattern;
    CheckedExpr expr;
};

/// @brief Type-checked rule for the constructor of `root`.
struct CheckedRule
{
    TermId root{0};
    std::optional<std::string> name;
    int64_t prio{0};
    size_t order{0}; ///< Position in the logical rule set, for stable ordering.
    std::vector<CheckedPattern> args; ///< One pattern per root argument.
    std::vector<CheckedGuard> guards;
    CheckedExpr result;
    std::vector<VarInfo> vars;
    isle::support::SourceLoc loc;
};

} // namespace isle::sema
