//===----------------------------------------------------------------------===//
//
// Part of the Isle project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: dsl/AST.hpp
// Purpose: Declares the syntax tree for rule files: type, decl, extern,
//          extractor and rule definitions together with their patterns and
//          expressions.
// Key invariants: All nodes carry the SourceLoc of their first token.
// Ownership/Lifetime: Nodes own their children by value.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "dsl/Lexer.hpp"
#include "support/source_location.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace isle::dsl
{

/// @brief Name together with the location it was spelled at.
struct Ident
{
    std::string name;
    isle::support::SourceLoc loc;
};

/// @brief Left-hand side pattern.
struct Pattern
{
    enum class Kind
    {
        Wildcard,  ///< `_`
        Var,       ///< `x`; binds on first use, compares on later uses
        Bind,      ///< `x @ pat`; args[0] is the subpattern
        ConstInt,  ///< integer literal
        ConstBool, ///< `true` / `false`
        Term,      ///< `(term arg...)`
        And,       ///< `(and pat...)`
    };

    Kind kind{Kind::Wildcard};
    isle::support::SourceLoc loc;
    std::string name; ///< Variable or term name.
    IntLiteral intValue;
    bool boolValue{false};
    std::vector<Pattern> args;
};

struct LetBinding;

/// @brief Right-hand side expression.
struct Expr
{
    enum class Kind
    {
        Var,       ///< bound variable
        ConstInt,  ///< integer literal
        ConstBool, ///< `true` / `false`
        Term,      ///< `(term arg...)`
        Let,       ///< `(let ((v Ty e)...) body)`; args[0] is the body
    };

    Kind kind{Kind::Var};
    isle::support::SourceLoc loc;
    std::string name;
    IntLiteral intValue;
    bool boolValue{false};
    std::vector<Expr> args;
    std::vector<LetBinding> lets;
};

/// @brief One `(v Ty e)` binding of a let expression.
struct LetBinding
{
    Ident var;
    Ident type;
    Expr value;
};

/// @brief Field of an enum variant.
struct Field
{
    Ident name;
    Ident type;
};

/// @brief Enum variant with zero or more named fields.
struct Variant
{
    Ident name;
    std::vector<Field> fields;
};

/// @brief `(type Name [extern] [nodebug] (primitive P) | (enum ...))`.
struct TypeDef
{
    enum class Kind
    {
        Primitive,
        Enum
    };

    Ident name;
    bool isExtern{false};
    bool nodebug{false};
    Kind kind{Kind::Primitive};
    Ident primitive;
    std::vector<Variant> variants;
    isle::support::SourceLoc loc;
};

/// @brief `(decl [pure] [partial] Name (ArgTy...) RetTy)`.
struct Decl
{
    Ident term;
    std::vector<Ident> argTypes;
    Ident retType;
    bool pure{false};
    bool partial{false};
    isle::support::SourceLoc loc;
};

/// @brief `(extern constructor T f)` / `(extern extractor [infallible] T f)`.
struct ExternDef
{
    enum class Kind
    {
        Constructor,
        Extractor
    };

    Kind kind{Kind::Constructor};
    Ident term;
    Ident func;
    bool infallible{false};
    isle::support::SourceLoc loc;
};

/// @brief `(extractor (Term param...) template)` extractor macro.
struct ExtractorDef
{
    Ident term;
    std::vector<Ident> params;
    Pattern body;
    isle::support::SourceLoc loc;
};

/// @brief `(if-let pat expr)` or `(if expr)` guard of a rule.
/// @details `(if expr)` is stored with a wildcard pattern.
struct Guard
{
    Pattern pattern;
    Expr expr;
    isle::support::SourceLoc loc;
};

/// @brief `(rule [Name] [Prio] pattern guard... expr)`.
struct Rule
{
    std::optional<Ident> name;
    int64_t prio{0};
    Pattern pattern;
    std::vector<Guard> guards;
    Expr expr;
    isle::support::SourceLoc loc;
};

using Def = std::variant<TypeDef, Decl, ExternDef, ExtractorDef, Rule>;

/// @brief Location of the opening parenthesis of @p def.
isle::support::SourceLoc defLoc(const Def &def);

} // namespace isle::dsl
