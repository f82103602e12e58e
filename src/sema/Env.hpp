//===----------------------------------------------------------------------===//
//
// Part of the Isle project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: sema/Env.hpp
// Purpose: Declares the type and term environments built by semantic analysis.
// Key invariants: TypeId 0 is the builtin `bool`; ids are dense indices in
//                 registration order; names are unique within each environment.
// Ownership/Lifetime: Environments own all type and term records.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace isle::sema
{

using TypeId = uint32_t;
using TermId = uint32_t;

/// @brief The builtin boolean type, always registered first.
inline constexpr TypeId kBoolType = 0;

/// @brief Named field of an enum variant.
struct FieldInfo
{
    std::string name;
    TypeId type{kBoolType};
};

/// @brief Enum variant together with the term that constructs/extracts it.
struct VariantInfo
{
    std::string name;
    std::vector<FieldInfo> fields;
    TermId term{0};
};

/// @brief A type known to the rule set.
struct TypeInfo
{
    enum class Kind
    {
        Builtin,
        Primitive,
        Enum
    };

    Kind kind{Kind::Primitive};
    std::string name;
    std::string primitive; ///< Target spelling for Primitive/Builtin kinds.
    bool isExtern{false};
    std::vector<VariantInfo> variants;
    isle::support::SourceLoc loc;
};

/// @brief How a term is built when it appears in an expression.
enum class ConstructorKind
{
    None,     ///< Term cannot appear in expressions.
    Internal, ///< Rules define it; a generated function implements it.
    Extern,   ///< Implemented by a context method.
    Variant,  ///< Builds an enum variant.
};

/// @brief How a term is matched when it appears in a pattern.
enum class ExtractorKind
{
    None,    ///< Term cannot appear in patterns.
    Extern,  ///< Implemented by a context method.
    Macro,   ///< Expanded from an `(extractor ...)` template.
    Variant, ///< Matches an enum variant.
};

/// @brief A declared term.
struct TermInfo
{
    std::string name;
    std::vector<TypeId> argTypes;
    TypeId retType{kBoolType};
    bool pure{false};
    bool partial{false};
    isle::support::SourceLoc loc;

    ConstructorKind constructor{ConstructorKind::None};
    std::string externConstructor;
    isle::support::SourceLoc constructorLoc;

    ExtractorKind extractor{ExtractorKind::None};
    std::string externExtractor;
    bool infallible{false};
    size_t macro{0}; ///< Index into the macro table when extractor == Macro.
    isle::support::SourceLoc extractorLoc;

    /// Owning enum type and variant index when the term is an enum variant.
    TypeId enumType{kBoolType};
    uint32_t variantIndex{0};
};

/// @brief Registry of all types, keyed by name.
class TypeEnv
{
  public:
    TypeEnv();

    /// @brief Register @p info; returns std::nullopt when the name is taken.
    std::optional<TypeId> add(TypeInfo info);

    std::optional<TypeId> lookup(std::string_view name) const;

    const TypeInfo &get(TypeId id) const
    {
        return types_[id];
    }

    TypeInfo &get(TypeId id)
    {
        return types_[id];
    }

    size_t size() const
    {
        return types_.size();
    }

  private:
    std::vector<TypeInfo> types_;
    std::unordered_map<std::string, TypeId> byName_;
};

/// @brief Registry of all terms, keyed by name.
class TermEnv
{
  public:
    /// @brief Register @p info; returns std::nullopt when the name is taken.
    std::optional<TermId> add(TermInfo info);

    std::optional<TermId> lookup(std::string_view name) const;

    const TermInfo &get(TermId id) const
    {
        return terms_[id];
    }

    TermInfo &get(TermId id)
    {
        return terms_[id];
    }

    size_t size() const
    {
        return terms_.size();
    }

  private:
    std::vector<TermInfo> terms_;
    std::unordered_map<std::string, TermId> byName_;
};

} // namespace isle::sema
