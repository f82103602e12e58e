//===----------------------------------------------------------------------===//
//
// Part of the Isle project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: sema/Env.cpp
// Purpose: Implements the type and term registries.
//
//===----------------------------------------------------------------------===//

#include "sema/Env.hpp"

#include <utility>

namespace isle::sema
{

TypeEnv::TypeEnv()
{
    TypeInfo boolType;
    boolType.kind = TypeInfo::Kind::Builtin;
    boolType.name = "bool";
    boolType.primitive = "bool";
    add(std::move(boolType));
}

std::optional<TypeId> TypeEnv::add(TypeInfo info)
{
    if (byName_.count(info.name) != 0)
        return std::nullopt;
    const auto id = static_cast<TypeId>(types_.size());
    byName_.emplace(info.name, id);
    types_.push_back(std::move(info));
    return id;
}

std::optional<TypeId> TypeEnv::lookup(std::string_view name) const
{
    auto it = byName_.find(std::string(name));
    if (it == byName_.end())
        return std::nullopt;
    return it->second;
}

std::optional<TermId> TermEnv::add(TermInfo info)
{
    if (byName_.count(info.name) != 0)
        return std::nullopt;
    const auto id = static_cast<TermId>(terms_.size());
    byName_.emplace(info.name, id);
    terms_.push_back(std::move(info));
    return id;
}

std::optional<TermId> TermEnv::lookup(std::string_view name) const
{
    auto it = byName_.find(std::string(name));
    if (it == byName_.end())
        return std::nullopt;
    return it->second;
}

} // namespace isle::sema
