//===----------------------------------------------------------------------===//
//
// Part of the Isle project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: dsl/AST.cpp
// Purpose: Out-of-line helpers for rule-file syntax tree nodes.
//
//===----------------------------------------------------------------------===//

#include "dsl/AST.hpp"

namespace isle::dsl
{

isle::support::SourceLoc defLoc(const Def &def)
{
    return std::visit([](const auto &d) { return d.loc; }, def);
}

} // namespace isle::dsl
