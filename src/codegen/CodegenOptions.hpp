//===----------------------------------------------------------------------===//
//
// Part of the Isle project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/CodegenOptions.hpp
// Purpose: Options that steer code generation for a compiled rule set.
// Key invariants: Default-constructed options select the Zig target with the
//                 global pragma line enabled and no name prefixes.
// Ownership/Lifetime: Plain value type.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string>
#include <vector>

namespace isle::codegen
{

/// @brief Output language of the generated matcher code.
enum class CodegenTarget
{
    Zig,
};

/// @brief Knobs forwarded from the driver to the emitter.
struct CodegenOptions
{
    CodegenTarget target{CodegenTarget::Zig};

    /// When true, omit the file-wide pragma line from the generated header.
    bool excludeGlobalAllowPragmas{false};

    /// Segments joined into every generated constructor name.
    std::vector<std::string> prefixes;

    bool operator==(const CodegenOptions &other) const = default;
};

} // namespace isle::codegen
