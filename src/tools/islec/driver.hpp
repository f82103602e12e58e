//===----------------------------------------------------------------------===//
//
// Part of the Isle project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Declares the reusable workflow behind the `islec` executable. The entry
// point takes the rule compiler and both output streams as parameters so
// tests can drive the CLI without spawning a process.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "codegen/CodegenOptions.hpp"
#include "compile/RuleCompiler.hpp"
#include "tools/common/ArgvView.hpp"

#include <iosfwd>

namespace isle::tools::islec
{

/// Generated code is Zig.
inline constexpr isle::codegen::CodegenTarget kDriverTarget = isle::codegen::CodegenTarget::Zig;

/// Keep the file-wide pragma line in the generated header.
inline constexpr bool kDriverExcludeGlobalAllowPragmas = false;

/// Header line written to stderr before the error rendering.
inline constexpr const char *kCompileFailedHeader = "ISLE compilation failed:";

/// @brief Options used for every islec run; prefixes are always empty.
isle::codegen::CodegenOptions makeDriverOptions();

/// @brief Execute the islec CLI workflow.
/// @param args Full argument vector; element 0 is the program name.
/// @param compiler Rule compiler invoked exactly once when arguments are valid.
/// @param out Receives the generated code followed by one newline on success.
/// @param err Receives the usage line or the compile error rendering.
/// @return 0 on success; 1 on a usage error or compile failure.
int runCLI(ArgvView args,
           isle::compile::RuleCompiler &compiler,
           std::ostream &out,
           std::ostream &err);

} // namespace isle::tools::islec
