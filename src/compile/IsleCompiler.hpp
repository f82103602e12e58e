//===----------------------------------------------------------------------===//
//
// Part of the Isle project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares IsleCompiler, the RuleCompiler that runs the complete
// pipeline over rule files on disk:
//   load -> Lexer -> Parser -> Sema -> ZigEmitter
//
// Each phase reports into one DiagnosticEngine. A phase that reports an error
// ends the run after that phase, so every error of the failing phase is
// returned together.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "compile/RuleCompiler.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace isle::compile
{

class IsleCompiler : public RuleCompiler
{
  public:
    CompileResult compile(const std::vector<std::string> &files,
                          const isle::codegen::CodegenOptions &options) override;
};

/// @brief Compile in-memory rule text; @p path names it in diagnostics.
/// @details Used by tests and tools that already hold the source text.
CompileResult compileSource(std::string_view source,
                            std::string_view path,
                            const isle::codegen::CodegenOptions &options);

} // namespace isle::compile
