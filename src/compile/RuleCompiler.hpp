//===----------------------------------------------------------------------===//
//
// Part of the Isle project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the rule-compiler interface consumed by the islec
// driver, together with the error collection a failed compilation returns.
//
// A RuleCompiler turns an ordered list of rule files into one generated
// source text. The files form a single logical rule set, so a definition in
// one file may refer to names defined in any other.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "codegen/CodegenOptions.hpp"
#include "support/diagnostics.hpp"
#include "support/result.hpp"
#include "support/source_manager.hpp"

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace isle::compile
{

/// @brief Non-empty collection of diagnostics from a failed compilation.
/// @details Carries the source manager that assigned the file ids so the
///          collection can be rendered after the compiler is gone.
class CompileErrors
{
  public:
    CompileErrors(std::vector<isle::support::Diagnostic> diags, isle::support::SourceManager sm);

    const std::vector<isle::support::Diagnostic> &diagnostics() const
    {
        return diags_;
    }

    size_t size() const
    {
        return diags_.size();
    }

    /// @brief Print one `path:line:col: error: message` line per diagnostic.
    void print(std::ostream &os) const;

    /// @brief Rendering produced by print(), as a string.
    [[nodiscard]] std::string str() const;

  private:
    std::vector<isle::support::Diagnostic> diags_;
    isle::support::SourceManager sm_;
};

std::ostream &operator<<(std::ostream &os, const CompileErrors &errors);

/// @brief Generated code on success, the full error collection otherwise.
using CompileResult = isle::support::Result<std::string, CompileErrors>;

/// @brief Compiles an ordered list of rule files into generated code.
class RuleCompiler
{
  public:
    virtual ~RuleCompiler() = default;

    /// @brief Compile @p files, in order, as one logical rule set.
    /// @return Generated code, or a non-empty error collection.
    virtual CompileResult compile(const std::vector<std::string> &files,
                                  const isle::codegen::CodegenOptions &options) = 0;
};

} // namespace isle::compile
