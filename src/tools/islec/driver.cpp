//===----------------------------------------------------------------------===//
//
// Part of the Isle project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the `islec` workflow: parse arguments, compile every input as
// one rule set, and print either the generated code or the errors. Nothing is
// written to `out` unless compilation succeeds.
//
//===----------------------------------------------------------------------===//

#include "tools/islec/driver.hpp"
#include "tools/islec/invocation.hpp"

#include <ostream>
#include <string>

namespace isle::tools::islec
{

isle::codegen::CodegenOptions makeDriverOptions()
{
    isle::codegen::CodegenOptions options;
    options.target = kDriverTarget;
    options.excludeGlobalAllowPragmas = kDriverExcludeGlobalAllowPragmas;
    options.prefixes = {};
    return options;
}

int runCLI(ArgvView args,
           isle::compile::RuleCompiler &compiler,
           std::ostream &out,
           std::ostream &err)
{
    auto files = parseInvocation(args);
    if (!files)
    {
        err << files.error().message << '\n';
        return 1;
    }

    const auto result = compiler.compile(files.value(), makeDriverOptions());
    if (!result.isOk())
    {
        err << kCompileFailedHeader << '\n' << result.error();
        return 1;
    }

    out << result.value() << '\n';
    return 0;
}

} // namespace isle::tools::islec
