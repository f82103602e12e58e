//===----------------------------------------------------------------------===//
//
// Part of the Isle project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements rendering of compile error collections.
//
//===----------------------------------------------------------------------===//

#include "compile/RuleCompiler.hpp"
#include "support/diag_expected.hpp"

#include <sstream>
#include <utility>

namespace isle::compile
{

CompileErrors::CompileErrors(std::vector<isle::support::Diagnostic> diags,
                             isle::support::SourceManager sm)
    : diags_(std::move(diags)), sm_(std::move(sm))
{
}

void CompileErrors::print(std::ostream &os) const
{
    for (const auto &diag : diags_)
        isle::support::printDiag(diag, os, &sm_);
}

std::string CompileErrors::str() const
{
    std::ostringstream os;
    print(os);
    return os.str();
}

std::ostream &operator<<(std::ostream &os, const CompileErrors &errors)
{
    errors.print(os);
    return os;
}

} // namespace isle::compile
