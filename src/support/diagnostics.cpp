//===----------------------------------------------------------------------===//
//
// Part of the Isle project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements diagnostic construction, collection and printing. The lexer,
// parser and checker all report into one engine, and the driver renders the
// collected records with printDiag, so every tool prints the same format.
//
//===----------------------------------------------------------------------===//

#include "support/diagnostics.hpp"
#include "support/source_manager.hpp"

#include <utility>

namespace isle::support
{

const char *severityName(Severity severity)
{
    switch (severity)
    {
        case Severity::Note:
            return "note";
        case Severity::Warning:
            return "warning";
        case Severity::Error:
            return "error";
    }
    return "error";
}

Diagnostic makeError(SourceLoc loc, std::string msg)
{
    return Diagnostic{Severity::Error, std::move(msg), loc};
}

void printDiag(const Diagnostic &diag, std::ostream &os, const SourceManager *sm)
{
    const std::string_view path =
        sm && diag.loc.hasFile() ? sm->getPath(diag.loc.file_id) : std::string_view{};
    if (!path.empty())
    {
        os << path;
        if (diag.loc.hasLine())
        {
            os << ':' << diag.loc.line;
            if (diag.loc.column != 0)
                os << ':' << diag.loc.column;
        }
        os << ": ";
    }
    os << severityName(diag.severity) << ": " << diag.message << '\n';
}

void DiagnosticEngine::report(Diagnostic d)
{
    switch (d.severity)
    {
        case Severity::Error:
            ++errors_;
            break;
        case Severity::Warning:
            ++warnings_;
            break;
        case Severity::Note:
            break;
    }
    diags_.push_back(std::move(d));
}

void DiagnosticEngine::error(SourceLoc loc, std::string message)
{
    report(makeError(loc, std::move(message)));
}

void DiagnosticEngine::printAll(std::ostream &os, const SourceManager *sm) const
{
    for (const auto &d : diags_)
        printDiag(d, os, sm);
}

std::vector<Diagnostic> DiagnosticEngine::take()
{
    std::vector<Diagnostic> out;
    out.swap(diags_);
    errors_ = 0;
    warnings_ = 0;
    return out;
}

} // namespace isle::support
