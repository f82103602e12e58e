//===----------------------------------------------------------------------===//
//
// Part of the Isle project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diagnostics.hpp
// Purpose: Diagnostic records, the engine that collects them and the printer
//          shared by every phase and tool.
// Key invariants: The engine keeps diagnostics in report order; its error and
//                 warning counters always match the stored records.
// Ownership/Lifetime: The engine owns its records until take() hands them out.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace isle::support
{

class SourceManager;

enum class Severity
{
    Note,
    Warning,
    Error
};

/// @brief Lowercase spelling used in printed diagnostics.
const char *severityName(Severity severity);

/// @brief One message attached to an optional source location.
struct Diagnostic
{
    Severity severity;
    std::string message;
    SourceLoc loc;
};

/// @brief Build an error-severity diagnostic.
Diagnostic makeError(SourceLoc loc, std::string msg);

/// @brief Write @p diag as `path:line:col: severity: message` plus newline.
/// @details Location parts that are unknown, or a file id @p sm cannot
///          resolve, are left out rather than printed as zeros.
void printDiag(const Diagnostic &diag, std::ostream &os, const SourceManager *sm = nullptr);

/// @brief Accumulates diagnostics so a phase can report every problem it sees.
class DiagnosticEngine
{
  public:
    void report(Diagnostic d);

    /// @brief Shorthand for report(makeError(loc, message)).
    void error(SourceLoc loc, std::string message);

    void printAll(std::ostream &os, const SourceManager *sm = nullptr) const;

    size_t errorCount() const
    {
        return errors_;
    }

    size_t warningCount() const
    {
        return warnings_;
    }

    const std::vector<Diagnostic> &diagnostics() const
    {
        return diags_;
    }

    /// @brief Hand out the recorded diagnostics and start over empty.
    std::vector<Diagnostic> take();

  private:
    std::vector<Diagnostic> diags_;
    size_t errors_ = 0;
    size_t warnings_ = 0;
};

} // namespace isle::support
