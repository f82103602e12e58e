//===----------------------------------------------------------------------===//
//
// Part of the Isle project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements ISLE_TRACE-gated tracing. Trace output goes to stderr so it never
// mixes with generated code on stdout.
//
//===----------------------------------------------------------------------===//

#include "support/trace.hpp"

#include <cstdlib>
#include <iostream>

namespace isle::support
{

bool traceEnabled()
{
    static const bool enabled = std::getenv("ISLE_TRACE") != nullptr;
    return enabled;
}

void trace(std::string_view message)
{
    if (!traceEnabled())
        return;
    std::cerr << "[isle] " << message << '\n';
}

} // namespace isle::support
