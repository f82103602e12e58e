//===----------------------------------------------------------------------===//
//
// Part of the Isle project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/trace.hpp
// Purpose: Environment-gated progress tracing for the rule compiler.
// Key invariants: Nothing is written unless ISLE_TRACE is set when the process
//                 first asks whether tracing is enabled.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string_view>

namespace isle::support
{

/// @brief Report whether the ISLE_TRACE environment variable is set.
/// @details The lookup happens once; later changes to the environment are not
///          observed.
bool traceEnabled();

/// @brief Write `[isle] <message>` to stderr when tracing is enabled.
void trace(std::string_view message);

} // namespace isle::support
