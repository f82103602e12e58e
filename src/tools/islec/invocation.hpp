//===----------------------------------------------------------------------===//
//
// Part of the Isle project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Declares the argument parser of the `islec` CLI. Every argument after the
// program name is an input rule file; there are no flags.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"
#include "tools/common/ArgvView.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace isle::tools::islec
{

/// @brief Usage line naming @p argv0 as the program.
std::string usageLine(std::string_view argv0);

/// @brief Extract the ordered input file list from @p args.
/// @param args Full argument vector; element 0 is the program name.
/// @return Paths 1..N in command-line order, or a diagnostic whose message is
///         the usage line when no input file was given.
isle::support::Expected<std::vector<std::string>> parseInvocation(ArgvView args);

} // namespace isle::tools::islec
