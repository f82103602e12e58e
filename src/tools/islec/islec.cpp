//===----------------------------------------------------------------------===//
//
// Part of the Isle project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Provides the standalone `islec` CLI. The executable compiles one or more
// rule files, taken together as a single rule set, into Zig source printed on
// stdout. Errors go to stderr and the exit status is 1.
//
//===----------------------------------------------------------------------===//

#include "compile/IsleCompiler.hpp"
#include "tools/islec/driver.hpp"

#include <iostream>

/// @brief Entry point for the `islec` binary.
/// @details Wires the real IsleCompiler into the CLI workflow; see
///          @ref isle::tools::islec::runCLI for the stream and exit-code
///          contract.
#ifndef ISLE_ISLEC_SKIP_MAIN
int main(int argc, char **argv)
{
    isle::compile::IsleCompiler compiler;
    return isle::tools::islec::runCLI(
        isle::tools::ArgvView{argc, argv}, compiler, std::cout, std::cerr);
}
#endif
