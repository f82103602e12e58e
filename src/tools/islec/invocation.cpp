//===----------------------------------------------------------------------===//
//
// Part of the Isle project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements argument parsing for the `islec` CLI. Paths are passed through
// untouched; the compiler reports missing or unreadable files itself.
//
//===----------------------------------------------------------------------===//

#include "tools/islec/invocation.hpp"


namespace isle::tools::islec
{

std::string usageLine(std::string_view argv0)
{
    return "Usage: " + std::string(argv0) + " <input.isle> [<input2.isle> ...]";
}

isle::support::Expected<std::vector<std::string>> parseInvocation(ArgvView args)
{
    const ArgvView inputs = args.operands();
    if (inputs.empty())
        return isle::support::makeError({}, usageLine(args.program()));

    std::vector<std::string> files;
    files.reserve(inputs.size());
    for (size_t i = 0; i < inputs.size(); ++i)
        files.emplace_back(inputs[i]);
    return files;
}

} // namespace isle::tools::islec
