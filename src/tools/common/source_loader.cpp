//===----------------------------------------------------------------------===//
//
// Part of the Isle project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Loads rule files for the compiler. The size is taken from the filesystem
// before reading so an oversized input is rejected without allocating for it.
//
//===----------------------------------------------------------------------===//

#include "tools/common/source_loader.hpp"

#include <filesystem>
#include <fstream>
#include <new>
#include <system_error>

namespace isle::tools::common
{

using isle::support::Expected;
using isle::support::makeError;

Expected<LoadedSource> loadSourceBuffer(const std::string &path, isle::support::SourceManager &sm)
{
    LoadedSource src;
    src.fileId = sm.addFile(path);
    if (src.fileId == 0)
        return makeError({}, std::string(isle::support::kSourceManagerFileIdOverflowMessage));
    const isle::support::SourceLoc where{src.fileId, 0, 0};

    std::ifstream in(path, std::ios::binary);
    std::error_code ec;
    const std::uintmax_t bytes = std::filesystem::file_size(path, ec);
    if (!in || ec)
        return makeError(where, "unable to open " + path);
    if (bytes > kMaxRuleFileBytes)
        return makeError(where, "rule file too large: " + path + " (limit: 64 MB)");

    try
    {
        src.buffer.resize(static_cast<size_t>(bytes));
    }
    catch (const std::bad_alloc &)
    {
        return makeError(where, "out of memory reading " + path);
    }
    if (!in.read(src.buffer.data(), static_cast<std::streamsize>(bytes)))
        return makeError(where, "unable to read " + path);
    return src;
}

} // namespace isle::tools::common
