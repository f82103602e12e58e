//===----------------------------------------------------------------------===//
//
// Part of the Isle project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_manager.hpp
// Purpose: Registry of the rule files taking part in one compilation.
// Key invariants: Ids are handed out densely from 1; id 0 is reserved for
//                 "no file". A path is stored in lexically normal form and
//                 registered at most once.
// Ownership/Lifetime: Owns the path strings. Copying a SourceManager copies
//                     the table, so a copy can outlive the compilation that
//                     filled it.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace isle::support
{

/// Message reported when addFile() runs out of 32-bit identifiers.
inline constexpr std::string_view kSourceManagerFileIdOverflowMessage =
    "source manager exhausted file identifier space";

struct SourceManagerTestAccess;

/// @brief Maps rule-file paths to small integer ids and back.
class SourceManager
{
  public:
    /// @brief Register @p path, or find its earlier registration.
    /// @return The file id, or 0 once the id space is exhausted.
    uint32_t addFile(std::string path);

    /// @brief Path registered under @p file_id; empty for unknown ids.
    std::string_view getPath(uint32_t file_id) const;

    size_t fileCount() const
    {
        return paths_.size();
    }

  private:
    std::vector<std::string> paths_; ///< paths_[id - 1]
    std::map<std::string, uint32_t, std::less<>> ids_;
    uint64_t nextId_ = 1;

    friend struct SourceManagerTestAccess;
};

} // namespace isle::support
