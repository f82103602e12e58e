//===----------------------------------------------------------------------===//
//
// Part of the Isle project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements file registration for diagnostics.
//
//===----------------------------------------------------------------------===//

#include "support/source_manager.hpp"

#include <filesystem>
#include <limits>
#include <utility>

namespace isle::support
{

/// @details `rules/./a.isle` and `rules/a.isle` name the same file, so the
///          path is made lexically normal before it is looked up.
uint32_t SourceManager::addFile(std::string path)
{
    std::string key = std::filesystem::path(std::move(path)).lexically_normal().generic_string();
    if (const auto found = ids_.find(key); found != ids_.end())
        return found->second;

    if (nextId_ > std::numeric_limits<uint32_t>::max())
        return 0;

    const auto id = static_cast<uint32_t>(nextId_);
    ++nextId_;
    ids_.emplace(key, id);
    paths_.push_back(std::move(key));
    return id;
}

std::string_view SourceManager::getPath(uint32_t file_id) const
{
    if (file_id == 0 || file_id > paths_.size())
        return {};
    return paths_[file_id - 1];
}

} // namespace isle::support
