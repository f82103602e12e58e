//===----------------------------------------------------------------------===//
//
// Part of the Isle project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/common/source_loader.hpp
// Purpose: Read a rule file into memory and give it a SourceManager id.
// Key invariants: A successful load has a non-zero fileId that maps back to
//                 the requested path.
// Ownership/Lifetime: The returned LoadedSource owns its text.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"
#include "support/source_manager.hpp"

#include <cstdint>
#include <string>

namespace isle::tools::common
{

/// Largest rule file accepted, in bytes.
inline constexpr std::uintmax_t kMaxRuleFileBytes = 64ULL * 1024 * 1024;

struct LoadedSource
{
    std::string buffer;
    uint32_t fileId{0};
};

/// @brief Register @p path with @p sm and read its full contents.
/// @details Registration happens first, so a file that cannot be opened still
///          gets a location to attach the error to.
isle::support::Expected<LoadedSource> loadSourceBuffer(const std::string &path,
                                                       isle::support::SourceManager &sm);

} // namespace isle::tools::common
