//===----------------------------------------------------------------------===//
//
// Part of the Isle project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_location.hpp
// Purpose: Position of a token or definition inside a rule file.
// Key invariants: Every field uses 0 for "unknown"; lines and columns count
//                 from 1.
// Ownership/Lifetime: Plain value; paths live in the SourceManager.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>

namespace isle::support
{

/// @brief File, line and column of a rule-file position.
struct SourceLoc
{
    uint32_t file_id = 0; ///< SourceManager id; 0 when no file is known
    uint32_t line = 0;    ///< 1-based line; 0 when only the file is known
    uint32_t column = 0;  ///< 1-based column; 0 when unknown

    [[nodiscard]] bool hasFile() const
    {
        return file_id != 0;
    }

    [[nodiscard]] bool hasLine() const
    {
        return line != 0;
    }
};

} // namespace isle::support
