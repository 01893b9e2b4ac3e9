//===----------------------------------------------------------------------===//
//
// Part of the apicheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/support/source_location.hpp
// Purpose: Position of a diagnostic within a catalog, class file or layout.
// Key invariants: file_id 0 means "no registered file"; line 0 means the
//                 failure concerns the whole file.
// Ownership/Lifetime: Trivial value type.
// Links: support/source_manager.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>

namespace apicheck::support
{

struct SourceLoc
{
    uint32_t file_id = 0; ///< SourceManager id, 0 when unregistered.
    uint32_t line = 0;    ///< 1-based line, 0 when unknown.
};

} // namespace apicheck::support
