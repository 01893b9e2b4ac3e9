//===----------------------------------------------------------------------===//
//
// Part of the apicheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/support/source_manager.hpp
// Purpose: Interns the paths of inputs that produced diagnostics so a
//          SourceLoc can name its file by a small integer.
// Key invariants: Paths are normalized before interning; equal normalized
//                 paths share one id. Ids start at 1 and are never reused.
// Ownership/Lifetime: Owns the path strings; views returned by getPath stay
//                     valid for the manager's lifetime.
// Links: support/diag_expected.hpp (printDiag)
//
//===----------------------------------------------------------------------===//

#pragma once

#include "source_location.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <unordered_map>

namespace apicheck::support
{

class SourceManager
{
  public:
    /// @brief Intern @p path and return its id (>0).
    uint32_t addFile(std::string_view path);

    /// @brief Normalized path for @p file_id, or empty for an unknown id.
    [[nodiscard]] std::string_view getPath(uint32_t file_id) const;

    [[nodiscard]] size_t size() const
    {
        return paths_.size();
    }

  private:
    std::deque<std::string> paths_; ///< Index is id - 1.
    std::unordered_map<std::string, uint32_t> ids_;
};

} // namespace apicheck::support
