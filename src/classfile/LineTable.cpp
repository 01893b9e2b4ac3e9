//===----------------------------------------------------------------------===//
//
// Part of the apicheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/classfile/LineTable.cpp
// Purpose: Offset-to-line resolution for method bodies.
// Key invariants: See LineTable.hpp.
// Ownership/Lifetime: Value type.
// Links: classfile/LineTable.hpp

#include "classfile/LineTable.hpp"

#include <algorithm>
#include <iterator>

namespace apicheck::classfile
{

void LineTable::add(uint32_t offset, uint32_t line)
{
    entries_.push_back({offset, line});
}

void LineTable::finalize()
{
    std::stable_sort(entries_.begin(), entries_.end(), [](const Entry &a, const Entry &b) {
        return a.offset < b.offset;
    });
}

std::optional<uint32_t> LineTable::lineFor(uint32_t offset) const
{
    auto it = std::upper_bound(entries_.begin(),
                               entries_.end(),
                               offset,
                               [](uint32_t value, const Entry &e) { return value < e.offset; });
    if (it == entries_.begin())
        return std::nullopt;
    return std::prev(it)->line;
}

uint32_t LineTable::minLine() const
{
    uint32_t best = 0;
    for (const auto &e : entries_)
    {
        if (e.line != 0 && (best == 0 || e.line < best))
            best = e.line;
    }
    return best;
}

} // namespace apicheck::classfile
