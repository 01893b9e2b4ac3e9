//===----------------------------------------------------------------------===//
//
// Part of the apicheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/classfile/LineTable.hpp
// Purpose: Ordered (bytecode offset, source line) pairs of one method body.
// Key invariants: Entries are sorted by offset after finalize(); a lookup
//                 answers with the entry of greatest offset not exceeding the
//                 queried offset.
// Ownership/Lifetime: Value type owned by CodeAttribute.
// Links: classfile/ClassFile.hpp
#pragma once

#include <cstdint>
#include <optional>
#include <vector>

namespace apicheck::classfile
{

class LineTable
{
  public:
    struct Entry
    {
        uint32_t offset;
        uint32_t line;
    };

    /// @brief Append a pair; several LineNumberTable attributes may contribute.
    void add(uint32_t offset, uint32_t line);

    /// @brief Sort entries by offset, keeping insertion order among equal offsets.
    void finalize();

    /// @brief Source line of the instruction at @p offset.
    /// @return std::nullopt when the table is empty or @p offset precedes the
    ///         first entry.
    [[nodiscard]] std::optional<uint32_t> lineFor(uint32_t offset) const;

    /// @brief Smallest line in the table, or 0 when empty.
    [[nodiscard]] uint32_t minLine() const;

    [[nodiscard]] bool empty() const
    {
        return entries_.empty();
    }

    [[nodiscard]] const std::vector<Entry> &entries() const
    {
        return entries_;
    }

  private:
    std::vector<Entry> entries_;
};

} // namespace apicheck::classfile
