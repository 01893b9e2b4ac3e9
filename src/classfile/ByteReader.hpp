//===----------------------------------------------------------------------===//
//
// Part of the apicheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/classfile/ByteReader.hpp
// Purpose: Bounded big-endian cursor over an immutable byte buffer.
// Key invariants: Reads past the end return zero and clear ok(); once failed
//                 the reader stays failed, so callers check ok() once per
//                 structure instead of after every field.
// Ownership/Lifetime: Borrows the buffer; the caller keeps it alive.
// Links: classfile/ClassReader.cpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace apicheck::classfile
{

class ByteReader
{
  public:
    ByteReader(const uint8_t *data, size_t size) : data_(data), size_(size) {}

    uint8_t u1()
    {
        if (!require(1))
            return 0;
        return data_[pos_++];
    }

    uint16_t u2()
    {
        if (!require(2))
            return 0;
        const uint16_t v = static_cast<uint16_t>((data_[pos_] << 8) | data_[pos_ + 1]);
        pos_ += 2;
        return v;
    }

    uint32_t u4()
    {
        if (!require(4))
            return 0;
        const uint32_t v = (uint32_t(data_[pos_]) << 24) | (uint32_t(data_[pos_ + 1]) << 16) |
                           (uint32_t(data_[pos_ + 2]) << 8) | uint32_t(data_[pos_ + 3]);
        pos_ += 4;
        return v;
    }

    /// @brief View @p n raw bytes and advance past them.
    std::string_view bytes(size_t n)
    {
        if (!require(n))
            return {};
        std::string_view v(reinterpret_cast<const char *>(data_ + pos_), n);
        pos_ += n;
        return v;
    }

    void skip(size_t n)
    {
        if (require(n))
            pos_ += n;
    }

    [[nodiscard]] bool ok() const
    {
        return ok_;
    }

    [[nodiscard]] size_t position() const
    {
        return pos_;
    }

    [[nodiscard]] size_t remaining() const
    {
        return size_ - pos_;
    }

  private:
    bool require(size_t n)
    {
        if (!ok_ || n > size_ - pos_)
        {
            ok_ = false;
            return false;
        }
        return true;
    }

    const uint8_t *data_;
    size_t size_;
    size_t pos_ = 0;
    bool ok_ = true;
};

} // namespace apicheck::classfile
