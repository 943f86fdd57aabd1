// ============================================================================
// Slice
// ----------------------------------------------------------------------------
// Borrowed, bounds-checked view over a mutable byte region.
//
// The slice never owns memory. The transport allocates the region and keeps
// it alive; the slice only interprets it. Every primitive access checks
// offset + width against the region size and reports failure instead of
// touching adjacent memory.
//
// Properties:
//   • Zero-copy (stores pointer + size only)
//   • Trivially copyable, cheap to pass by value
//   • No synchronization (NOT thread-safe)
//   • No exceptions
//
// Example:
//
//   std::array<std::uint8_t, 64> storage{};
//   gridwire::buffer::Slice slice{storage};
//
//   if (!slice.put_u32(0, 42)) { ... out of bounds ... }
//   std::uint32_t v = 0;
//   if (slice.get_u32(0, v)) { ... }
//
// ============================================================================
#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>

#include "lcr/endian.hpp"


namespace gridwire {

using bytes_view = std::span<const std::uint8_t>;

namespace buffer {

class Slice {
public:
    Slice() noexcept = default;

    Slice(std::uint8_t* data, std::size_t size) noexcept
        : data_(data)
        , size_(data == nullptr ? 0 : size)
    {}

    explicit Slice(std::span<std::uint8_t> region) noexcept
        : Slice(region.data(), region.size())
    {}

    // ------------------------------------------------------------------------
    // Raw access
    // ------------------------------------------------------------------------

    [[nodiscard]] inline std::uint8_t* data() noexcept { return data_; }
    [[nodiscard]] inline const std::uint8_t* data() const noexcept { return data_; }
    [[nodiscard]] inline std::size_t size() const noexcept { return size_; }
    [[nodiscard]] inline bool empty() const noexcept { return size_ == 0; }

    // True when [offset, offset + length) lies inside the region
    [[nodiscard]] inline bool contains(std::size_t offset, std::size_t length) const noexcept {
        return offset <= size_ && length <= size_ - offset;
    }

    // ------------------------------------------------------------------------
    // Primitive field codec
    // ------------------------------------------------------------------------

    template <typename T>
    [[nodiscard]] inline bool get(std::size_t offset, T& out, lcr::ByteOrder order = lcr::ByteOrder::Little) const noexcept {
        if (!contains(offset, sizeof(T))) [[unlikely]] {
            return false;
        }
        out = lcr::load<T>(data_ + offset, order);
        return true;
    }

    template <typename T>
    [[nodiscard]] inline bool put(std::size_t offset, T value, lcr::ByteOrder order = lcr::ByteOrder::Little) noexcept {
        if (!contains(offset, sizeof(T))) [[unlikely]] {
            return false;
        }
        lcr::store<T>(data_ + offset, value, order);
        return true;
    }

    [[nodiscard]] inline bool get_u8(std::size_t offset, std::uint8_t& out) const noexcept {
        return get(offset, out);
    }
    [[nodiscard]] inline bool get_u16(std::size_t offset, std::uint16_t& out, lcr::ByteOrder order = lcr::ByteOrder::Little) const noexcept {
        return get(offset, out, order);
    }
    [[nodiscard]] inline bool get_u32(std::size_t offset, std::uint32_t& out, lcr::ByteOrder order = lcr::ByteOrder::Little) const noexcept {
        return get(offset, out, order);
    }

    [[nodiscard]] inline bool put_u8(std::size_t offset, std::uint8_t value) noexcept {
        return put(offset, value);
    }
    [[nodiscard]] inline bool put_u16(std::size_t offset, std::uint16_t value, lcr::ByteOrder order = lcr::ByteOrder::Little) noexcept {
        return put(offset, value, order);
    }
    [[nodiscard]] inline bool put_u32(std::size_t offset, std::uint32_t value, lcr::ByteOrder order = lcr::ByteOrder::Little) noexcept {
        return put(offset, value, order);
    }

    // ------------------------------------------------------------------------
    // Byte ranges
    // ------------------------------------------------------------------------

    [[nodiscard]] inline bool put_bytes(std::size_t offset, bytes_view src) noexcept {
        if (!contains(offset, src.size())) [[unlikely]] {
            return false;
        }
        if (!src.empty()) {
            std::memcpy(data_ + offset, src.data(), src.size());
        }
        return true;
    }

    [[nodiscard]] inline bool get_bytes(std::size_t offset, std::size_t length, bytes_view& out) const noexcept {
        if (!contains(offset, length)) [[unlikely]] {
            return false;
        }
        out = bytes_view{data_ + offset, length};
        return true;
    }

    // Sub-region starting at offset; empty slice when out of range
    [[nodiscard]] inline Slice subslice(std::size_t offset, std::size_t length) const noexcept {
        if (!contains(offset, length)) {
            return Slice{};
        }
        return Slice{data_ + offset, length};
    }

private:
    std::uint8_t* data_ = nullptr;
    std::size_t size_ = 0;
};

} // namespace buffer
} // namespace gridwire
