#pragma once

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <vector>

#include "gridwire/buffer/slice.hpp"
#include "gridwire/frame/layout.hpp"
#include "gridwire/error.hpp"
#include "lcr/endian.hpp"
#include "lcr/optional.hpp"
#include "lcr/log/logger.hpp"


namespace gridwire::frame {

/*
===============================================================================
Frame
===============================================================================

Non-owning flyweight over one physical frame inside a transport buffer.

A Frame interprets the bytes at [offset, offset + frame_length) of a borrowed
buffer::Slice. It never allocates for header access and never copies the
payload unless asked to (get_var_data). The frame is valid only while the
transport keeps the underlying buffer alive and unchanged.

Lifecycle:
----------
Encode:
    wrap_for_encode()  -> data_offset = HEADER_SIZE, frame_length = HEADER_SIZE
    set header fields  -> version / flags / type / correlation_id
    put_var_data()...  -> frame_length grows by 4 + len per segment

Decode:
    wrap_for_decode()  -> validates header, cursor at data_offset
    read header fields
    get_var_data()...  -> segments in append order

Invariants (after a successful wrap):
-------------------------------------
• The HEADER_SIZE bytes at offset() lie inside the buffer
• HEADER_SIZE <= data_offset <= frame_length
• offset + frame_length lies inside the buffer
• Bit 31 of frame_length and correlation_id is never set by this class
  and is masked out on read

Thread safety:
--------------
None. One buffer region must not be mutated through two views at once.
===============================================================================
*/

class Frame {
public:
    Frame() noexcept = default;

    // ------------------------------------------------------------
    // Binding
    // ------------------------------------------------------------

    [[nodiscard]] Error wrap_for_encode(buffer::Slice region, std::size_t offset) noexcept;
    [[nodiscard]] Error wrap_for_decode(buffer::Slice region, std::size_t offset) noexcept;

    [[nodiscard]] inline bool is_wrapped() const noexcept { return wrapped_; }
    [[nodiscard]] inline const buffer::Slice& buffer() const noexcept { return buffer_; }
    [[nodiscard]] inline std::size_t offset() const noexcept { return offset_; }

    // ------------------------------------------------------------
    // Header accessors
    // ------------------------------------------------------------

    [[nodiscard]] inline std::uint32_t frame_length() const noexcept {
        return load_<std::uint32_t>(FRAME_LENGTH_FIELD_OFFSET) & VALUE_MASK_31;
    }

    [[nodiscard]] inline std::uint32_t correlation_id() const noexcept {
        return load_<std::uint32_t>(CORRELATION_ID_FIELD_OFFSET) & VALUE_MASK_31;
    }

    [[nodiscard]] inline std::uint8_t version() const noexcept {
        return load_<std::uint8_t>(VERSION_FIELD_OFFSET);
    }

    [[nodiscard]] inline std::uint8_t flags() const noexcept {
        return load_<std::uint8_t>(FLAGS_FIELD_OFFSET);
    }

    // Raw type code, never interpreted here
    [[nodiscard]] inline std::uint16_t type() const noexcept {
        return load_<std::uint16_t>(TYPE_FIELD_OFFSET);
    }

    [[nodiscard]] inline std::uint16_t data_offset() const noexcept {
        return load_<std::uint16_t>(DATA_OFFSET_FIELD_OFFSET);
    }

    // ------------------------------------------------------------
    // Header mutators (fluent)
    // ------------------------------------------------------------

    inline Frame& frame_length(std::uint32_t length) noexcept {
        store_<std::uint32_t>(FRAME_LENGTH_FIELD_OFFSET, clear_reserved_(length, "frame_length"));
        return *this;
    }

    inline Frame& correlation_id(std::uint32_t id) noexcept {
        store_<std::uint32_t>(CORRELATION_ID_FIELD_OFFSET, clear_reserved_(id, "correlation_id"));
        return *this;
    }

    inline Frame& version(std::uint8_t ver) noexcept {
        store_<std::uint8_t>(VERSION_FIELD_OFFSET, ver);
        return *this;
    }

    inline Frame& flags(std::uint8_t value) noexcept {
        store_<std::uint8_t>(FLAGS_FIELD_OFFSET, value);
        return *this;
    }

    inline Frame& type(std::uint16_t value) noexcept {
        store_<std::uint16_t>(TYPE_FIELD_OFFSET, value);
        return *this;
    }

    inline Frame& data_offset(std::uint16_t value) noexcept {
        store_<std::uint16_t>(DATA_OFFSET_FIELD_OFFSET, value);
        return *this;
    }

    // ------------------------------------------------------------
    // Flags
    // ------------------------------------------------------------

    [[nodiscard]] inline bool is_flag_set(std::uint8_t mask) const noexcept {
        return (flags() & mask) == mask;
    }

    inline Frame& add_flag(std::uint8_t mask) noexcept {
        return flags(static_cast<std::uint8_t>(flags() | mask));
    }

    [[nodiscard]] inline bool is_begin() const noexcept { return is_flag_set(BEGIN_FLAG); }
    [[nodiscard]] inline bool is_end() const noexcept { return is_flag_set(END_FLAG); }

    // Single-frame logical message
    [[nodiscard]] inline bool is_complete() const noexcept { return is_flag_set(BEGIN_AND_END_FLAGS); }

    // ------------------------------------------------------------
    // Fixed body
    // ------------------------------------------------------------

    // Reserves `size` fixed bytes between the header and the variable data.
    // Only legal on a freshly encoded frame (no body written yet).
    [[nodiscard]] Error reserve_fixed_body(std::uint16_t size) noexcept;

    [[nodiscard]] bytes_view fixed_body() const noexcept;

    // ------------------------------------------------------------
    // Variable-length data
    // ------------------------------------------------------------

    [[nodiscard]] Error put_var_data(const lcr::optional<bytes_view>& data) noexcept;

    [[nodiscard]] inline Error put_var_data(bytes_view data) noexcept {
        return put_var_data(lcr::optional<bytes_view>{data});
    }

    // Appends require the cursor at frame_length (a frame being encoded, or a
    // decoded one read to its end). Otherwise InvalidArgument, frame untouched.

    // Unprefixed body bytes with the same frame length accounting
    [[nodiscard]] Error put_raw_data(bytes_view data) noexcept;

    [[nodiscard]] Error get_var_data(std::vector<std::uint8_t>& out);

    // Zero-copy variant: `out` points into the transport buffer
    [[nodiscard]] Error get_var_data_view(bytes_view& out) noexcept;

    [[nodiscard]] inline std::size_t data_position() const noexcept { return data_position_; }

    [[nodiscard]] inline bool has_remaining_data() const noexcept {
        return data_position_ < frame_length();
    }

    // Moves the cursor back to the first body byte
    inline void rewind() noexcept { data_position_ = data_offset(); }

    // ------------------------------------------------------------
    // Views
    // ------------------------------------------------------------

    // [data_offset, frame_length)
    [[nodiscard]] bytes_view body() const noexcept;

    // [0, frame_length): what the transport flushes
    [[nodiscard]] bytes_view bytes() const noexcept;

private:
    template <typename T>
    [[nodiscard]] inline T load_(std::size_t field) const noexcept {
        assert(wrapped_ && "gridwire::frame::Frame accessed before wrap");
        return lcr::load<T>(buffer_.data() + offset_ + field, lcr::ByteOrder::Little);
    }

    template <typename T>
    inline void store_(std::size_t field, T value) noexcept {
        assert(wrapped_ && "gridwire::frame::Frame accessed before wrap");
        lcr::store<T>(buffer_.data() + offset_ + field, value, lcr::ByteOrder::Little);
    }

    static inline std::uint32_t clear_reserved_(std::uint32_t value, const char* field) noexcept {
        if (value & RESERVED_BIT) [[unlikely]] {
            GW_WARN("[FRAME] Reserved bit set in " << field << " (" << value << "), clearing");
        }
        return value & VALUE_MASK_31;
    }

    [[nodiscard]] Error append_(std::size_t prefix, bytes_view data) noexcept;

private:
    buffer::Slice buffer_{};
    std::size_t offset_ = 0;
    std::size_t data_position_ = 0;
    bool wrapped_ = false;
};

std::ostream& operator<<(std::ostream& os, const Frame& frame);

} // namespace gridwire::frame
