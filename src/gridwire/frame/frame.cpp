#include "gridwire/frame/frame.hpp"

#include "gridwire/config/codec.hpp"


namespace gridwire::frame {

// ---------------------------------
// Binding
// ---------------------------------

Error Frame::wrap_for_encode(buffer::Slice region, std::size_t offset) noexcept {
    if (!region.contains(offset, HEADER_SIZE)) [[unlikely]] {
        GW_TRACE("[!!] Encode region too small for frame header (size=" << region.size() << ", offset=" << offset << ")");
        wrapped_ = false;
        return Error::BufferBounds;
    }
    buffer_ = region;
    offset_ = offset;
    wrapped_ = true;

    data_offset(static_cast<std::uint16_t>(HEADER_SIZE));
    frame_length(data_offset());
    data_position_ = data_offset();
    return Error::None;
}

Error Frame::wrap_for_decode(buffer::Slice region, std::size_t offset) noexcept {
    wrapped_ = false;
    if (!region.contains(offset, HEADER_SIZE)) [[unlikely]] {
        GW_TRACE("[!!] Decode region shorter than frame header (size=" << region.size() << ", offset=" << offset << ")");
        return Error::BufferBounds;
    }
    buffer_ = region;
    offset_ = offset;
    wrapped_ = true;

    const std::uint32_t length = frame_length();
    const std::uint16_t dof = data_offset();
    if (dof < HEADER_SIZE || length < dof) [[unlikely]] {
        GW_TRACE("[!!] Inconsistent frame header (frame_length=" << length << ", data_offset=" << dof << ")");
        wrapped_ = false;
        return Error::CorruptFrame;
    }
    if (!region.contains(offset, length)) [[unlikely]] {
        GW_TRACE("[!!] Frame truncated by buffer (frame_length=" << length << ", available=" << region.size() - offset << ")");
        wrapped_ = false;
        return Error::BufferBounds;
    }

    data_position_ = dof;
    return Error::None;
}

// ---------------------------------
// Fixed body
// ---------------------------------

Error Frame::reserve_fixed_body(std::uint16_t size) noexcept {
    if (frame_length() != data_offset() || data_offset() != HEADER_SIZE) {
        GW_TRACE("[!!] Fixed body must be reserved before any body data is written");
        return Error::InvalidArgument;
    }
    const std::size_t new_offset = HEADER_SIZE + size;
    if (new_offset > 0xFFFFu) {
        return Error::InvalidArgument;
    }
    if (!buffer_.contains(offset_, new_offset)) {
        return Error::BufferBounds;
    }
    data_offset(static_cast<std::uint16_t>(new_offset));
    frame_length(static_cast<std::uint32_t>(new_offset));
    data_position_ = new_offset;
    return Error::None;
}

bytes_view Frame::fixed_body() const noexcept {
    bytes_view out{};
    if (!buffer_.get_bytes(offset_ + HEADER_SIZE, data_offset() - HEADER_SIZE, out)) {
        return bytes_view{};
    }
    return out;
}

// ---------------------------------
// Variable-length data
// ---------------------------------

Error Frame::append_(std::size_t prefix, bytes_view data) noexcept {
    // Appends only extend the frame; a cursor inside the body would overwrite segments
    if (data_position_ != frame_length()) [[unlikely]] {
        GW_WARN("[FRAME] Append with cursor inside the body rejected (position=" << data_position_
                << ", frame_length=" << frame_length() << ")");
        return Error::InvalidArgument;
    }
    const std::size_t total = prefix + data.size();
    const std::uint64_t new_length = static_cast<std::uint64_t>(frame_length()) + total;
    if (new_length > config::codec::MAX_FRAME_LENGTH) [[unlikely]] {
        GW_TRACE("[!!] Frame length overflow (frame_length=" << frame_length() << ", append=" << total << ")");
        return Error::FrameTooLarge;
    }
    // Capacity is checked up front so a failed append leaves no partial bytes
    if (!buffer_.contains(offset_ + data_position_, total)) [[unlikely]] {
        GW_TRACE("[!!] Frame buffer exhausted (position=" << data_position_ << ", append=" << total
                 << ", capacity=" << buffer_.size() - offset_ << ")");
        return Error::BufferBounds;
    }

    const std::size_t position = offset_ + data_position_;
    if (prefix != 0 && !buffer_.put_u32(position, static_cast<std::uint32_t>(data.size()))) {
        return Error::BufferBounds;
    }
    if (!buffer_.put_bytes(position + prefix, data)) {
        return Error::BufferBounds;
    }

    data_position_ += total;
    frame_length(static_cast<std::uint32_t>(new_length));
    return Error::None;
}

Error Frame::put_var_data(const lcr::optional<bytes_view>& data) noexcept {
    if (!data.has()) [[unlikely]] {
        GW_TRACE("[!!] put_var_data called with absent data");
        return Error::InvalidArgument;
    }
    if (data.value().size() > VALUE_MASK_31) [[unlikely]] {
        return Error::FrameTooLarge;
    }
    return append_(SIZE_OF_LENGTH_FIELD, data.value());
}

Error Frame::put_raw_data(bytes_view data) noexcept {
    return append_(0, data);
}

Error Frame::get_var_data_view(bytes_view& out) noexcept {
    const std::size_t end = frame_length();
    const std::size_t position = data_position_;

    if (position > end || end - position < SIZE_OF_LENGTH_FIELD) [[unlikely]] {
        GW_TRACE("[!!] No segment length prefix at position " << position << " (frame_length=" << end << ")");
        return Error::BufferBounds;
    }
    std::uint32_t length = 0;
    if (!buffer_.get_u32(offset_ + position, length)) {
        return Error::BufferBounds;
    }
    if (length > end - position - SIZE_OF_LENGTH_FIELD) [[unlikely]] {
        GW_TRACE("[!!] Segment length " << length << " runs past frame end (position=" << position
                 << ", frame_length=" << end << ")");
        return Error::BufferBounds;
    }
    if (!buffer_.get_bytes(offset_ + position + SIZE_OF_LENGTH_FIELD, length, out)) {
        return Error::BufferBounds;
    }

    // Advance only after the segment has been read
    data_position_ = position + SIZE_OF_LENGTH_FIELD + length;
    return Error::None;
}

Error Frame::get_var_data(std::vector<std::uint8_t>& out) {
    bytes_view view{};
    const Error err = get_var_data_view(view);
    if (err != Error::None) {
        return err;
    }
    out.assign(view.begin(), view.end());
    return Error::None;
}

// ---------------------------------
// Views
// ---------------------------------

bytes_view Frame::body() const noexcept {
    const std::size_t dof = data_offset();
    const std::size_t end = frame_length();
    bytes_view out{};
    if (end < dof || !buffer_.get_bytes(offset_ + dof, end - dof, out)) {
        return bytes_view{};
    }
    return out;
}

bytes_view Frame::bytes() const noexcept {
    bytes_view out{};
    if (!buffer_.get_bytes(offset_, frame_length(), out)) {
        return bytes_view{};
    }
    return out;
}

// ---------------------------------
// Debug / logging helper
// ---------------------------------

std::ostream& operator<<(std::ostream& os, const Frame& frame) {
    if (!frame.is_wrapped()) {
        return os << "[frame] {unwrapped}";
    }
    os << "[frame] {"
       << "length=" << frame.frame_length()
       << ", correlation_id=" << frame.correlation_id()
       << ", version=" << static_cast<unsigned>(frame.version())
       << ", flags=0x" << std::hex << static_cast<unsigned>(frame.flags()) << std::dec
       << ", type=" << frame.type()
       << ", data_offset=" << frame.data_offset()
       << "}";
    return os;
}

} // namespace gridwire::frame
