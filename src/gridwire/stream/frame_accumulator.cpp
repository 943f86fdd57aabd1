#include "gridwire/stream/frame_accumulator.hpp"

#include "gridwire/frame/layout.hpp"
#include "lcr/log/logger.hpp"


namespace gridwire::stream {

void FrameAccumulator::append(bytes_view bytes) {
    // Compact consumed bytes before growing
    if (read_pos_ == buffer_.size()) {
        buffer_.clear();
        read_pos_ = 0;
    } else if (read_pos_ > 0 && read_pos_ >= buffer_.size() / 2) {
        buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(read_pos_));
        read_pos_ = 0;
    }
    buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
}

bool FrameAccumulator::next(frame::Frame& out, Error& err) noexcept {
    err = error_;
    if (failed()) {
        return false;
    }
    if (buffered() < frame::HEADER_SIZE) {
        return false;
    }

    buffer::Slice view{buffer_.data(), buffer_.size()};
    std::uint32_t length = 0;
    if (!view.get_u32(read_pos_ + frame::FRAME_LENGTH_FIELD_OFFSET, length)) {
        err = error_ = Error::BufferBounds;
        return false;
    }
    length &= frame::VALUE_MASK_31;

    if (length < frame::HEADER_SIZE) [[unlikely]] {
        GW_ERROR("[STREAM] Frame length " << length << " below header size, stream is corrupt");
        err = error_ = Error::CorruptFrame;
        return false;
    }
    if (length > max_frame_size_) [[unlikely]] {
        GW_ERROR("[STREAM] Frame length " << length << " exceeds limit " << max_frame_size_);
        err = error_ = Error::FrameTooLarge;
        return false;
    }
    if (buffered() < length) {
        return false;
    }

    const Error wrap_err = out.wrap_for_decode(view.subslice(read_pos_, length), 0);
    if (wrap_err != Error::None) [[unlikely]] {
        GW_ERROR("[STREAM] Undecodable frame at stream offset " << read_pos_ << ": " << to_string(wrap_err));
        err = error_ = wrap_err;
        return false;
    }

    read_pos_ += length;
    return true;
}

void FrameAccumulator::reset() noexcept {
    buffer_.clear();
    read_pos_ = 0;
    error_ = Error::None;
}

} // namespace gridwire::stream
