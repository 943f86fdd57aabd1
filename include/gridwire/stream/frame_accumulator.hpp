#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "gridwire/buffer/slice.hpp"
#include "gridwire/config/codec.hpp"
#include "gridwire/error.hpp"
#include "gridwire/frame/frame.hpp"


namespace gridwire::stream {

/*
===============================================================================
FrameAccumulator
===============================================================================

Cuts a byte stream into physical frames.

The transport delivers bytes in arbitrary chunks (partial reads, several
frames per read). append() buffers them; next() yields each complete frame as
a Frame view decoded in place, without copying the frame out.

Validity:
---------
A frame returned by next() points into the accumulator's buffer and stays
valid until the next append(), reset() or destruction.

Errors:
-------
A frame length below HEADER_SIZE (CorruptFrame) or above max_frame_size
(FrameTooLarge) makes the stream unrecoverable: there is no way to find the
next frame boundary. The accumulator latches the error and every later next()
returns it until reset().
===============================================================================
*/

class FrameAccumulator {
public:
    explicit FrameAccumulator(std::size_t max_frame_size = config::codec::ACCUMULATOR_MAX_FRAME_SIZE)
        : max_frame_size_(max_frame_size)
    {}

    FrameAccumulator(const FrameAccumulator&) = delete;
    FrameAccumulator& operator=(const FrameAccumulator&) = delete;

    // Buffers `bytes`. Invalidates frames previously returned by next().
    void append(bytes_view bytes);

    // Returns true and binds `out` when a complete frame is buffered.
    // Returns false when more bytes are needed or when `err` was set.
    [[nodiscard]] bool next(frame::Frame& out, Error& err) noexcept;

    void reset() noexcept;

    [[nodiscard]] inline std::size_t buffered() const noexcept { return buffer_.size() - read_pos_; }
    [[nodiscard]] inline bool failed() const noexcept { return error_ != Error::None; }
    [[nodiscard]] inline Error error() const noexcept { return error_; }
    [[nodiscard]] inline std::size_t max_frame_size() const noexcept { return max_frame_size_; }

private:
    std::size_t max_frame_size_;
    std::vector<std::uint8_t> buffer_;
    std::size_t read_pos_ = 0;
    Error error_ = Error::None;
};

} // namespace gridwire::stream
