#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "gridwire/buffer/slice.hpp"
#include "gridwire/config/codec.hpp"
#include "gridwire/error.hpp"
#include "gridwire/frame/frame.hpp"
#include "gridwire/frame/layout.hpp"
#include "lcr/log/logger.hpp"


namespace gridwire::fragment {

// Header fields shared by every fragment of one logical message
struct Header {
    std::uint32_t correlation_id = 0;
    std::uint16_t type = 0;
    std::uint8_t version = config::codec::PROTOCOL_VERSION;
};

/*
===============================================================================
Splitter
===============================================================================

Encode side of fragmentation. Cuts a logical payload into physical frames no
larger than max_frame_size bytes:

    first frame  -> BEGIN           (BEGIN|END when the payload fits in one)
    middle       -> no flags
    last frame   -> END

Every frame carries the same correlation id, type and version, and the bodies
are contiguous slices of the payload in order. An empty payload produces a
single BEGIN|END frame with an empty body.

Frames are encoded one at a time into an internal scratch buffer and handed to
a sink; the view passed to the sink is only valid during the call.
===============================================================================
*/

class Splitter {
public:
    explicit Splitter(std::size_t max_frame_size = config::codec::DEFAULT_MAX_FRAME_SIZE)
        : max_frame_size_(max_frame_size)
    {}

    [[nodiscard]] inline std::size_t max_frame_size() const noexcept { return max_frame_size_; }

    // Payload bytes that fit in one frame
    [[nodiscard]] inline std::size_t capacity() const noexcept {
        return max_frame_size_ > frame::HEADER_SIZE ? max_frame_size_ - frame::HEADER_SIZE : 0;
    }

    // Physical frames needed for a payload of `size` bytes
    [[nodiscard]] inline std::size_t frame_count(std::size_t size) const noexcept {
        const std::size_t cap = capacity();
        if (cap == 0) return 0;
        return size == 0 ? 1 : (size + cap - 1) / cap;
    }

    // Sink: callable as Error(const frame::Frame&). A sink error stops the split.
    template <typename Sink>
    [[nodiscard]] Error split(bytes_view payload, const Header& header, Sink&& sink) {
        if (capacity() == 0 || max_frame_size_ > config::codec::MAX_FRAME_LENGTH) {
            GW_ERROR("[SPLIT] Unusable max frame size " << max_frame_size_
                     << " (header=" << frame::HEADER_SIZE << ", limit=" << config::codec::MAX_FRAME_LENGTH << ")");
            return Error::InvalidArgument;
        }
        if (scratch_.size() != max_frame_size_) {
            scratch_.assign(max_frame_size_, 0);
        }

        const std::size_t cap = capacity();
        const std::size_t total = frame_count(payload.size());
        std::size_t offset = 0;

        for (std::size_t i = 0; i < total; ++i) {
            const std::size_t chunk = std::min(cap, payload.size() - offset);

            std::uint8_t flags = 0;
            if (i == 0)         flags |= frame::BEGIN_FLAG;
            if (i == total - 1) flags |= frame::END_FLAG;

            frame::Frame f;
            Error err = f.wrap_for_encode(buffer::Slice{scratch_.data(), scratch_.size()}, 0);
            if (err != Error::None) {
                return err;
            }
            f.version(header.version)
             .flags(flags)
             .type(header.type)
             .correlation_id(header.correlation_id);

            err = f.put_raw_data(payload.subspan(offset, chunk));
            if (err != Error::None) {
                return err;
            }
            offset += chunk;

            err = sink(static_cast<const frame::Frame&>(f));
            if (err != Error::None) {
                GW_WARN("[SPLIT] Sink rejected fragment " << i + 1 << "/" << total
                        << " of correlation id " << header.correlation_id << ": " << to_string(err));
                return err;
            }
        }

        GW_TRACE("[SPLIT] " << header.correlation_id << ": " << payload.size() << "B -> " << total << " frame(s)");
        return Error::None;
    }

    // Collects owned copies of every frame
    [[nodiscard]] inline Error split_to(bytes_view payload, const Header& header, std::vector<std::vector<std::uint8_t>>& out) {
        return split(payload, header, [&out](const frame::Frame& f) {
            const bytes_view bytes = f.bytes();
            out.emplace_back(bytes.begin(), bytes.end());
            return Error::None;
        });
    }

private:
    std::size_t max_frame_size_;
    std::vector<std::uint8_t> scratch_;
};

} // namespace gridwire::fragment
