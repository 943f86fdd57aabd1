#pragma once

#include <cstddef>
#include <cstdint>

#include "gridwire/config/codec.hpp"
#include "gridwire/error.hpp"
#include "gridwire/frame/frame.hpp"
#include "gridwire/fragment/message.hpp"
#include "gridwire/fragment/reassembler.hpp"
#include "gridwire/pipeline/concepts.hpp"
#include "gridwire/stream/frame_accumulator.hpp"
#include "lcr/log/logger.hpp"


namespace gridwire::pipeline {

/*
===============================================================================
InboundPipeline
===============================================================================

Receive path of one connection:

    transport bytes -> FrameAccumulator -> Reassembler -> Sink::on_message

Error scoping:
--------------
• Stream errors (CorruptFrame, FrameTooLarge, BufferBounds) are returned from
  on_bytes(). The stream cannot be resynchronized; the caller drops the
  connection.
• Reassembly errors (FramingProtocolViolation, DuplicateBegin) only affect
  one correlation id. They are counted, reported to a ViolationAwareSink, and
  processing continues with the next frame.

Single reader only. Call reset() on connection teardown to reclaim partial
messages.
===============================================================================
*/

struct InboundStats {
    std::uint64_t frames = 0;
    std::uint64_t messages = 0;
    std::uint64_t violations = 0;
};

template <MessageSink Sink>
class InboundPipeline {
public:
    explicit InboundPipeline(Sink& sink, std::size_t max_frame_size = config::codec::ACCUMULATOR_MAX_FRAME_SIZE)
        : sink_(sink)
        , accumulator_(max_frame_size)
    {}

    InboundPipeline(const InboundPipeline&) = delete;
    InboundPipeline& operator=(const InboundPipeline&) = delete;

    [[nodiscard]] Error on_bytes(bytes_view bytes) {
        accumulator_.append(bytes);

        frame::Frame f;
        Error err = Error::None;
        while (accumulator_.next(f, err)) {
            ++stats_.frames;
            bool completed = false;
            const Error reasm_err = reassembler_.feed(f, message_, completed);
            if (reasm_err != Error::None) {
                ++stats_.violations;
                if constexpr (ViolationAwareSink<Sink>) {
                    sink_.on_violation(f.correlation_id(), reasm_err);
                }
                continue;
            }
            if (completed) {
                ++stats_.messages;
                sink_.on_message(message_);
                message_.reset();
            }
        }
        if (err != Error::None) {
            GW_ERROR("[INBOUND] Stream failure: " << to_string(err) << " (" << stats_.frames << " frames decoded)");
        }
        return err;
    }

    void reset() noexcept {
        accumulator_.reset();
        reassembler_.clear();
        message_.reset();
    }

    [[nodiscard]] inline const InboundStats& stats() const noexcept { return stats_; }
    [[nodiscard]] inline const fragment::Reassembler& reassembler() const noexcept { return reassembler_; }
    [[nodiscard]] inline const stream::FrameAccumulator& accumulator() const noexcept { return accumulator_; }

private:
    Sink& sink_;
    stream::FrameAccumulator accumulator_;
    fragment::Reassembler reassembler_;
    fragment::Message message_;
    InboundStats stats_;
};

} // namespace gridwire::pipeline
