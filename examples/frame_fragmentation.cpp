// ============================================================================
// frame_fragmentation
// ----------------------------------------------------------------------------
// Splits a generated payload into frames no larger than --max-frame-size,
// streams the frames to an inbound pipeline in uneven chunks (as a socket
// would), and checks the reassembled payload against the original digest.
// ============================================================================

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <vector>

#include "gridwire.hpp"
#include "common/cli/params.hpp"

using namespace gridwire;


namespace {

struct DigestSink {
    std::uint64_t expected_digest = 0;
    std::size_t expected_size = 0;
    std::size_t messages = 0;
    bool ok = false;

    void on_message(const fragment::Message& msg) {
        ++messages;
        const auto hash = digest::xxh64(msg.payload);
        ok = msg.payload.size() == expected_size && hash == expected_digest;
        GW_INFO("Received " << msg << " xxh64=" << std::hex << hash << std::dec
                << (ok ? " (match)" : " (MISMATCH)"));
    }

    void on_violation(std::uint32_t correlation_id, Error err) {
        GW_WARN("Framing violation on correlation id " << correlation_id << ": " << to_string(err));
    }
};

static_assert(pipeline::ViolationAwareSink<DigestSink>);

} // namespace


int main(int argc, char** argv) {
    const auto params = examples::cli::configure(argc, argv,
        "gridwire fragmentation demo",
        "Splits a payload into frames, streams them in odd-sized chunks and verifies reassembly."
    );
    params.dump("=== Fragmentation ===", std::cout);

    std::vector<std::uint8_t> payload(params.payload_size);
    for (std::size_t i = 0; i < payload.size(); ++i) {
        payload[i] = static_cast<std::uint8_t>((i * 31u + 7u) & 0xFFu);
    }

    // -------------------------------------------------------------------------
    // Encode side
    // -------------------------------------------------------------------------
    fragment::Splitter splitter{params.max_frame_size};
    const fragment::Header header{
        params.correlation_id,
        static_cast<std::uint16_t>(params.type),
        static_cast<std::uint8_t>(params.version)
    };

    std::vector<std::uint8_t> wire;
    std::size_t frames = 0;
    const Error split_err = splitter.split(payload, header, [&](const frame::Frame& f) {
        const bytes_view bytes = f.bytes();
        GW_DEBUG("Frame " << frames << ": " << f);
        wire.insert(wire.end(), bytes.begin(), bytes.end());
        ++frames;
        return Error::None;
    });
    if (split_err != Error::None) {
        GW_ERROR("Split failed: " << to_string(split_err));
        return EXIT_FAILURE;
    }
    GW_INFO("Split " << payload.size() << "B into " << frames << " frame(s), " << wire.size() << "B on the wire");

    // -------------------------------------------------------------------------
    // Receive side: feed the stream in chunks that ignore frame boundaries
    // -------------------------------------------------------------------------
    DigestSink sink;
    sink.expected_digest = digest::xxh64(payload);
    sink.expected_size = payload.size();

    pipeline::InboundPipeline<DigestSink> inbound{sink, params.max_frame_size};

    constexpr std::size_t chunk_sizes[] = {7, 300, 1, 4096, 13};
    std::size_t pos = 0;
    std::size_t turn = 0;
    while (pos < wire.size()) {
        const std::size_t n = std::min(chunk_sizes[turn++ % std::size(chunk_sizes)], wire.size() - pos);
        const Error err = inbound.on_bytes(bytes_view{wire.data() + pos, n});
        if (err != Error::None) {
            GW_ERROR("Stream error: " << to_string(err));
            return EXIT_FAILURE;
        }
        pos += n;
    }

    const auto& stats = inbound.stats();
    GW_INFO("Decoded " << stats.frames << " frame(s), " << stats.messages << " message(s), "
            << stats.violations << " violation(s)");

    return (sink.messages == 1 && sink.ok) ? EXIT_SUCCESS : EXIT_FAILURE;
}
