// ============================================================================
// frame_roundtrip
// ----------------------------------------------------------------------------
// Encodes one single-frame message with a three-byte segment, dumps the wire
// bytes, then decodes them back from the same buffer.
// ============================================================================

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <vector>

#include "gridwire.hpp"
#include "common/cli/params.hpp"

using namespace gridwire;


static void hex_dump(bytes_view bytes, std::ostream& os) {
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i % 16 == 0) {
            os << (i ? "\n" : "") << "  " << std::setw(4) << std::setfill('0') << std::hex << i << ": ";
        }
        os << std::setw(2) << std::setfill('0') << std::hex << static_cast<unsigned>(bytes[i]) << ' ';
    }
    os << std::dec << std::setfill(' ') << "\n";
}

int main(int argc, char** argv) {
    const auto params = examples::cli::configure(argc, argv,
        "gridwire frame round trip",
        "Encodes a BEGIN|END frame carrying the segment [01 02 03], prints it and decodes it back."
    );
    params.dump("=== Frame round trip ===", std::cout);

    std::array<std::uint8_t, 64> storage{};
    const buffer::Slice region{storage.data(), storage.size()};

    // -------------------------------------------------------------------------
    // Encode
    // -------------------------------------------------------------------------
    frame::Frame out;
    Error err = out.wrap_for_encode(region, 0);
    if (err != Error::None) {
        GW_ERROR("wrap_for_encode failed: " << to_string(err));
        return EXIT_FAILURE;
    }
    out.version(static_cast<std::uint8_t>(params.version))
       .flags(frame::BEGIN_AND_END_FLAGS)
       .type(static_cast<std::uint16_t>(params.type))
       .correlation_id(params.correlation_id);

    const std::array<std::uint8_t, 3> segment{0x01, 0x02, 0x03};
    err = out.put_var_data(segment);
    if (err != Error::None) {
        GW_ERROR("put_var_data failed: " << to_string(err));
        return EXIT_FAILURE;
    }

    std::cout << "\nEncoded " << out << "\n";
    hex_dump(out.bytes(), std::cout);

    // -------------------------------------------------------------------------
    // Decode (only the frame's own bytes are exposed to the decoder)
    // -------------------------------------------------------------------------
    frame::Frame in;
    err = in.wrap_for_decode(region.subslice(0, out.frame_length()), 0);
    if (err != Error::None) {
        GW_ERROR("wrap_for_decode failed: " << to_string(err));
        return EXIT_FAILURE;
    }

    std::vector<std::uint8_t> decoded;
    err = in.get_var_data(decoded);
    if (err != Error::None) {
        GW_ERROR("get_var_data failed: " << to_string(err));
        return EXIT_FAILURE;
    }

    std::cout << "\nDecoded " << in << "\n  segment: ";
    for (auto b : decoded) {
        std::cout << "0x" << std::setw(2) << std::setfill('0') << std::hex << static_cast<unsigned>(b) << ' ';
    }
    std::cout << std::dec << std::setfill(' ') << "\n";

    const bool match = decoded.size() == segment.size() &&
                       std::equal(decoded.begin(), decoded.end(), segment.begin());
    if (!match) {
        GW_ERROR("Decoded segment differs from encoded segment");
        return EXIT_FAILURE;
    }
    GW_INFO("Round trip OK (" << in.frame_length() << " bytes)");
    return EXIT_SUCCESS;
}
