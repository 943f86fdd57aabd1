#pragma once

#include <cstdint>
#include <initializer_list>
#include <vector>

#include "gridwire/buffer/slice.hpp"
#include "gridwire/error.hpp"
#include "gridwire/frame/frame.hpp"
#include "common/test_check.hpp"

// ----------------------------------------------------------------------------
// Helpers that encode complete frames into owned byte vectors
// ----------------------------------------------------------------------------

namespace test::frames {

// One frame with a raw (unprefixed) body, as the splitter produces
inline std::vector<std::uint8_t> raw(std::uint32_t correlation_id, std::uint8_t flags,
                                     const std::vector<std::uint8_t>& body, std::uint16_t type = 42) {
    std::vector<std::uint8_t> storage(gridwire::frame::HEADER_SIZE + body.size());
    gridwire::frame::Frame f;
    TEST_CHECK_ERR(f.wrap_for_encode(gridwire::buffer::Slice{storage.data(), storage.size()}, 0), gridwire::Error::None);
    f.version(1).flags(flags).type(type).correlation_id(correlation_id);
    TEST_CHECK_ERR(f.put_raw_data(body), gridwire::Error::None);
    TEST_CHECK(f.frame_length() == storage.size());
    return storage;
}

// Bytes of a sequence of frames laid out back to back
inline std::vector<std::uint8_t> concat(std::initializer_list<std::vector<std::uint8_t>> parts) {
    std::vector<std::uint8_t> out;
    for (const auto& p : parts) {
        out.insert(out.end(), p.begin(), p.end());
    }
    return out;
}

// Decodes a complete frame that owns nothing; `storage` must outlive it
inline gridwire::frame::Frame decode(std::vector<std::uint8_t>& storage) {
    gridwire::frame::Frame f;
    TEST_CHECK_ERR(f.wrap_for_decode(gridwire::buffer::Slice{storage.data(), storage.size()}, 0), gridwire::Error::None);
    return f;
}

inline std::vector<std::uint8_t> pattern(std::size_t size, std::uint8_t seed = 0) {
    std::vector<std::uint8_t> out(size);
    for (std::size_t i = 0; i < size; ++i) {
        out[i] = static_cast<std::uint8_t>((i * 7u + seed) & 0xFFu);
    }
    return out;
}

} // namespace test::frames
