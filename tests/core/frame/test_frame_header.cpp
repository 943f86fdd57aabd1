/*
===============================================================================
 frame::Frame - Header Codec Tests
===============================================================================

Scope:
------
Fixed header layout, wrap_for_encode / wrap_for_decode contracts, reserved
bit handling and flag helpers.

Covered Requirements:
---------------------
H1. wrap_for_encode initializes data_offset, frame_length and the cursor
H2. Header fields round trip for every (version, flags, type) triple sampled
H3. Exact byte offsets on the wire
H4. flags/type mutators never change frame_length
H5. Reserved bit cleared on write and masked on read
H6. wrap_for_decode rejects short, truncated and inconsistent frames
H7. wrap_for_decode never mutates the buffer
H8. Frames at a non-zero offset inside a larger buffer

===============================================================================
*/

#include <array>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "gridwire/frame/frame.hpp"
#include "lcr/log/logger.hpp"
#include "common/test_check.hpp"

using namespace gridwire;
using namespace gridwire::frame;


// -----------------------------------------------------------------------------
// H1. wrap_for_encode
// -----------------------------------------------------------------------------
void test_wrap_for_encode_initializes_header() {
    std::cout << "[TEST] H1: wrap_for_encode initializes header\n";

    std::array<std::uint8_t, 64> storage;
    storage.fill(0xEE);
    Frame f;
    TEST_CHECK_ERR(f.wrap_for_encode(buffer::Slice{storage.data(), storage.size()}, 0), Error::None);

    TEST_CHECK(f.is_wrapped());
    TEST_CHECK(f.data_offset() == HEADER_SIZE);
    TEST_CHECK(f.frame_length() == HEADER_SIZE);
    TEST_CHECK(f.data_position() == HEADER_SIZE);
    TEST_CHECK(!f.has_remaining_data());
    TEST_CHECK(f.body().empty());
    TEST_CHECK(f.bytes().size() == HEADER_SIZE);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// H2. Round trip
// -----------------------------------------------------------------------------
void test_header_round_trip() {
    std::cout << "[TEST] H2: header round trip\n";

    const std::uint8_t versions[] = {0, 1, 2, 0x7F, 0xFF};
    const std::uint8_t flag_values[] = {0x00, BEGIN_FLAG, END_FLAG, BEGIN_AND_END_FLAGS, 0x3F, 0xFF};
    const std::uint16_t types[] = {0, 1, 42, 0x7FFF, 0x8000, 0xFFFF};

    std::array<std::uint8_t, 32> storage{};
    for (auto ver : versions) {
        for (auto fl : flag_values) {
            for (auto ty : types) {
                Frame enc;
                TEST_CHECK_ERR(enc.wrap_for_encode(buffer::Slice{storage.data(), storage.size()}, 0), Error::None);
                enc.version(ver).flags(fl).type(ty).correlation_id(12345);

                Frame dec;
                TEST_CHECK_ERR(dec.wrap_for_decode(buffer::Slice{storage.data(), storage.size()}, 0), Error::None);
                TEST_CHECK(dec.version() == ver);
                TEST_CHECK(dec.flags() == fl);
                TEST_CHECK(dec.type() == ty);
                TEST_CHECK(dec.correlation_id() == 12345u);
                TEST_CHECK(dec.data_offset() == HEADER_SIZE);
                TEST_CHECK(dec.frame_length() == HEADER_SIZE);
            }
        }
    }

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// H3. Wire offsets
// -----------------------------------------------------------------------------
void test_wire_offsets() {
    std::cout << "[TEST] H3: exact wire offsets\n";

    std::array<std::uint8_t, HEADER_SIZE> storage{};
    Frame f;
    TEST_CHECK_ERR(f.wrap_for_encode(buffer::Slice{storage.data(), storage.size()}, 0), Error::None);
    f.correlation_id(0x01020304u).version(0x05).flags(0xC0).type(0x0708);

    const std::array<std::uint8_t, HEADER_SIZE> expected{
        0x0E, 0x00, 0x00, 0x00,   // frame_length = 14
        0x04, 0x03, 0x02, 0x01,   // correlation_id
        0x05,                     // version
        0xC0,                     // flags
        0x08, 0x07,               // type
        0x0E, 0x00                // data_offset = 14
    };
    TEST_CHECK(storage == expected);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// H4. flags/type leave frame_length alone
// -----------------------------------------------------------------------------
void test_flags_and_type_do_not_touch_length() {
    std::cout << "[TEST] H4: flags/type never change frame_length\n";

    std::array<std::uint8_t, 64> storage{};
    Frame f;
    TEST_CHECK_ERR(f.wrap_for_encode(buffer::Slice{storage.data(), storage.size()}, 0), Error::None);
    const std::array<std::uint8_t, 5> seg{1, 2, 3, 4, 5};
    TEST_CHECK_ERR(f.put_var_data(seg), Error::None);
    const auto length = f.frame_length();

    f.flags(BEGIN_FLAG);
    f.add_flag(END_FLAG);
    f.type(0xFFFF);
    TEST_CHECK(f.frame_length() == length);
    TEST_CHECK(f.is_begin());
    TEST_CHECK(f.is_end());
    TEST_CHECK(f.is_complete());
    TEST_CHECK(f.flags() == BEGIN_AND_END_FLAGS);

    f.flags(END_FLAG);
    TEST_CHECK(!f.is_begin());
    TEST_CHECK(!f.is_complete());
    TEST_CHECK(f.is_flag_set(END_FLAG));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// H5. Reserved bit
// -----------------------------------------------------------------------------
void test_reserved_bit() {
    std::cout << "[TEST] H5: reserved bit cleared on write, masked on read\n";

    std::array<std::uint8_t, 32> storage{};
    Frame f;
    TEST_CHECK_ERR(f.wrap_for_encode(buffer::Slice{storage.data(), storage.size()}, 0), Error::None);

    // The clearing is reported as a warning
    std::ostringstream captured;
    auto& logger = lcr::log::Logger::instance();
    std::ostream* previous = logger.set_output(&captured);
    f.correlation_id(0x80000007u);
    logger.set_output(previous);

    TEST_CHECK(f.correlation_id() == 7u);
    TEST_CHECK(storage[CORRELATION_ID_FIELD_OFFSET + 3] == 0x00);
    TEST_CHECK(captured.str().find("[WARN]") != std::string::npos);
    TEST_CHECK(captured.str().find("correlation_id") != std::string::npos);

    // A peer that sets the bit anyway: ignored on read
    storage[CORRELATION_ID_FIELD_OFFSET + 3] = 0x80;
    storage[FRAME_LENGTH_FIELD_OFFSET + 3] = 0x80;
    Frame dec;
    TEST_CHECK_ERR(dec.wrap_for_decode(buffer::Slice{storage.data(), storage.size()}, 0), Error::None);
    TEST_CHECK(dec.correlation_id() == 7u);
    TEST_CHECK(dec.frame_length() == HEADER_SIZE);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// H6. Decode validation
// -----------------------------------------------------------------------------
void test_wrap_for_decode_validation() {
    std::cout << "[TEST] H6: wrap_for_decode validation\n";

    // Shorter than a header
    {
        std::array<std::uint8_t, HEADER_SIZE - 1> storage{};
        Frame f;
        TEST_CHECK_ERR(f.wrap_for_decode(buffer::Slice{storage.data(), storage.size()}, 0), Error::BufferBounds);
        TEST_CHECK(!f.is_wrapped());
    }
    // Header fits only from an offset that leaves too little room
    {
        std::array<std::uint8_t, 20> storage{};
        Frame f;
        TEST_CHECK_ERR(f.wrap_for_decode(buffer::Slice{storage.data(), storage.size()}, 10), Error::BufferBounds);
    }

    std::array<std::uint8_t, 32> storage{};
    Frame enc;
    TEST_CHECK_ERR(enc.wrap_for_encode(buffer::Slice{storage.data(), storage.size()}, 0), Error::None);

    // frame_length beyond the region (truncated frame)
    enc.frame_length(40);
    {
        Frame f;
        TEST_CHECK_ERR(f.wrap_for_decode(buffer::Slice{storage.data(), storage.size()}, 0), Error::BufferBounds);
    }
    // data_offset below HEADER_SIZE
    enc.frame_length(HEADER_SIZE).data_offset(4);
    {
        Frame f;
        TEST_CHECK_ERR(f.wrap_for_decode(buffer::Slice{storage.data(), storage.size()}, 0), Error::CorruptFrame);
    }
    // frame_length below data_offset
    enc.data_offset(20).frame_length(18);
    {
        Frame f;
        TEST_CHECK_ERR(f.wrap_for_decode(buffer::Slice{storage.data(), storage.size()}, 0), Error::CorruptFrame);
    }
    // Fixed body region: data_offset > HEADER_SIZE is legal
    enc.data_offset(20).frame_length(24);
    {
        Frame f;
        TEST_CHECK_ERR(f.wrap_for_decode(buffer::Slice{storage.data(), storage.size()}, 0), Error::None);
        TEST_CHECK(f.data_position() == 20);
        TEST_CHECK(f.fixed_body().size() == 6);
        TEST_CHECK(f.body().size() == 4);
    }

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// H7. Decode is read-only
// -----------------------------------------------------------------------------
void test_wrap_for_decode_does_not_mutate() {
    std::cout << "[TEST] H7: wrap_for_decode does not mutate\n";

    std::array<std::uint8_t, 32> storage{};
    Frame enc;
    TEST_CHECK_ERR(enc.wrap_for_encode(buffer::Slice{storage.data(), storage.size()}, 0), Error::None);
    enc.version(3).flags(BEGIN_FLAG).type(9).correlation_id(99);
    const std::array<std::uint8_t, 2> seg{0xAA, 0xBB};
    TEST_CHECK_ERR(enc.put_var_data(seg), Error::None);

    const auto snapshot = storage;
    Frame dec;
    TEST_CHECK_ERR(dec.wrap_for_decode(buffer::Slice{storage.data(), storage.size()}, 0), Error::None);
    std::vector<std::uint8_t> out;
    TEST_CHECK_ERR(dec.get_var_data(out), Error::None);
    TEST_CHECK(storage == snapshot);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// H8. Non-zero offset
// -----------------------------------------------------------------------------
void test_frame_at_offset() {
    std::cout << "[TEST] H8: frame at a non-zero offset\n";

    std::array<std::uint8_t, 64> storage;
    storage.fill(0x55);
    Frame enc;
    TEST_CHECK_ERR(enc.wrap_for_encode(buffer::Slice{storage.data(), storage.size()}, 10), Error::None);
    enc.version(1).flags(BEGIN_AND_END_FLAGS).type(7).correlation_id(3);

    TEST_CHECK(storage[9] == 0x55);                 // byte before the frame untouched
    TEST_CHECK(storage[10] == HEADER_SIZE);         // frame_length low byte
    TEST_CHECK(enc.bytes().data() == storage.data() + 10);

    Frame dec;
    TEST_CHECK_ERR(dec.wrap_for_decode(buffer::Slice{storage.data(), storage.size()}, 10), Error::None);
    TEST_CHECK(dec.offset() == 10);
    TEST_CHECK(dec.type() == 7);
    TEST_CHECK(dec.correlation_id() == 3);

    std::cout << "[TEST] OK\n";
}


int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Trace);

    test_wrap_for_encode_initializes_header();
    test_header_round_trip();
    test_wire_offsets();
    test_flags_and_type_do_not_touch_length();
    test_reserved_bit();
    test_wrap_for_decode_validation();
    test_wrap_for_decode_does_not_mutate();
    test_frame_at_offset();

    std::cout << "\n[FRAME HEADER TESTS PASSED]\n";
    return 0;
}
