/*
===============================================================================
 fragment::Splitter - Unit Tests
===============================================================================

Scope:
------
Encode-side fragmentation of a logical payload into bounded frames, and its
agreement with the Reassembler.

Covered Requirements:
---------------------
S1. Frame count, flags and size bound for a large payload
S2. Splitter output reassembles to the original payload
S3. Small payload -> one BEGIN|END frame
S4. Empty payload -> one BEGIN|END frame with an empty body
S5. Unusable max frame size is rejected before anything is emitted
S6. A sink error stops the split

===============================================================================
*/

#include <cstdint>
#include <iostream>
#include <vector>

#include "gridwire/fragment/reassembler.hpp"
#include "gridwire/fragment/splitter.hpp"
#include "lcr/log/logger.hpp"
#include "common/test_check.hpp"
#include "common/frame_builder.hpp"

using namespace gridwire;
using namespace gridwire::fragment;

using frames_t = std::vector<std::vector<std::uint8_t>>;


// -----------------------------------------------------------------------------
// S1 + S2. Large payload
// -----------------------------------------------------------------------------
void test_large_payload_round_trip() {
    std::cout << "[TEST] S1/S2: 10000B payload into 1024B frames\n";

    const auto payload = test::frames::pattern(10000, 3);
    Splitter splitter{1024};
    const Header header{77, 0x0A0B, 1};

    TEST_CHECK(splitter.capacity() == 1024 - frame::HEADER_SIZE);
    const std::size_t expected = splitter.frame_count(payload.size());
    TEST_CHECK(expected == (10000 + 1010 - 1) / 1010);

    frames_t wires;
    TEST_CHECK_ERR(splitter.split_to(payload, header, wires), Error::None);
    TEST_CHECK(wires.size() == expected);

    Reassembler r;
    Message msg;
    bool completed = false;
    for (std::size_t i = 0; i < wires.size(); ++i) {
        TEST_CHECK(wires[i].size() <= 1024);

        frame::Frame f = test::frames::decode(wires[i]);
        TEST_CHECK(f.correlation_id() == 77);
        TEST_CHECK(f.type() == 0x0A0B);
        TEST_CHECK(f.version() == 1);
        TEST_CHECK(f.is_begin() == (i == 0));
        TEST_CHECK(f.is_end() == (i + 1 == wires.size()));
        if (i != 0 && i + 1 != wires.size()) {
            TEST_CHECK(f.flags() == 0);
            TEST_CHECK(f.frame_length() == 1024);
        }

        TEST_CHECK_ERR(r.feed(f, msg, completed), Error::None);
        TEST_CHECK(completed == (i + 1 == wires.size()));
    }

    TEST_CHECK(msg.payload == payload);
    TEST_CHECK(msg.fragments == wires.size());
    TEST_CHECK(msg.type == 0x0A0B);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// S3. Fits in one frame
// -----------------------------------------------------------------------------
void test_small_payload_single_frame() {
    std::cout << "[TEST] S3: payload that fits in one frame\n";

    Splitter splitter{64};
    const auto payload = test::frames::pattern(64 - frame::HEADER_SIZE, 9);

    frames_t wires;
    TEST_CHECK_ERR(splitter.split_to(payload, Header{5, 1}, wires), Error::None);
    TEST_CHECK(wires.size() == 1);
    TEST_CHECK(wires[0].size() == 64);

    frame::Frame f = test::frames::decode(wires[0]);
    TEST_CHECK(f.is_complete());
    TEST_CHECK(f.version() == config::codec::PROTOCOL_VERSION);

    const bytes_view body = f.body();
    TEST_CHECK(std::vector<std::uint8_t>(body.begin(), body.end()) == payload);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// S4. Empty payload
// -----------------------------------------------------------------------------
void test_empty_payload() {
    std::cout << "[TEST] S4: empty payload\n";

    Splitter splitter{128};
    TEST_CHECK(splitter.frame_count(0) == 1);

    frames_t wires;
    TEST_CHECK_ERR(splitter.split_to(bytes_view{}, Header{6, 2}, wires), Error::None);
    TEST_CHECK(wires.size() == 1);
    TEST_CHECK(wires[0].size() == frame::HEADER_SIZE);

    frame::Frame f = test::frames::decode(wires[0]);
    TEST_CHECK(f.flags() == frame::BEGIN_AND_END_FLAGS);
    TEST_CHECK(f.body().empty());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// S5. Invalid max frame size
// -----------------------------------------------------------------------------
void test_invalid_max_frame_size() {
    std::cout << "[TEST] S5: unusable max frame size\n";

    const auto payload = test::frames::pattern(10);
    frames_t wires;

    Splitter header_only{frame::HEADER_SIZE};
    TEST_CHECK(header_only.capacity() == 0);
    TEST_CHECK(header_only.frame_count(10) == 0);
    TEST_CHECK_ERR(header_only.split_to(payload, Header{1, 1}, wires), Error::InvalidArgument);

    Splitter tiny{4};
    TEST_CHECK_ERR(tiny.split_to(payload, Header{1, 1}, wires), Error::InvalidArgument);
    TEST_CHECK(wires.empty());

    // One payload byte per frame is still valid
    Splitter minimal{frame::HEADER_SIZE + 1};
    TEST_CHECK_ERR(minimal.split_to(payload, Header{1, 1}, wires), Error::None);
    TEST_CHECK(wires.size() == payload.size());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// S6. Sink error
// -----------------------------------------------------------------------------
void test_sink_error_stops_split() {
    std::cout << "[TEST] S6: sink error stops the split\n";

    Splitter splitter{frame::HEADER_SIZE + 10};
    const auto payload = test::frames::pattern(100);

    std::size_t calls = 0;
    const Error err = splitter.split(payload, Header{2, 3}, [&calls](const frame::Frame&) {
        return ++calls == 3 ? Error::BufferBounds : Error::None;
    });
    TEST_CHECK_ERR(err, Error::BufferBounds);
    TEST_CHECK(calls == 3);

    std::cout << "[TEST] OK\n";
}


int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Debug);

    test_large_payload_round_trip();
    test_small_payload_single_frame();
    test_empty_payload();
    test_invalid_max_frame_size();
    test_sink_error_stops_split();

    std::cout << "\n[SPLITTER TESTS PASSED]\n";
    return 0;
}
