/*
================================================================================
Codec Configuration
================================================================================

Purpose
-------
Compile-time defaults for the frame codec and the components built on it.

Frame size limits
-----------------
MAX_FRAME_LENGTH:
    Upper bound imposed by the wire format. Bit 31 of the frame length field
    is reserved, so a frame can never exceed 2^31 - 1 bytes.

DEFAULT_MAX_FRAME_SIZE:
    Physical frame size used by the splitter when the caller does not pick
    one. Logical messages larger than this are fragmented.

ACCUMULATOR_MAX_FRAME_SIZE:
    Largest inbound frame the stream accumulator will buffer. A peer that
    announces a larger frame is rejected before any body byte is stored.

Invariant:
    HEADER_SIZE < DEFAULT_MAX_FRAME_SIZE <= ACCUMULATOR_MAX_FRAME_SIZE <= MAX_FRAME_LENGTH

================================================================================
*/
#pragma once

#include <cstddef>
#include <cstdint>


namespace gridwire::config::codec {

// -----------------------------------------------------------------------------
// Protocol version written by wrap_for_encode callers
// -----------------------------------------------------------------------------
inline constexpr static std::uint8_t PROTOCOL_VERSION = 1;

// -----------------------------------------------------------------------------
// Frame size limits
// -----------------------------------------------------------------------------
inline constexpr static std::uint32_t MAX_FRAME_LENGTH           = 0x7FFFFFFFu;
inline constexpr static std::uint32_t DEFAULT_MAX_FRAME_SIZE     = 8 * 1024;
inline constexpr static std::uint32_t ACCUMULATOR_MAX_FRAME_SIZE = 16 * 1024 * 1024;

static_assert(DEFAULT_MAX_FRAME_SIZE <= ACCUMULATOR_MAX_FRAME_SIZE);
static_assert(ACCUMULATOR_MAX_FRAME_SIZE <= MAX_FRAME_LENGTH);

} // namespace gridwire::config::codec
