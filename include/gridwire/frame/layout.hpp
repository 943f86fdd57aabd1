#pragma once

#include <cstddef>
#include <cstdint>

/*
================================================================================
Frame Layout
================================================================================

 0                   1                   2                   3
 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
|R|                      Frame Length                           |
+---------------------------------------------------------------+
|R|                     Correlation Id                          |
+-------------+---------------+---------------------------------+
|   Version   |B|E|   Flags   |              Type               |
+-------------+---------------+---------------------------------+
|         Data Offset         |                                 |
+-----------------------------+                                 |
|                     Message Payload Data                    ...

All multi-byte fields are little-endian. R is reserved: always written as 0,
ignored on read.

Body: (data_offset - HEADER_SIZE) bytes of fixed body, then zero or more
[u32 length][length bytes] segments.

================================================================================
*/

namespace gridwire::frame {

// -----------------------------------------------------------------------------
// Field widths
// -----------------------------------------------------------------------------
inline constexpr std::size_t SIZE_OF_BYTE  = 1;
inline constexpr std::size_t SIZE_OF_SHORT = 2;
inline constexpr std::size_t SIZE_OF_INT   = 4;

// -----------------------------------------------------------------------------
// Field offsets (relative to frame start)
// -----------------------------------------------------------------------------
inline constexpr std::size_t FRAME_LENGTH_FIELD_OFFSET   = 0;
inline constexpr std::size_t CORRELATION_ID_FIELD_OFFSET = FRAME_LENGTH_FIELD_OFFSET + SIZE_OF_INT;
inline constexpr std::size_t VERSION_FIELD_OFFSET        = CORRELATION_ID_FIELD_OFFSET + SIZE_OF_INT;
inline constexpr std::size_t FLAGS_FIELD_OFFSET          = VERSION_FIELD_OFFSET + SIZE_OF_BYTE;
inline constexpr std::size_t TYPE_FIELD_OFFSET           = FLAGS_FIELD_OFFSET + SIZE_OF_BYTE;
inline constexpr std::size_t DATA_OFFSET_FIELD_OFFSET    = TYPE_FIELD_OFFSET + SIZE_OF_SHORT;

inline constexpr std::size_t HEADER_SIZE = DATA_OFFSET_FIELD_OFFSET + SIZE_OF_SHORT;

// Length prefix of a variable data segment
inline constexpr std::size_t SIZE_OF_LENGTH_FIELD = SIZE_OF_INT;

// -----------------------------------------------------------------------------
// Flags
// -----------------------------------------------------------------------------
inline constexpr std::uint8_t BEGIN_FLAG          = 0x80;
inline constexpr std::uint8_t END_FLAG            = 0x40;
inline constexpr std::uint8_t BEGIN_AND_END_FLAGS = BEGIN_FLAG | END_FLAG;

// -----------------------------------------------------------------------------
// Reserved bit (bit 31 of frame length and correlation id)
// -----------------------------------------------------------------------------
inline constexpr std::uint32_t RESERVED_BIT  = 0x80000000u;
inline constexpr std::uint32_t VALUE_MASK_31 = 0x7FFFFFFFu;

// ======================================================
// Layout validation (prevent wire drift)
// ======================================================
static_assert(FRAME_LENGTH_FIELD_OFFSET == 0,    "frame_length offset mismatch");
static_assert(CORRELATION_ID_FIELD_OFFSET == 4,  "correlation_id offset mismatch");
static_assert(VERSION_FIELD_OFFSET == 8,         "version offset mismatch");
static_assert(FLAGS_FIELD_OFFSET == 9,           "flags offset mismatch");
static_assert(TYPE_FIELD_OFFSET == 10,           "type offset mismatch");
static_assert(DATA_OFFSET_FIELD_OFFSET == 12,    "data_offset offset mismatch");
static_assert(HEADER_SIZE == 14,                 "header size mismatch");
static_assert(BEGIN_AND_END_FLAGS == 0xC0,       "flag bits mismatch");

} // namespace gridwire::frame
