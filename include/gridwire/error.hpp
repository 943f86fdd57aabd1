#pragma once

#include <cstdint>
#include <string_view>

namespace gridwire {

/*
===============================================================================
 gridwire::Error
===============================================================================

Codec-level error classification.

Every fallible codec call returns one of these. Errors are scoped to the one
frame or logical message being processed; converting them into request- or
connection-level failures is the caller's decision.
===============================================================================
*/

enum class Error : std::uint8_t {
    None = 0,

    // --- Buffer / layout errors (frame must be treated as corrupt) ----------
    BufferBounds,             // Read or write outside the supplied buffer region or frame
    CorruptFrame,             // Header violates frame_length >= data_offset >= HEADER_SIZE
    FrameTooLarge,            // Frame length exceeds the 31-bit field or a configured limit

    // --- Caller contract errors ---------------------------------------------
    InvalidArgument,          // Absent byte array, unusable frame size, etc.

    // --- Reassembly errors (scoped to one correlation id) -------------------
    FramingProtocolViolation, // END or continuation without a preceding BEGIN
    DuplicateBegin,           // BEGIN while the correlation id is already accumulating

    // --- Reported by the dispatch layer, never by the codec -----------------
    UnknownType,              // Decoded type code not recognized by the consumer
};


[[nodiscard]] std::string_view to_string(Error err) noexcept;

// Both reassembly errors are framing protocol violations
[[nodiscard]] inline constexpr bool is_framing_violation(Error err) noexcept {
    return err == Error::FramingProtocolViolation || err == Error::DuplicateBegin;
}

} // namespace gridwire
