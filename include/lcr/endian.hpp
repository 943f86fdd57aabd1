#pragma once

#include <cstdint>
#include <cstring>
#include <type_traits>
#if defined(_MSC_VER)
#  include <stdlib.h> // _byteswap_* intrinsics
#endif


// -------------------------------------------------------------
// Byte order helpers for wire encoding
// -------------------------------------------------------------
// Wire integers are stored at arbitrary (possibly unaligned)
// byte offsets, so every access goes through memcpy + swap.
// -------------------------------------------------------------

// Detect endianness (portable fallback)
#if defined(__BYTE_ORDER__) && defined(__ORDER_LITTLE_ENDIAN__) && defined(__ORDER_BIG_ENDIAN__)
#  define LCR_HOST_IS_LITTLE_ENDIAN (__BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__)
#elif defined(_WIN32)
#  define LCR_HOST_IS_LITTLE_ENDIAN 1
#else
#  error "Cannot determine host endianness"
#endif


namespace lcr {

enum class ByteOrder : std::uint8_t {
    Little,
    Big
};

inline constexpr ByteOrder native_order = LCR_HOST_IS_LITTLE_ENDIAN ? ByteOrder::Little : ByteOrder::Big;

// -------------------------------------------------------------
// Byte-swap primitives (compiler intrinsics preferred)
// -------------------------------------------------------------
inline constexpr std::uint16_t bswap(std::uint16_t x) noexcept {
#if defined(_MSC_VER)
    return static_cast<std::uint16_t>((x >> 8) | (x << 8));
#else
    return __builtin_bswap16(x);
#endif
}

inline constexpr std::uint32_t bswap(std::uint32_t x) noexcept {
#if defined(_MSC_VER)
    return ((x & 0x000000FFu) << 24) | ((x & 0x0000FF00u) << 8) |
           ((x & 0x00FF0000u) >> 8)  | ((x & 0xFF000000u) >> 24);
#else
    return __builtin_bswap32(x);
#endif
}

// -------------------------------------------------------------
// Host <-> requested order
// -------------------------------------------------------------
template <typename T>
inline constexpr T to_order(T value, ByteOrder order) noexcept {
    static_assert(std::is_unsigned_v<T> && (sizeof(T) == 1 || sizeof(T) == 2 || sizeof(T) == 4),
                  "Unsupported type for byte order conversion");
    if constexpr (sizeof(T) == 1) {
        return value;
    } else {
        return order == native_order ? value : bswap(value);
    }
}

template <typename T>
inline constexpr T from_order(T value, ByteOrder order) noexcept {
    return to_order(value, order); // symmetric
}

// -------------------------------------------------------------
// Unaligned load / store (caller guarantees sizeof(T) bytes)
// -------------------------------------------------------------
template <typename T>
[[nodiscard]] inline T load(const std::uint8_t* src, ByteOrder order) noexcept {
    T raw;
    std::memcpy(&raw, src, sizeof(T));
    return from_order(raw, order);
}

template <typename T>
inline void store(std::uint8_t* dst, T value, ByteOrder order) noexcept {
    const T raw = to_order(value, order);
    std::memcpy(dst, &raw, sizeof(T));
}

} // namespace lcr
