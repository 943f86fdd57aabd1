#pragma once

#include <cstdint>

#include <xxhash.h>

#include "gridwire/buffer/slice.hpp"


namespace gridwire::digest {

// XXH64 of a payload; used to check reassembled payloads end to end
[[nodiscard]] inline std::uint64_t xxh64(bytes_view bytes, std::uint64_t seed = 0) noexcept {
    return XXH64(bytes.data(), bytes.size(), seed);
}

} // namespace gridwire::digest
