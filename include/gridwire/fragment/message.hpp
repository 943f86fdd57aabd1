#pragma once

#include <cstdint>
#include <ostream>
#include <vector>


namespace gridwire::fragment {

// ---------------------------------------------------------------------------
// Logical message: what the dispatch layer consumes
// ---------------------------------------------------------------------------
struct Message {
    std::uint32_t correlation_id = 0;
    std::uint16_t type = 0;          // raw type code of the BEGIN frame
    std::uint8_t version = 0;
    std::uint32_t fragments = 0;     // physical frames that carried it
    std::vector<std::uint8_t> payload;

    inline void reset() noexcept {
        correlation_id = 0;
        type = 0;
        version = 0;
        fragments = 0;
        payload.clear();
    }
};

std::ostream& operator<<(std::ostream& os, const Message& msg);

} // namespace gridwire::fragment
