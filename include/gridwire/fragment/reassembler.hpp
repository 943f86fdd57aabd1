#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "gridwire/error.hpp"
#include "gridwire/frame/frame.hpp"
#include "gridwire/fragment/message.hpp"


namespace gridwire::fragment {

/*
===============================================================================
Reassembler
===============================================================================

Rebuilds logical messages from physical frames, keyed by correlation id.

State model (per correlation id):

    AwaitingFirstFragment --BEGIN--------> Accumulating
    AwaitingFirstFragment --BEGIN|END----> Complete
    Accumulating          --(no flags)---> Accumulating
    Accumulating          --END----------> Complete

Complete is terminal: the payload is handed to the caller and the per-id
state is dropped, so the id returns to AwaitingFirstFragment.

Violations:
-----------
• END or a continuation frame without a preceding BEGIN
      -> Error::FramingProtocolViolation
• BEGIN while the id is already Accumulating
      -> Error::DuplicateBegin

Either one drops the partial state of that correlation id only. Other ids
are never touched.

Ordering:
---------
Frames of one correlation id must arrive in send order. Nothing is reordered
or buffered out of order; the stream transport guarantees ordering.

Ownership:
----------
One instance per connection, driven by a single reader. Abandoned partial
messages live until discard()/clear() is called (no timeouts here).
===============================================================================
*/

enum class State : std::uint8_t {
    AwaitingFirstFragment,
    Accumulating,
    Complete
};

[[nodiscard]] std::string_view to_string(State s) noexcept;


class Reassembler {
public:
    Reassembler() = default;

    Reassembler(const Reassembler&) = delete;
    Reassembler& operator=(const Reassembler&) = delete;

    // Feeds one decoded frame. When the frame completes a logical message,
    // `completed` is set and `out` holds it; otherwise `out` is untouched.
    [[nodiscard]] Error feed(const frame::Frame& frame, Message& out, bool& completed);

    // State of a correlation id (AwaitingFirstFragment when unknown)
    [[nodiscard]] State state(std::uint32_t correlation_id) const noexcept;

    // Drops partial state of one correlation id. Returns true if any existed.
    bool discard(std::uint32_t correlation_id) noexcept;

    // Drops every partial message (e.g. on connection teardown)
    void clear() noexcept;

    [[nodiscard]] inline std::size_t pending() const noexcept { return partial_.size(); }

    [[nodiscard]] std::size_t pending_bytes() const noexcept;

private:
    struct Partial {
        std::uint16_t type = 0;
        std::uint8_t version = 0;
        std::uint32_t fragments = 0;
        std::vector<std::uint8_t> payload;
    };

    std::unordered_map<std::uint32_t, Partial> partial_;
};

} // namespace gridwire::fragment
