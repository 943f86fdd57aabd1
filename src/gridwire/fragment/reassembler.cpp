#include "gridwire/fragment/reassembler.hpp"

#include "lcr/log/logger.hpp"


namespace gridwire::fragment {

std::string_view to_string(State s) noexcept {
    switch (s) {
        case State::AwaitingFirstFragment: return "AwaitingFirstFragment";
        case State::Accumulating:          return "Accumulating";
        case State::Complete:              return "Complete";
    }
    return "Unknown";
}

std::ostream& operator<<(std::ostream& os, const Message& msg) {
    os << "[message] {"
       << "correlation_id=" << msg.correlation_id
       << ", type=" << msg.type
       << ", version=" << static_cast<unsigned>(msg.version)
       << ", fragments=" << msg.fragments
       << ", payload=" << msg.payload.size() << "B"
       << "}";
    return os;
}

Error Reassembler::feed(const frame::Frame& frame, Message& out, bool& completed) {
    completed = false;

    const std::uint32_t cid = frame.correlation_id();
    const bool begin = frame.is_begin();
    const bool end = frame.is_end();
    const bytes_view body = frame.body();

    auto it = partial_.find(cid);

    // 1) AwaitingFirstFragment
    if (it == partial_.end()) {
        if (!begin) {
            GW_WARN("[REASM] Frame without BEGIN for idle correlation id " << cid
                    << " (flags=0x" << std::hex << static_cast<unsigned>(frame.flags()) << std::dec << ")");
            return Error::FramingProtocolViolation;
        }
        if (end) {
            // Unfragmented message, no state kept
            out.correlation_id = cid;
            out.type = frame.type();
            out.version = frame.version();
            out.fragments = 1;
            out.payload.assign(body.begin(), body.end());
            completed = true;
            GW_TRACE("[REASM] " << cid << ": AwaitingFirstFragment -> Complete (" << body.size() << "B)");
            return Error::None;
        }
        Partial& p = partial_[cid];
        p.type = frame.type();
        p.version = frame.version();
        p.fragments = 1;
        p.payload.assign(body.begin(), body.end());
        GW_TRACE("[REASM] " << cid << ": AwaitingFirstFragment -> Accumulating (" << body.size() << "B)");
        return Error::None;
    }

    // 2) Accumulating
    if (begin) {
        GW_WARN("[REASM] Duplicate BEGIN for correlation id " << cid << ", dropping "
                << it->second.payload.size() << "B of partial payload");
        partial_.erase(it);
        return Error::DuplicateBegin;
    }

    Partial& p = it->second;
    p.payload.insert(p.payload.end(), body.begin(), body.end());
    ++p.fragments;

    if (!end) {
        GW_TRACE("[REASM] " << cid << ": Accumulating (+" << body.size() << "B, total=" << p.payload.size() << "B)");
        return Error::None;
    }

    out.correlation_id = cid;
    out.type = p.type;
    out.version = p.version;
    out.fragments = p.fragments;
    out.payload = std::move(p.payload);
    partial_.erase(it);
    completed = true;
    GW_TRACE("[REASM] " << cid << ": Accumulating -> Complete (" << out.payload.size() << "B in "
             << out.fragments << " frames)");
    return Error::None;
}

State Reassembler::state(std::uint32_t correlation_id) const noexcept {
    return partial_.contains(correlation_id) ? State::Accumulating : State::AwaitingFirstFragment;
}

bool Reassembler::discard(std::uint32_t correlation_id) noexcept {
    const bool erased = partial_.erase(correlation_id) != 0;
    if (erased) {
        GW_DEBUG("[REASM] Discarded partial message for correlation id " << correlation_id);
    }
    return erased;
}

void Reassembler::clear() noexcept {
    if (!partial_.empty()) {
        GW_DEBUG("[REASM] Clearing " << partial_.size() << " partial message(s)");
    }
    partial_.clear();
}

std::size_t Reassembler::pending_bytes() const noexcept {
    std::size_t total = 0;
    for (const auto& [cid, p] : partial_) {
        total += p.payload.size();
    }
    return total;
}

} // namespace gridwire::fragment
