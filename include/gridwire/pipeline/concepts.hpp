// ============================================================================
// Message Sink Concepts
// ----------------------------------------------------------------------------
//
// Contract between the inbound pipeline and the dispatch layer above it.
//
// -----------------------------------------------------------------------------
// MessageSink
// -----------------------------------------------------------------------------
//
// Receives every reassembled logical message:
//
//   • void on_message(const fragment::Message&)
//
// The sink owns type dispatch. Unrecognized type codes are the sink's to
// report (Error::UnknownType); the pipeline passes the raw type through.
//
// -----------------------------------------------------------------------------
// ViolationAwareSink (optional refinement)
// -----------------------------------------------------------------------------
//
// Additionally notified when one correlation id breaks framing rules:
//
//   • void on_violation(std::uint32_t correlation_id, Error)
//
// ============================================================================
#pragma once

#include <concepts>
#include <cstdint>

#include "gridwire/error.hpp"
#include "gridwire/fragment/message.hpp"


namespace gridwire::pipeline {

template <class S>
concept MessageSink =
    requires(S& s, const fragment::Message& msg) {
        { s.on_message(msg) } -> std::same_as<void>;
    };

template <class S>
concept ViolationAwareSink =
    MessageSink<S> &&
    requires(S& s, std::uint32_t correlation_id, Error err) {
        { s.on_violation(correlation_id, err) } -> std::same_as<void>;
    };

} // namespace gridwire::pipeline
