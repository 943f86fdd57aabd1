#include "gridwire/error.hpp"


namespace gridwire {

std::string_view to_string(Error err) noexcept {
    switch (err) {
        case Error::None:                     return "None";
        case Error::BufferBounds:             return "BufferBounds";
        case Error::CorruptFrame:             return "CorruptFrame";
        case Error::FrameTooLarge:            return "FrameTooLarge";
        case Error::InvalidArgument:          return "InvalidArgument";
        case Error::FramingProtocolViolation: return "FramingProtocolViolation";
        case Error::DuplicateBegin:           return "DuplicateBegin";
        case Error::UnknownType:              return "UnknownType";
    }
    return "Unknown";
}

} // namespace gridwire
