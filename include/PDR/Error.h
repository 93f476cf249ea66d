// include/PDR/Error.h
// Synopsis: Error codes shared by every channel, codec and adapter.

#pragma once

#include <string>
#include <system_error>

namespace PDR {

enum class ProtocolError {
    Success = 0,              // Operation completed successfully

    // Flow control (not faults)
    ChannelFull = 0x100,      // No free slot, entry not published
    ChannelEmpty,             // Nothing to pop
    ChannelNotReady,          // Header not initialized yet, retry next wakeup

    // Fatal, channel-local
    IndexRangeViolation = 0x200, // Occupancy outside [0, capacity]
    LayoutMismatch,           // Header capacity/entry size/ABI differ from compiled layout
    ChannelPoisoned,          // Channel was poisoned by an earlier fatal fault

    // Region / mapping
    RegionTooSmall = 0x300,   // Region shorter than the layout it must hold
    RegionMisaligned,         // Region base not aligned for the header/entries
    OutOfBounds,              // Typed view access outside the region

    // Entry decode / encode
    UnknownDiscriminant = 0x400, // event_type / command / flags value not recognised
    LengthOutOfRange,         // Length field above the declared maximum (or zero)
    InvalidField,             // Reserved/flag field carries an illegal value
    PayloadTooLarge,          // Producer-side payload exceeds the entry capacity
    EmptyPayload,             // Producer-side payload is empty

    // Pixel buffer handshake
    BufferBusy = 0x500,       // Buffer still owned by the other side
    BufferNotReady,           // Reader found no published image
    InvalidDimensions,        // Width/height zero or above the limits
    InvalidPixelFormat,       // Unknown pixel format code
    ChecksumMismatch,         // Published checksum does not match the data

    // Configuration
    InvalidConfig = 0x600,    // Malformed or inconsistent system configuration
    NotFound,                 // Named channel not present in configuration
    IOError                   // Failed to read configuration file or map memory
};

namespace detail {
    struct ProtocolErrorCategory : std::error_category {
        const char* name() const noexcept override { return "PDRing"; }
        std::string message(int ev) const override {
            switch (static_cast<ProtocolError>(ev)) {
                case ProtocolError::Success: return "Success";
                case ProtocolError::ChannelFull: return "Channel full";
                case ProtocolError::ChannelEmpty: return "Channel empty";
                case ProtocolError::ChannelNotReady: return "Channel not initialized";
                case ProtocolError::IndexRangeViolation: return "Index range violation";
                case ProtocolError::LayoutMismatch: return "Ring layout mismatch";
                case ProtocolError::ChannelPoisoned: return "Channel poisoned";
                case ProtocolError::RegionTooSmall: return "Shared region too small";
                case ProtocolError::RegionMisaligned: return "Shared region misaligned";
                case ProtocolError::OutOfBounds: return "Access outside shared region";
                case ProtocolError::UnknownDiscriminant: return "Unknown discriminant";
                case ProtocolError::LengthOutOfRange: return "Length out of range";
                case ProtocolError::InvalidField: return "Invalid field value";
                case ProtocolError::PayloadTooLarge: return "Payload too large";
                case ProtocolError::EmptyPayload: return "Empty payload";
                case ProtocolError::BufferBusy: return "Pixel buffer busy";
                case ProtocolError::BufferNotReady: return "Pixel buffer not ready";
                case ProtocolError::InvalidDimensions: return "Invalid image dimensions";
                case ProtocolError::InvalidPixelFormat: return "Invalid pixel format";
                case ProtocolError::ChecksumMismatch: return "Checksum mismatch";
                case ProtocolError::InvalidConfig: return "Invalid configuration";
                case ProtocolError::NotFound: return "Not found";
                case ProtocolError::IOError: return "I/O error";
                default: return "Unknown error";
            }
        }
    };
}

inline const std::error_category& protocol_error_category() noexcept {
    static detail::ProtocolErrorCategory category;
    return category;
}

inline std::error_code make_error_code(ProtocolError e) noexcept {
    return {static_cast<int>(e), protocol_error_category()};
}

/// True for faults after which a channel must not be touched again.
inline bool isFatal(ProtocolError e) noexcept {
    return e == ProtocolError::IndexRangeViolation ||
           e == ProtocolError::LayoutMismatch ||
           e == ProtocolError::ChannelPoisoned;
}

} // namespace PDR

namespace std {
    template<>
    struct is_error_code_enum<PDR::ProtocolError> : true_type {};
}
