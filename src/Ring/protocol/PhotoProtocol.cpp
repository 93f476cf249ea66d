#include "Ring/protocol/PhotoProtocol.hpp"

namespace PDR {
namespace Ring {

const char* photoCommandName(PhotoCommandType type) noexcept {
    switch (type) {
        case PhotoCommandType::None:         return "None";
        case PhotoCommandType::Next:         return "Next";
        case PhotoCommandType::Prev:         return "Prev";
        case PhotoCommandType::Pause:        return "Pause";
        case PhotoCommandType::Resume:       return "Resume";
        case PhotoCommandType::Goto:         return "Goto";
        case PhotoCommandType::LoadComplete: return "LoadComplete";
        case PhotoCommandType::LoadError:    return "LoadError";
    }
    return "Invalid";
}

std::expected<PhotoCommandEntry, ProtocolError> PhotoCommandCodec::encode(const PhotoCommand& command) noexcept {
    const auto raw = static_cast<uint8_t>(command.type);
    if (raw == 0 || raw > static_cast<uint8_t>(PhotoCommandType::LoadError)) {
        return std::unexpected(ProtocolError::UnknownDiscriminant);
    }
    if (!command.carriesIndex() && command.photoIndex != 0) {
        return std::unexpected(ProtocolError::InvalidField);
    }
    return PhotoCommandEntry{raw, 0, command.photoIndex, 0};
}

std::expected<PhotoCommand, ProtocolError> PhotoCommandCodec::decode(const PhotoCommandEntry& entry) noexcept {
    if (entry.command == 0 || entry.command > static_cast<uint8_t>(PhotoCommandType::LoadError)) {
        return std::unexpected(ProtocolError::UnknownDiscriminant);
    }
    if (entry.flags != 0 || entry.reserved != 0) {
        return std::unexpected(ProtocolError::InvalidField);
    }

    PhotoCommand command{static_cast<PhotoCommandType>(entry.command), entry.photoIndex};
    if (!command.carriesIndex() && command.photoIndex != 0) {
        return std::unexpected(ProtocolError::InvalidField);
    }
    return command;
}

} // namespace Ring
} // namespace PDR
