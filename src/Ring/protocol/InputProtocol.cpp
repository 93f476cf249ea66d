#include "Ring/protocol/InputProtocol.hpp"

namespace PDR {
namespace Ring {

bool isKnownKeyCode(uint8_t raw) noexcept {
    if (raw <= 7) return true;                  // Unknown .. Space
    if (raw >= 10 && raw <= 23) return true;    // Num0 .. PageDown
    if (raw >= 30 && raw <= 32) return true;    // VolumeUp .. Mute
    return false;
}

bool isKnownIrButton(uint8_t raw) noexcept {
    if (raw <= 0x08) return true;
    if (raw >= 0x10 && raw <= 0x19) return true;
    if (raw >= 0x20 && raw <= 0x24) return true;
    if (raw >= 0x30 && raw <= 0x37) return true;
    if (raw >= 0x40 && raw <= 0x43) return true;
    if (raw >= 0x50 && raw <= 0x54) return true;
    return raw == 0xFF;
}

namespace {

bool isValidState(uint8_t raw) noexcept {
    return raw == static_cast<uint8_t>(KeyState::Released) ||
           raw == static_cast<uint8_t>(KeyState::Pressed);
}

} // anonymous namespace

std::expected<InputEntry, ProtocolError> InputCodec::encode(const InputEvent& event) noexcept {
    InputEntry entry{};
    if (const auto* key = std::get_if<KeyEvent>(&event)) {
        if (!isKnownKeyCode(static_cast<uint8_t>(key->key))) {
            return std::unexpected(ProtocolError::UnknownDiscriminant);
        }
        if (!isValidState(static_cast<uint8_t>(key->state)) || (key->modifiers & ~Modifier::kMask) != 0) {
            return std::unexpected(ProtocolError::InvalidField);
        }
        entry.eventType = static_cast<uint8_t>(EventType::Key);
        entry.keyCode = static_cast<uint8_t>(key->key);
        entry.keyState = static_cast<uint8_t>(key->state);
        entry.modifiers = key->modifiers;
        return entry;
    }

    const auto& remote = std::get<RemoteEvent>(event);
    if (!isKnownIrButton(static_cast<uint8_t>(remote.button))) {
        return std::unexpected(ProtocolError::UnknownDiscriminant);
    }
    if (!isValidState(static_cast<uint8_t>(remote.state))) {
        return std::unexpected(ProtocolError::InvalidField);
    }
    entry.eventType = static_cast<uint8_t>(EventType::IrRemote);
    entry.keyCode = static_cast<uint8_t>(remote.button);
    entry.keyState = static_cast<uint8_t>(remote.state);
    entry.modifiers = 0;
    return entry;
}

std::expected<InputEvent, ProtocolError> InputCodec::decode(const InputEntry& entry) noexcept {
    if (!isValidState(entry.keyState)) {
        return std::unexpected(ProtocolError::InvalidField);
    }

    switch (entry.eventType) {
        case static_cast<uint8_t>(EventType::Key):
            if (!isKnownKeyCode(entry.keyCode)) return std::unexpected(ProtocolError::UnknownDiscriminant);
            if ((entry.modifiers & ~Modifier::kMask) != 0) return std::unexpected(ProtocolError::InvalidField);
            return KeyEvent{static_cast<KeyCode>(entry.keyCode),
                            static_cast<KeyState>(entry.keyState),
                            entry.modifiers};

        case static_cast<uint8_t>(EventType::IrRemote):
            if (!isKnownIrButton(entry.keyCode)) return std::unexpected(ProtocolError::UnknownDiscriminant);
            if (entry.modifiers != 0) return std::unexpected(ProtocolError::InvalidField);
            return RemoteEvent{static_cast<IrButton>(entry.keyCode),
                               static_cast<KeyState>(entry.keyState)};

        default:
            // Includes None: an empty slot is never a published event.
            return std::unexpected(ProtocolError::UnknownDiscriminant);
    }
}

} // namespace Ring
} // namespace PDR
