#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <variant>
#include "PDR/Error.h"

namespace PDR {
namespace Ring {

constexpr std::size_t kInputRingCapacity = 512;

enum class EventType : uint8_t {
    None     = 0,   // empty slot, never published
    Key      = 1,
    IrRemote = 2
};

enum class KeyState : uint8_t {
    Released = 0,
    Pressed  = 1
};

// Keyboard key codes as they travel on the wire.
enum class KeyCode : uint8_t {
    Unknown    = 0,
    Up         = 1,
    Down       = 2,
    Left       = 3,
    Right      = 4,
    Enter      = 5,
    Escape     = 6,
    Space      = 7,
    Num0       = 10,
    Num1, Num2, Num3, Num4, Num5, Num6, Num7, Num8,
    Num9       = 19,
    Home       = 20,
    End        = 21,
    PageUp     = 22,
    PageDown   = 23,
    VolumeUp   = 30,
    VolumeDown = 31,
    Mute       = 32
};

// IR remote buttons (NEC command byte).
enum class IrButton : uint8_t {
    Power       = 0x00,
    Up          = 0x01,
    Down        = 0x02,
    Left        = 0x03,
    Right       = 0x04,
    Ok          = 0x05,
    Back        = 0x06,
    Menu        = 0x07,
    Home        = 0x08,
    Num0        = 0x10,
    Num1, Num2, Num3, Num4, Num5, Num6, Num7, Num8,
    Num9        = 0x19,
    VolumeUp    = 0x20,
    VolumeDown  = 0x21,
    Mute        = 0x22,
    ChannelUp   = 0x23,
    ChannelDown = 0x24,
    Play        = 0x30,
    Pause       = 0x31,
    Stop        = 0x32,
    FastForward = 0x33,
    Rewind      = 0x34,
    SkipNext    = 0x35,
    SkipPrev    = 0x36,
    Record      = 0x37,
    Red         = 0x40,
    Green       = 0x41,
    Yellow      = 0x42,
    Blue        = 0x43,
    Info        = 0x50,
    Guide       = 0x51,
    Input       = 0x52,
    Subtitle    = 0x53,
    Audio       = 0x54,
    Unknown     = 0xFF
};

namespace Modifier {
    constexpr uint8_t kShift = 0x01;
    constexpr uint8_t kCtrl  = 0x02;
    constexpr uint8_t kAlt   = 0x04;
    constexpr uint8_t kMeta  = 0x08;
    constexpr uint8_t kMask  = kShift | kCtrl | kAlt | kMeta;
}

// Wire entry. Every field is a raw byte so an untrusted producer cannot hand
// the consumer an out-of-range enum.
struct InputEntry {
    uint8_t eventType;
    uint8_t keyCode;
    uint8_t keyState;
    uint8_t modifiers;
};
static_assert(sizeof(InputEntry) == 4, "InputEntry is 4 bytes on the wire");

struct KeyEvent {
    KeyCode key{KeyCode::Unknown};
    KeyState state{KeyState::Released};
    uint8_t modifiers{0};

    bool operator==(const KeyEvent&) const = default;
};

struct RemoteEvent {
    IrButton button{IrButton::Unknown};
    KeyState state{KeyState::Released};

    bool operator==(const RemoteEvent&) const = default;
};

using InputEvent = std::variant<KeyEvent, RemoteEvent>;

bool isKnownKeyCode(uint8_t raw) noexcept;
bool isKnownIrButton(uint8_t raw) noexcept;

inline bool isKeyPressed(const InputEntry& entry) noexcept {
    return entry.eventType == static_cast<uint8_t>(EventType::Key) &&
           entry.keyState == static_cast<uint8_t>(KeyState::Pressed);
}

/**
 * @brief Codec for the input event channel.
 *
 * decode() accepts only Key and IrRemote entries with a known code, a state of
 * 0 or 1, and modifier bits inside Modifier::kMask (zero for remote events).
 */
struct InputCodec {
    using Event = InputEvent;
    using Entry = InputEntry;
    static constexpr std::size_t kCapacity = kInputRingCapacity;
    static constexpr const char* kName = "input";

    static std::expected<Entry, ProtocolError> encode(const Event& event) noexcept;
    static std::expected<Event, ProtocolError> decode(const Entry& entry) noexcept;
};

} // namespace Ring
} // namespace PDR
