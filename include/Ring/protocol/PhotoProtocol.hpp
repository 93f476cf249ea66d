#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include "PDR/Error.h"

namespace PDR {
namespace Ring {

constexpr std::size_t kPhotoCommandRingCapacity = 256;

enum class PhotoCommandType : uint8_t {
    None         = 0,
    Next         = 1,
    Prev         = 2,
    Pause        = 3,
    Resume       = 4,
    Goto         = 5,
    LoadComplete = 6,
    LoadError    = 7
};

struct PhotoCommandEntry {
    uint8_t  command;
    uint8_t  flags;        // must be 0
    uint16_t photoIndex;
    uint32_t reserved;     // must be 0
};
static_assert(sizeof(PhotoCommandEntry) == 8, "PhotoCommandEntry is 8 bytes on the wire");
static_assert(offsetof(PhotoCommandEntry, photoIndex) == 2);

struct PhotoCommand {
    PhotoCommandType type{PhotoCommandType::None};
    uint16_t photoIndex{0};

    static PhotoCommand next() { return {PhotoCommandType::Next, 0}; }
    static PhotoCommand prev() { return {PhotoCommandType::Prev, 0}; }
    static PhotoCommand pause() { return {PhotoCommandType::Pause, 0}; }
    static PhotoCommand resume() { return {PhotoCommandType::Resume, 0}; }
    static PhotoCommand gotoIndex(uint16_t index) { return {PhotoCommandType::Goto, index}; }
    static PhotoCommand loadComplete(uint16_t index) { return {PhotoCommandType::LoadComplete, index}; }
    static PhotoCommand loadError(uint16_t index) { return {PhotoCommandType::LoadError, index}; }

    // True for commands whose photoIndex field is meaningful.
    bool carriesIndex() const noexcept {
        return type == PhotoCommandType::Goto ||
               type == PhotoCommandType::LoadComplete ||
               type == PhotoCommandType::LoadError;
    }

    bool operator==(const PhotoCommand&) const = default;
};

const char* photoCommandName(PhotoCommandType type) noexcept;

// Codec for photo command rings (timer/input -> display, display -> decoder).
struct PhotoCommandCodec {
    using Event = PhotoCommand;
    using Entry = PhotoCommandEntry;
    static constexpr std::size_t kCapacity = kPhotoCommandRingCapacity;
    static constexpr const char* kName = "photo_command";

    static std::expected<Entry, ProtocolError> encode(const Event& command) noexcept;
    static std::expected<Event, ProtocolError> decode(const Entry& entry) noexcept;
};

} // namespace Ring
} // namespace PDR
