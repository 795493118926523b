#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "core/ScreenGeometry.h"

namespace EdgeShare::Network {

inline constexpr const char* PROTOCOL_VERSION = "1.0";
inline constexpr uint16_t DEFAULT_PORT = 52525;

enum class MouseButtonId : uint8_t {
    Left,
    Right,
    Middle,
    Back,
    Forward
};

enum class PressAction : uint8_t {
    Down,
    Up
};

struct KeyModifiers {
    bool shift = false;
    bool control = false;
    bool alt = false;
    bool meta = false;

    bool any() const { return shift || control || alt || meta; }
    bool operator==(const KeyModifiers& o) const {
        return shift == o.shift && control == o.control && alt == o.alt && meta == o.meta;
    }
};

struct Hello {
    std::string version = PROTOCOL_VERSION;
    std::string name;
    bool operator==(const Hello& o) const { return version == o.version && name == o.name; }
};

struct Connected {
    bool operator==(const Connected&) const { return true; }
};

struct Ping {
    bool operator==(const Ping&) const { return true; }
};

struct Pong {
    bool operator==(const Pong&) const { return true; }
};

// x/y carry the entry position on the receiving machine when control moves to it.
struct ModeSwitch {
    bool active = false;
    bool ack = false;
    std::optional<int32_t> x;
    std::optional<int32_t> y;
    bool operator==(const ModeSwitch& o) const {
        return active == o.active && ack == o.ack && x == o.x && y == o.y;
    }
};

struct MouseMove {
    int32_t x = 0;
    int32_t y = 0;
    int64_t timestamp = 0;
    bool operator==(const MouseMove& o) const { return x == o.x && y == o.y && timestamp == o.timestamp; }
};

struct MouseButton {
    MouseButtonId button = MouseButtonId::Left;
    PressAction action = PressAction::Down;
    int32_t x = 0;
    int32_t y = 0;
    int64_t timestamp = 0;
    bool operator==(const MouseButton& o) const {
        return button == o.button && action == o.action && x == o.x && y == o.y && timestamp == o.timestamp;
    }
};

// Deltas are wheel units: 120 per notch.
struct MouseScroll {
    int32_t deltaX = 0;
    int32_t deltaY = 0;
    int64_t timestamp = 0;
    bool operator==(const MouseScroll& o) const {
        return deltaX == o.deltaX && deltaY == o.deltaY && timestamp == o.timestamp;
    }
};

struct Key {
    uint16_t keyCode = 0;
    PressAction action = PressAction::Down;
    KeyModifiers modifiers;
    int64_t timestamp = 0;
    bool operator==(const Key& o) const {
        return keyCode == o.keyCode && action == o.action && modifiers == o.modifiers && timestamp == o.timestamp;
    }
};

struct ScreenInfo {
    Core::ScreenLayout screens;
    bool operator==(const ScreenInfo& o) const { return screens == o.screens; }
};

struct ErrorMessage {
    std::string message;
    bool operator==(const ErrorMessage& o) const { return message == o.message; }
};

// A well-formed line whose type this build does not know.
struct Unknown {
    std::string type;
    bool operator==(const Unknown& o) const { return type == o.type; }
};

using WireMessage = std::variant<
    Hello,
    Connected,
    Ping,
    Pong,
    ModeSwitch,
    MouseMove,
    MouseButton,
    MouseScroll,
    Key,
    ScreenInfo,
    ErrorMessage,
    Unknown>;

// Single-line JSON object terminated by '\n'.
std::string encode(const WireMessage& message);

// Decodes one line (with or without the trailing newline). Malformed JSON and
// missing required fields yield std::nullopt; unknown types yield Unknown.
std::optional<WireMessage> decodeLine(const std::string& line);

std::string messageTypeName(const WireMessage& message);

std::string mouseButtonToString(MouseButtonId button);
std::optional<MouseButtonId> mouseButtonFromString(const std::string& name);
std::string pressActionToString(PressAction action);
std::optional<PressAction> pressActionFromString(const std::string& name);

int64_t nowMillis();

class MessageDecoder {
public:
    static constexpr size_t MAX_LINE_LENGTH = 1024 * 1024;

    void feed(const char* data, size_t length);
    void feed(const std::string& data) { feed(data.data(), data.size()); }

    // Next complete line without its terminator, or nullopt when none is buffered.
    std::optional<std::string> nextLine();

    // Decodes every complete buffered line. Lines that fail to parse are
    // logged and counted, never returned.
    std::vector<WireMessage> drain();

    size_t bufferedBytes() const { return buffer_.size(); }
    uint64_t droppedLines() const { return droppedLines_; }
    void reset();

private:
    std::string buffer_;
    bool discarding_ = false;
    uint64_t droppedLines_ = 0;
};

}
