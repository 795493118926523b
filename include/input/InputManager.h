#pragma once

#include "core/ScreenGeometry.h"
#include "network/Message.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace EdgeShare::Input {

struct MouseMotionEvent {
    int32_t dx = 0;
    int32_t dy = 0;
};

struct MouseButtonEvent {
    Network::MouseButtonId button = Network::MouseButtonId::Left;
    bool pressed = false;
};

// Wheel notches; positive dy scrolls up.
struct MouseWheelEvent {
    int32_t dx = 0;
    int32_t dy = 0;
};

// localCode is the platform's own code (evdev on Linux).
struct KeyEvent {
    uint16_t localCode = 0;
    bool pressed = false;
};

using RawInputEvent = std::variant<MouseMotionEvent, MouseButtonEvent, MouseWheelEvent, KeyEvent>;

enum class CaptureStatus {
    Started,
    AlreadyRunning,
    PermissionDenied,
    NoDevices,
    Failed
};

std::string captureStatusToString(CaptureStatus status);

// Physical input from this machine. The handler runs on the capture thread
// and returns true when the event must not reach the local OS.
class InputCapture {
public:
    using RawEventHandler = std::function<bool(const RawInputEvent&)>;

    virtual ~InputCapture() = default;

    virtual CaptureStatus start(RawEventHandler handler) = 0;
    virtual void stop() = 0;
    virtual bool isRunning() const = 0;

    // Last known pointer position. May lie outside the screen while the
    // user keeps pushing against an edge.
    virtual std::optional<Core::Point> cursorPosition() const = 0;
    virtual void setCursorVisible(bool visible) = 0;
};

// Synthesizes input on this machine for a peer that drives it.
class InputInjector {
public:
    virtual ~InputInjector() = default;

    virtual void moveAbsolute(int32_t x, int32_t y) = 0;
    virtual void button(Network::MouseButtonId button, bool pressed) = 0;
    // Wheel units, 120 per notch.
    virtual void scroll(int32_t deltaX, int32_t deltaY) = 0;
    virtual void key(uint16_t localCode, bool pressed) = 0;
};

// Splits wheel units into whole notches, carrying the remainder.
class ScrollAccumulator {
public:
    static constexpr int32_t UNITS_PER_NOTCH = 120;

    // Returns the notches to emit for this delta.
    int32_t add(int32_t units);
    int32_t remainder() const { return remainder_; }
    void reset() { remainder_ = 0; }

private:
    int32_t remainder_ = 0;
};

// Platform adapters for this machine. bounds spans every local display.
std::unique_ptr<InputCapture> createInputCapture();
std::unique_ptr<InputInjector> createInputInjector(const Core::Bounds& bounds);

}
