#pragma once
#ifdef __linux__
#include "input/InputManager.h"

#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

struct libevdev;
struct libevdev_uinput;

namespace EdgeShare::Input {

inline constexpr const char* VIRTUAL_DEVICE_NAME = "EdgeShare Virtual Input";

// Reads every keyboard and pointer under /dev/input with libevdev. Devices
// are grabbed while the handler consumes events, so the local desktop sees
// nothing while the peer is driven.
class LinuxInputCapture : public InputCapture {
public:
    LinuxInputCapture();
    ~LinuxInputCapture() override;

    CaptureStatus start(RawEventHandler handler) override;
    void stop() override;
    bool isRunning() const override { return running_.load(std::memory_order_relaxed); }

    std::optional<Core::Point> cursorPosition() const override;
    void setCursorVisible(bool visible) override;

private:
    struct Device {
        libevdev* dev = nullptr;
        int fd = -1;
        std::string node;
    };

    CaptureStatus openDevices();
    void closeDevices();
    void captureLoop();
    void readDevice(Device& device);
    void dispatch(const RawInputEvent& event);
    void setGrabbed(bool grabbed);

    std::vector<Device> devices_;
    std::thread captureThread_;
    std::atomic<bool> running_{false};
    RawEventHandler handler_;
    bool grabbed_ = false;
    bool sdlVideoInitialized_ = false;

    // Relative motion collected between SYN_REPORTs.
    int32_t frameDx_ = 0;
    int32_t frameDy_ = 0;
    int32_t frameWheelX_ = 0;
    int32_t frameWheelY_ = 0;

    // Raw motion not yet folded into cursorPosition(). When the OS cursor
    // does not follow it the pointer is pinned and the excess becomes
    // overshoot past the screen edge.
    mutable std::atomic<int32_t> pendingDx_{0};
    mutable std::atomic<int32_t> pendingDy_{0};
    mutable std::mutex cursorMutex_;
    mutable bool hasOsPosition_ = false;
    mutable Core::Point lastOsPosition_;
    mutable Core::Point overshoot_;
};

// Virtual absolute pointer plus keyboard through /dev/uinput.
class LinuxInputInjector : public InputInjector {
public:
    explicit LinuxInputInjector(const Core::Bounds& bounds);
    ~LinuxInputInjector() override;

    LinuxInputInjector(const LinuxInputInjector&) = delete;
    LinuxInputInjector& operator=(const LinuxInputInjector&) = delete;

    void moveAbsolute(int32_t x, int32_t y) override;
    void button(Network::MouseButtonId button, bool pressed) override;
    void scroll(int32_t deltaX, int32_t deltaY) override;
    void key(uint16_t localCode, bool pressed) override;

private:
    void write(unsigned int type, unsigned int code, int value);
    void sync();

    libevdev_uinput* uinput_ = nullptr;
    Core::Bounds bounds_;
    ScrollAccumulator scrollX_;
    ScrollAccumulator scrollY_;
};

}
#endif
