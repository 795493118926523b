#ifdef __linux__
#include "input/LinuxInput.h"
#include "utils/Logger.h"

#include <SDL.h>
#include <libevdev/libevdev.h>
#include <libevdev/libevdev-uinput.h>
#include <libudev.h>
#include <linux/input-event-codes.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <stdexcept>
#include <sys/select.h>
#include <unistd.h>

namespace EdgeShare::Input {

namespace {

std::optional<Network::MouseButtonId> buttonFromEvdev(unsigned int code) {
    switch (code) {
        case BTN_LEFT: return Network::MouseButtonId::Left;
        case BTN_RIGHT: return Network::MouseButtonId::Right;
        case BTN_MIDDLE: return Network::MouseButtonId::Middle;
        case BTN_SIDE: return Network::MouseButtonId::Back;
        case BTN_EXTRA: return Network::MouseButtonId::Forward;
        default: return std::nullopt;
    }
}

unsigned int buttonToEvdev(Network::MouseButtonId button) {
    switch (button) {
        case Network::MouseButtonId::Left: return BTN_LEFT;
        case Network::MouseButtonId::Right: return BTN_RIGHT;
        case Network::MouseButtonId::Middle: return BTN_MIDDLE;
        case Network::MouseButtonId::Back: return BTN_SIDE;
        case Network::MouseButtonId::Forward: return BTN_EXTRA;
    }
    return BTN_LEFT;
}

bool isUdevFlagSet(udev_device* dev, const char* property) {
    const char* value = udev_device_get_property_value(dev, property);
    return value && std::strcmp(value, "1") == 0;
}

Core::Bounds sdlDesktopBounds() {
    Core::ScreenLayout layout;
    int count = SDL_GetNumVideoDisplays();
    for (int i = 0; i < count; ++i) {
        SDL_Rect rect;
        if (SDL_GetDisplayBounds(i, &rect) == 0) {
            layout.push_back(Core::ScreenRect{rect.x, rect.y, rect.w, rect.h, i == 0});
        }
    }
    return Core::computeCombinedBounds(layout);
}

// Overshoot only grows while the OS cursor sits on the boundary it is pushed against.
int32_t foldOvershoot(int32_t current, int32_t raw, int32_t os, int32_t min, int32_t max) {
    if (os >= max - 1) {
        return std::max(0, (current > 0 ? current : 0) + raw);
    }
    if (os <= min) {
        return std::min(0, (current < 0 ? current : 0) + raw);
    }
    return 0;
}

}

LinuxInputCapture::LinuxInputCapture() = default;

LinuxInputCapture::~LinuxInputCapture() {
    stop();
}

CaptureStatus LinuxInputCapture::start(RawEventHandler handler) {
    auto& logger = Utils::Logger::GetInstance();
    if (running_.load()) {
        logger.Warning("LinuxInputCapture: start called while already running");
        return CaptureStatus::AlreadyRunning;
    }

    CaptureStatus status = openDevices();
    if (status != CaptureStatus::Started) {
        closeDevices();
        return status;
    }

    if (SDL_InitSubSystem(SDL_INIT_VIDEO) == 0) {
        sdlVideoInitialized_ = true;
    } else {
        logger.Warning("LinuxInputCapture: SDL video unavailable, no cursor position: " + std::string(SDL_GetError()));
    }

    handler_ = std::move(handler);
    running_.store(true);
    captureThread_ = std::thread(&LinuxInputCapture::captureLoop, this);
    logger.Info("LinuxInputCapture: capturing from " + std::to_string(devices_.size()) + " device(s)");
    return CaptureStatus::Started;
}

void LinuxInputCapture::stop() {
    bool wasRunning = running_.exchange(false);
    if (captureThread_.joinable()) {
        captureThread_.join();
    }
    setGrabbed(false);
    closeDevices();
    if (sdlVideoInitialized_) {
        SDL_ShowCursor(SDL_ENABLE);
        SDL_QuitSubSystem(SDL_INIT_VIDEO);
        sdlVideoInitialized_ = false;
    }
    handler_ = nullptr;
    if (wasRunning) {
        Utils::Logger::GetInstance().Info("LinuxInputCapture: stopped");
    }
}

CaptureStatus LinuxInputCapture::openDevices() {
    auto& logger = Utils::Logger::GetInstance();

    udev* udevCtx = udev_new();
    if (!udevCtx) {
        logger.Error("LinuxInputCapture: udev_new failed");
        return CaptureStatus::Failed;
    }

    udev_enumerate* enumerate = udev_enumerate_new(udevCtx);
    udev_enumerate_add_match_subsystem(enumerate, "input");
    udev_enumerate_scan_devices(enumerate);

    int permissionFailures = 0;
    udev_list_entry* entry;
    udev_list_entry_foreach(entry, udev_enumerate_get_list_entry(enumerate)) {
        udev_device* dev = udev_device_new_from_syspath(udevCtx, udev_list_entry_get_name(entry));
        if (!dev) {
            continue;
        }

        const char* node = udev_device_get_devnode(dev);
        bool relevant = node && std::strncmp(node, "/dev/input/event", 16) == 0 &&
                        (isUdevFlagSet(dev, "ID_INPUT_KEYBOARD") || isUdevFlagSet(dev, "ID_INPUT_MOUSE") ||
                         isUdevFlagSet(dev, "ID_INPUT_TOUCHPAD"));
        if (!relevant) {
            udev_device_unref(dev);
            continue;
        }

        std::string devnode(node);
        udev_device_unref(dev);

        int fd = open(devnode.c_str(), O_RDONLY | O_NONBLOCK);
        if (fd < 0) {
            if (errno == EACCES || errno == EPERM) {
                permissionFailures++;
            }
            logger.Debug("LinuxInputCapture: cannot open " + devnode + ": " + std::strerror(errno));
            continue;
        }

        libevdev* evdev = nullptr;
        int rc = libevdev_new_from_fd(fd, &evdev);
        if (rc < 0) {
            logger.Debug("LinuxInputCapture: libevdev rejected " + devnode + ": " + std::strerror(-rc));
            close(fd);
            continue;
        }

        const char* name = libevdev_get_name(evdev);
        if (name && std::strcmp(name, VIRTUAL_DEVICE_NAME) == 0) {
            // Our own injector; reading it would echo injected input back.
            libevdev_free(evdev);
            close(fd);
            continue;
        }

        bool hasKeys = libevdev_has_event_type(evdev, EV_KEY);
        bool hasMotion = libevdev_has_event_code(evdev, EV_REL, REL_X) || libevdev_has_event_code(evdev, EV_REL, REL_Y);
        if (!hasKeys && !hasMotion) {
            libevdev_free(evdev);
            close(fd);
            continue;
        }

        logger.Info("LinuxInputCapture: reading " + devnode + " (" + (name ? name : "unnamed") + ")");
        devices_.push_back(Device{evdev, fd, devnode});
    }

    udev_enumerate_unref(enumerate);
    udev_unref(udevCtx);

    if (devices_.empty()) {
        if (permissionFailures > 0) {
            logger.Error("LinuxInputCapture: permission denied on " + std::to_string(permissionFailures) +
                         " input device(s); add the user to the 'input' group");
            return CaptureStatus::PermissionDenied;
        }
        logger.Error("LinuxInputCapture: no keyboard or pointer devices found");
        return CaptureStatus::NoDevices;
    }
    return CaptureStatus::Started;
}

void LinuxInputCapture::closeDevices() {
    for (Device& device : devices_) {
        libevdev_free(device.dev);
        if (device.fd >= 0) {
            close(device.fd);
        }
    }
    devices_.clear();
}

void LinuxInputCapture::captureLoop() {
    while (running_.load(std::memory_order_relaxed)) {
        if (devices_.empty()) {
            Utils::Logger::GetInstance().Error("LinuxInputCapture: every input device disappeared");
            break;
        }

        fd_set readFds;
        FD_ZERO(&readFds);
        int maxFd = 0;
        for (const Device& device : devices_) {
            FD_SET(device.fd, &readFds);
            maxFd = std::max(maxFd, device.fd);
        }
        timeval tv = {0, 20000};

        int ret = select(maxFd + 1, &readFds, nullptr, nullptr, &tv);
        if (ret < 0) {
            if (errno == EINTR) {
                continue;
            }
            Utils::Logger::GetInstance().Error("LinuxInputCapture: select failed: " + std::string(std::strerror(errno)));
            break;
        }
        if (ret == 0) {
            continue;
        }

        for (Device& device : devices_) {
            if (FD_ISSET(device.fd, &readFds)) {
                readDevice(device);
            }
        }

        devices_.erase(std::remove_if(devices_.begin(), devices_.end(), [](const Device& d) {
            if (d.fd >= 0) {
                return false;
            }
            libevdev_free(d.dev);
            return true;
        }), devices_.end());
    }
    running_.store(false);
}

void LinuxInputCapture::readDevice(Device& device) {
    input_event ev;
    int rc;
    unsigned int flags = LIBEVDEV_READ_FLAG_NORMAL;
    while ((rc = libevdev_next_event(device.dev, flags, &ev)) >= 0) {
        if (rc == LIBEVDEV_READ_STATUS_SYNC) {
            // Dropped events; libevdev replays the device state, which is not forwarded.
            flags = LIBEVDEV_READ_FLAG_SYNC;
            continue;
        }
        if (flags == LIBEVDEV_READ_FLAG_SYNC) {
            continue;
        }

        switch (ev.type) {
            case EV_REL:
                if (ev.code == REL_X) frameDx_ += ev.value;
                else if (ev.code == REL_Y) frameDy_ += ev.value;
                else if (ev.code == REL_WHEEL) frameWheelY_ += ev.value;
                else if (ev.code == REL_HWHEEL) frameWheelX_ += ev.value;
                break;
            case EV_KEY: {
                std::optional<Network::MouseButtonId> button = buttonFromEvdev(ev.code);
                if (button) {
                    if (ev.value != 2) {
                        dispatch(MouseButtonEvent{*button, ev.value != 0});
                    }
                } else if (ev.code < BTN_MISC || ev.code >= KEY_OK) {
                    dispatch(KeyEvent{static_cast<uint16_t>(ev.code), ev.value != 0});
                }
                break;
            }
            case EV_SYN:
                if (ev.code == SYN_REPORT) {
                    if (frameDx_ != 0 || frameDy_ != 0) {
                        pendingDx_ += frameDx_;
                        pendingDy_ += frameDy_;
                        dispatch(MouseMotionEvent{frameDx_, frameDy_});
                    }
                    if (frameWheelX_ != 0 || frameWheelY_ != 0) {
                        dispatch(MouseWheelEvent{frameWheelX_, frameWheelY_});
                    }
                    frameDx_ = frameDy_ = frameWheelX_ = frameWheelY_ = 0;
                }
                break;
            default:
                break;
        }
    }

    if (rc != -EAGAIN) {
        Utils::Logger::GetInstance().Warning("LinuxInputCapture: lost " + device.node + ": " + std::strerror(-rc));
        close(device.fd);
        device.fd = -1;
    }
}

void LinuxInputCapture::dispatch(const RawInputEvent& event) {
    if (!handler_) {
        return;
    }
    setGrabbed(handler_(event));
}

void LinuxInputCapture::setGrabbed(bool grabbed) {
    if (grabbed_ == grabbed) {
        return;
    }
    for (Device& device : devices_) {
        if (device.fd < 0) {
            continue;
        }
        int rc = libevdev_grab(device.dev, grabbed ? LIBEVDEV_GRAB : LIBEVDEV_UNGRAB);
        if (rc < 0) {
            Utils::Logger::GetInstance().Warning("LinuxInputCapture: " + std::string(grabbed ? "grab" : "ungrab") +
                                                 " of " + device.node + " failed: " + std::strerror(-rc));
        }
    }
    grabbed_ = grabbed;
    pendingDx_ = 0;
    pendingDy_ = 0;
    Utils::Logger::GetInstance().Debug(std::string("LinuxInputCapture: devices ") + (grabbed ? "grabbed" : "released"));
}

std::optional<Core::Point> LinuxInputCapture::cursorPosition() const {
    if (!sdlVideoInitialized_) {
        return std::nullopt;
    }

    int x = 0;
    int y = 0;
    SDL_GetGlobalMouseState(&x, &y);
    Core::Bounds desktop = sdlDesktopBounds();
    int32_t dx = pendingDx_.exchange(0);
    int32_t dy = pendingDy_.exchange(0);

    std::lock_guard<std::mutex> lock(cursorMutex_);
    Core::Point os{x, y};
    if (!hasOsPosition_ || !desktop.hasArea()) {
        hasOsPosition_ = true;
        overshoot_ = Core::Point{};
    } else {
        overshoot_.x = foldOvershoot(overshoot_.x, dx, os.x, desktop.minX, desktop.maxX);
        overshoot_.y = foldOvershoot(overshoot_.y, dy, os.y, desktop.minY, desktop.maxY);
    }
    lastOsPosition_ = os;
    return Core::Point{os.x + overshoot_.x, os.y + overshoot_.y};
}

void LinuxInputCapture::setCursorVisible(bool visible) {
    if (!sdlVideoInitialized_) {
        return;
    }
    if (SDL_ShowCursor(visible ? SDL_ENABLE : SDL_DISABLE) < 0) {
        Utils::Logger::GetInstance().Warning("LinuxInputCapture: SDL_ShowCursor failed: " + std::string(SDL_GetError()));
    }
}

LinuxInputInjector::LinuxInputInjector(const Core::Bounds& bounds)
    : bounds_(bounds.hasArea() ? bounds : Core::defaultPeerBounds()) {
    libevdev* tmpl = libevdev_new();
    if (!tmpl) {
        throw std::runtime_error("libevdev_new failed for the virtual input device");
    }
    libevdev_set_name(tmpl, VIRTUAL_DEVICE_NAME);

    libevdev_enable_event_type(tmpl, EV_SYN);
    libevdev_enable_event_code(tmpl, EV_SYN, SYN_REPORT, nullptr);

    libevdev_enable_event_type(tmpl, EV_KEY);
    for (unsigned int code = KEY_ESC; code < BTN_MISC; ++code) {
        libevdev_enable_event_code(tmpl, EV_KEY, code, nullptr);
    }
    for (unsigned int code : {BTN_LEFT, BTN_RIGHT, BTN_MIDDLE, BTN_SIDE, BTN_EXTRA}) {
        libevdev_enable_event_code(tmpl, EV_KEY, code, nullptr);
    }

    libevdev_enable_event_type(tmpl, EV_REL);
    libevdev_enable_event_code(tmpl, EV_REL, REL_WHEEL, nullptr);
    libevdev_enable_event_code(tmpl, EV_REL, REL_HWHEEL, nullptr);

    libevdev_enable_event_type(tmpl, EV_ABS);
    input_absinfo absX = {};
    absX.minimum = bounds_.minX;
    absX.maximum = bounds_.maxX - 1;
    libevdev_enable_event_code(tmpl, EV_ABS, ABS_X, &absX);
    input_absinfo absY = {};
    absY.minimum = bounds_.minY;
    absY.maximum = bounds_.maxY - 1;
    libevdev_enable_event_code(tmpl, EV_ABS, ABS_Y, &absY);

    libevdev_enable_property(tmpl, INPUT_PROP_POINTER);

    int rc = libevdev_uinput_create_from_device(tmpl, LIBEVDEV_UINPUT_OPEN_MANAGED, &uinput_);
    libevdev_free(tmpl);
    if (rc != 0) {
        uinput_ = nullptr;
        std::string reason = std::strerror(-rc);
        if (rc == -EACCES || rc == -EPERM) {
            reason += " (no write access to /dev/uinput)";
        }
        throw std::runtime_error("Failed to create uinput device: " + reason);
    }
    Utils::Logger::GetInstance().Info("LinuxInputInjector: virtual device ready, absolute range " +
                                      Core::boundsToString(bounds_));
}

LinuxInputInjector::~LinuxInputInjector() {
    if (uinput_) {
        libevdev_uinput_destroy(uinput_);
        uinput_ = nullptr;
    }
}

void LinuxInputInjector::write(unsigned int type, unsigned int code, int value) {
    int rc = libevdev_uinput_write_event(uinput_, type, code, value);
    if (rc < 0) {
        Utils::Logger::GetInstance().Warning("LinuxInputInjector: write failed: " + std::string(std::strerror(-rc)));
    }
}

void LinuxInputInjector::sync() {
    write(EV_SYN, SYN_REPORT, 0);
}

void LinuxInputInjector::moveAbsolute(int32_t x, int32_t y) {
    Core::Point target = Core::clampToBounds(Core::Point{x, y}, bounds_);
    write(EV_ABS, ABS_X, target.x);
    write(EV_ABS, ABS_Y, target.y);
    sync();
}

void LinuxInputInjector::button(Network::MouseButtonId button, bool pressed) {
    write(EV_KEY, buttonToEvdev(button), pressed ? 1 : 0);
    sync();
}

void LinuxInputInjector::scroll(int32_t deltaX, int32_t deltaY) {
    int32_t notchesX = scrollX_.add(deltaX);
    int32_t notchesY = scrollY_.add(deltaY);
    if (notchesX == 0 && notchesY == 0) {
        return;
    }
    if (notchesY != 0) {
        write(EV_REL, REL_WHEEL, notchesY);
    }
    if (notchesX != 0) {
        write(EV_REL, REL_HWHEEL, notchesX);
    }
    sync();
}

void LinuxInputInjector::key(uint16_t localCode, bool pressed) {
    if (localCode == 0 || localCode >= BTN_MISC) {
        Utils::Logger::GetInstance().Debug("LinuxInputInjector: no evdev key for code " + std::to_string(localCode));
        return;
    }
    write(EV_KEY, localCode, pressed ? 1 : 0);
    sync();
}

}
#endif
