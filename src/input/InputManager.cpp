#include "input/InputManager.h"
#include "utils/Logger.h"

#ifdef __linux__
#include "input/LinuxInput.h"
#endif

#include <stdexcept>

namespace EdgeShare::Input {

std::string captureStatusToString(CaptureStatus status) {
    switch (status) {
        case CaptureStatus::Started: return "started";
        case CaptureStatus::AlreadyRunning: return "already running";
        case CaptureStatus::PermissionDenied: return "permission denied";
        case CaptureStatus::NoDevices: return "no input devices";
        case CaptureStatus::Failed: return "failed";
    }
    return "unknown";
}

int32_t ScrollAccumulator::add(int32_t units) {
    remainder_ += units;
    int32_t notches = remainder_ / UNITS_PER_NOTCH;
    remainder_ -= notches * UNITS_PER_NOTCH;
    return notches;
}

std::unique_ptr<InputCapture> createInputCapture() {
#ifdef __linux__
    Utils::Logger::GetInstance().Info("Creating evdev input capture");
    return std::make_unique<LinuxInputCapture>();
#else
    throw std::runtime_error("No input capture adapter for this platform");
#endif
}

std::unique_ptr<InputInjector> createInputInjector(const Core::Bounds& bounds) {
#ifdef __linux__
    Utils::Logger::GetInstance().Info("Creating uinput injector spanning " + Core::boundsToString(bounds));
    return std::make_unique<LinuxInputInjector>(bounds);
#else
    (void)bounds;
    throw std::runtime_error("No input injection adapter for this platform");
#endif
}

}
