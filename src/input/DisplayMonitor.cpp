#include "input/DisplayMonitor.h"
#include "utils/Logger.h"

#include <SDL.h>

namespace EdgeShare::Input {

DisplayMonitor::DisplayMonitor(asio::io_context& io_context, std::chrono::milliseconds pollInterval)
    : timer_(io_context),
      pollInterval_(pollInterval) {}

DisplayMonitor::~DisplayMonitor() {
    stop();
    if (initialized_) {
        SDL_QuitSubSystem(SDL_INIT_VIDEO);
        initialized_ = false;
    }
}

bool DisplayMonitor::initialize() {
    if (initialized_) {
        return true;
    }
    auto& logger = Utils::Logger::GetInstance();
    if (SDL_InitSubSystem(SDL_INIT_VIDEO) != 0) {
        logger.Error("DisplayMonitor: SDL video init failed: " + std::string(SDL_GetError()));
        return false;
    }
    initialized_ = true;
    const char* driver = SDL_GetCurrentVideoDriver();
    logger.Info("DisplayMonitor: using video driver " + std::string(driver ? driver : "unknown"));

    layout_ = queryLayout();
    for (const auto& screen : layout_) {
        logger.Info("DisplayMonitor: screen " + std::to_string(screen.width) + "x" + std::to_string(screen.height) +
                    " at (" + std::to_string(screen.x) + "," + std::to_string(screen.y) + ")" +
                    (screen.isPrimary ? " primary" : ""));
    }
    return true;
}

Core::ScreenLayout DisplayMonitor::queryLayout() const {
    Core::ScreenLayout layout;
    if (!initialized_) {
        return layout;
    }
    int count = SDL_GetNumVideoDisplays();
    if (count < 1) {
        Utils::Logger::GetInstance().Warning("DisplayMonitor: SDL_GetNumVideoDisplays failed: " + std::string(SDL_GetError()));
        return layout;
    }
    for (int i = 0; i < count; ++i) {
        SDL_Rect rect;
        if (SDL_GetDisplayBounds(i, &rect) != 0) {
            Utils::Logger::GetInstance().Warning("DisplayMonitor: no bounds for display " + std::to_string(i) + ": " +
                                                 SDL_GetError());
            continue;
        }
        layout.push_back(Core::ScreenRect{rect.x, rect.y, rect.w, rect.h, i == 0});
    }
    return layout;
}

void DisplayMonitor::start() {
    if (running_ || !initialized_) {
        return;
    }
    running_ = true;
    schedule();
}

void DisplayMonitor::stop() {
    if (!running_) {
        return;
    }
    running_ = false;
    timer_.cancel();
}

void DisplayMonitor::schedule() {
    timer_.expires_after(pollInterval_);
    timer_.async_wait([this](const std::error_code& ec) {
        if (ec == asio::error::operation_aborted || !running_) {
            return;
        }
        poll();
        schedule();
    });
}

void DisplayMonitor::poll() {
    // SDL refreshes its display list while pumping events.
    SDL_PumpEvents();
    Core::ScreenLayout current = queryLayout();
    if (current.empty() || current == layout_) {
        return;
    }
    layout_ = current;
    Utils::Logger::GetInstance().Info("DisplayMonitor: layout changed, " + std::to_string(layout_.size()) +
                                      " screen(s), bounds " + Core::boundsToString(Core::computeCombinedBounds(layout_)));
    if (layoutChangedHandler_) {
        layoutChangedHandler_(layout_);
    }
}

}
