#pragma once

#include "core/ScreenGeometry.h"

#include <asio.hpp>
#include <chrono>
#include <functional>

namespace EdgeShare::Input {

// Local display layout from the SDL video subsystem. Display 0 is reported
// as primary. A poll timer notices monitors being added, removed or moved.
class DisplayMonitor {
public:
    using LayoutChangedHandler = std::function<void(const Core::ScreenLayout&)>;

    DisplayMonitor(asio::io_context& io_context,
                   std::chrono::milliseconds pollInterval = std::chrono::milliseconds(2000));
    ~DisplayMonitor();

    DisplayMonitor(const DisplayMonitor&) = delete;
    DisplayMonitor& operator=(const DisplayMonitor&) = delete;

    bool initialize();
    bool isInitialized() const { return initialized_; }

    void setLayoutChangedHandler(LayoutChangedHandler handler) { layoutChangedHandler_ = std::move(handler); }

    void start();
    void stop();

    // Enumerates afresh; empty when SDL has no video.
    Core::ScreenLayout queryLayout() const;
    const Core::ScreenLayout& layout() const { return layout_; }

private:
    void schedule();
    void poll();

    asio::steady_timer timer_;
    std::chrono::milliseconds pollInterval_;
    bool initialized_ = false;
    bool running_ = false;
    Core::ScreenLayout layout_;
    LayoutChangedHandler layoutChangedHandler_;
};

}
