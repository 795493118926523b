#pragma once

#include "core/EdgeDetector.h"
#include "core/ModeSwitch.h"
#include "core/ScreenGeometry.h"
#include "input/DisplayMonitor.h"
#include "input/InputForwarder.h"
#include "input/InputManager.h"
#include "network/SessionManager.h"
#include "utils/Logger.h"

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace EdgeShare::Core {

enum class EngineState {
    Stopped,
    Running,
    PermissionDenied,
    Failed
};

std::string engineStateToString(EngineState state);

struct EngineOptions {
    Network::SessionRole role = Network::SessionRole::Host;
    std::string address;
    uint16_t port = Network::DEFAULT_PORT;
    Network::SessionOptions session;

    Edge edge = Edge::Right;
    int32_t edgeThreshold = 2;
    std::chrono::milliseconds edgePollInterval{16};
    std::chrono::milliseconds switchAckTimeout{2000};

    // Canonical (VK) codes that together return input to this machine.
    std::vector<uint8_t> escapeCombo;
    float mouseSensitivity = 1.0f;
    int32_t scrollScale = Input::ScrollAccumulator::UNITS_PER_NOTCH;

    // Everything except role and address comes from Utils::Config.
    static EngineOptions fromConfig();
};

std::vector<uint8_t> defaultEscapeCombo();

struct EngineSnapshot {
    EngineState state = EngineState::Stopped;
    std::string lastError;
    Network::SessionSnapshot session;
    ModeState mode;
    ScreenLayout localLayout;
    Bounds localBounds;
};

// Owns the event loop and every component on it. Handlers must be set
// before start(); they run on the loop thread.
class Engine {
public:
    using ModeChangedHandler = std::function<void(const ModeState&)>;
    using LogHandler = std::function<void(Utils::LogLevel, const std::string&)>;
    using StatusHandler = std::function<void(Network::SessionStatus, const std::string&)>;
    using ConnectedHandler = std::function<void(const std::string& peerName)>;
    using DisconnectedHandler = std::function<void(const std::string& reason)>;
    using ScreenInfoHandler = std::function<void(const ScreenLayout&)>;

    explicit Engine(EngineOptions options);
    // Runs against the given ports and a fixed local layout instead of the
    // platform adapters and SDL.
    Engine(EngineOptions options, std::unique_ptr<Input::InputCapture> capture,
           std::unique_ptr<Input::InputInjector> injector, ScreenLayout localLayout);
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    EngineState start();
    // Idempotent. Do not call from a handler.
    void stop();

    // Starts a new connection attempt to the configured address.
    void reconnect();

    EngineSnapshot snapshot() const;
    EngineState state() const { return state_.load(); }
    uint16_t listeningPort() const { return session_.listeningPort(); }

    void setModeChangedHandler(ModeChangedHandler handler) { modeChangedHandler_ = std::move(handler); }
    void setLogHandler(LogHandler handler) { logHandler_ = std::move(handler); }
    void setStatusHandler(StatusHandler handler) { statusHandler_ = std::move(handler); }
    void setConnectedHandler(ConnectedHandler handler) { connectedHandler_ = std::move(handler); }
    void setDisconnectedHandler(DisconnectedHandler handler) { disconnectedHandler_ = std::move(handler); }
    void setScreenInfoHandler(ScreenInfoHandler handler) { screenInfoHandler_ = std::move(handler); }

private:
    void wire();
    EngineState fail(EngineState state, const std::string& reason);

    // Capture thread.
    bool onCapturedEvent(const Input::RawInputEvent& event);
    bool trackEscapeCombo(const Input::KeyEvent& key);

    // Loop thread.
    void applyLocalLayout(const ScreenLayout& layout);
    void onModeChanged(const ModeState& state);
    void onSessionMessage(const Network::WireMessage& message);
    void resetPeerBounds();

    EngineOptions options_;
    bool usePlatformPorts_;

    asio::io_context io_context_;
    std::optional<asio::executor_work_guard<asio::io_context::executor_type>> workGuard_;
    std::thread ioThread_;

    Network::SessionManager session_;
    ModeSwitch modeSwitch_;
    EdgeDetector edgeDetector_;
    Input::InputForwarder forwarder_;
    std::unique_ptr<Input::DisplayMonitor> displayMonitor_;
    std::unique_ptr<Input::InputCapture> capture_;
    std::unique_ptr<Input::InputInjector> injector_;

    std::atomic<EngineState> state_{EngineState::Stopped};
    std::atomic<bool> stopped_{false};

    // Published for the capture thread.
    std::atomic<bool> remoteHasControl_{false};
    std::atomic<bool> suppressLocalInput_{false};

    // Capture thread only.
    std::vector<uint8_t> heldVk_;
    bool comboLatched_ = false;
    uint8_t swallowedVk_ = 0;

    mutable std::mutex snapshotMutex_;
    ScreenLayout localLayout_;
    Bounds localBounds_;
    ModeState mode_;
    std::string lastError_;

    ModeChangedHandler modeChangedHandler_;
    LogHandler logHandler_;
    StatusHandler statusHandler_;
    ConnectedHandler connectedHandler_;
    DisconnectedHandler disconnectedHandler_;
    ScreenInfoHandler screenInfoHandler_;
};

}
