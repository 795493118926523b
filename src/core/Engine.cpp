#include "core/Engine.h"
#include "utils/Config.h"
#include "utils/KeycodeConverter.h"

#include <algorithm>
#include <future>
#include <unistd.h>

namespace EdgeShare::Core {

namespace {

// Left/right variants count as the generic modifier for combo matching.
uint8_t genericVk(uint8_t vk) {
    switch (vk) {
        case VK_LSHIFT: case VK_RSHIFT: return VK_SHIFT;
        case VK_LCONTROL: case VK_RCONTROL: return VK_CONTROL;
        case VK_LMENU: case VK_RMENU: return VK_MENU;
        case VK_RWIN: return VK_LWIN;
        default: return vk;
    }
}

std::string localHostName() {
    char buffer[256] = {};
    if (gethostname(buffer, sizeof(buffer) - 1) == 0 && buffer[0] != '\0') {
        return buffer;
    }
    return "edgeshare";
}

std::string comboToString(const std::vector<uint8_t>& combo) {
    std::string text;
    for (uint8_t vk : combo) {
        if (!text.empty()) text += "+";
        text += Utils::Logger::getKeyName(vk);
    }
    return text;
}

}

std::string engineStateToString(EngineState state) {
    switch (state) {
        case EngineState::Stopped: return "Stopped";
        case EngineState::Running: return "Running";
        case EngineState::PermissionDenied: return "PermissionDenied";
        case EngineState::Failed: return "Failed";
    }
    return "Unknown";
}

std::vector<uint8_t> defaultEscapeCombo() {
    return {VK_CONTROL, VK_MENU, static_cast<uint8_t>('M')};
}

EngineOptions EngineOptions::fromConfig() {
    auto& config = Utils::Config::GetInstance();
    auto& logger = Utils::Logger::GetInstance();
    namespace Keys = Utils::ConfigKeys;

    EngineOptions options;
    int port = config.Get<int>(Keys::Port, Network::DEFAULT_PORT);
    if (port < 0 || port > 65535) {
        logger.Warning("Config: " + std::string(Keys::Port) + "=" + std::to_string(port) + " is out of range, using " +
                       std::to_string(Network::DEFAULT_PORT));
        port = Network::DEFAULT_PORT;
    }
    options.port = static_cast<uint16_t>(port);

    options.session.name = config.Get<std::string>(Keys::Name, localHostName());
    options.session.idleTimeout = std::chrono::milliseconds(config.Get<int>(Keys::IdleTimeoutMs, 10000));
    options.session.pingInterval = std::chrono::milliseconds(config.Get<int>(Keys::PingIntervalMs, 5000));
    options.session.connectTimeout = std::chrono::milliseconds(config.Get<int>(Keys::ConnectTimeoutMs, 5000));
    options.session.handshakeTimeout = std::chrono::milliseconds(config.Get<int>(Keys::HandshakeTimeoutMs, 5000));

    std::string edgeName = config.Get<std::string>(Keys::EdgePosition, "right");
    std::optional<Edge> edge = edgeFromString(edgeName);
    if (!edge) {
        logger.Warning("Config: unknown edge '" + edgeName + "', using right");
    }
    options.edge = edge.value_or(Edge::Right);
    options.edgeThreshold = std::max(0, config.Get<int>(Keys::EdgeThreshold, 2));
    options.edgePollInterval = std::chrono::milliseconds(std::max(1, config.Get<int>(Keys::EdgePollIntervalMs, 16)));
    options.switchAckTimeout = std::chrono::milliseconds(config.Get<int>(Keys::SwitchAckTimeoutMs, 2000));

    options.escapeCombo = config.Get<std::vector<uint8_t>>(Utils::Config::GetEscapeComboKey(), {});
    if (options.escapeCombo.empty()) {
        options.escapeCombo = defaultEscapeCombo();
    }
    options.mouseSensitivity = config.Get<float>(Keys::MouseSensitivity, 1.0f);
    options.scrollScale = config.Get<int>(Keys::ScrollScale, Input::ScrollAccumulator::UNITS_PER_NOTCH);
    return options;
}

Engine::Engine(EngineOptions options)
    : Engine(std::move(options), nullptr, nullptr, ScreenLayout{}) {
    usePlatformPorts_ = true;
}

Engine::Engine(EngineOptions options, std::unique_ptr<Input::InputCapture> capture,
               std::unique_ptr<Input::InputInjector> injector, ScreenLayout localLayout)
    : options_(std::move(options)),
      usePlatformPorts_(false),
      session_(io_context_, options_.session),
      modeSwitch_(io_context_, options_.edge,
                  options_.role == Network::SessionRole::Host ? ConflictPolicy::KeepClaim : ConflictPolicy::Yield,
                  options_.switchAckTimeout),
      edgeDetector_(io_context_, options_.edge, options_.edgeThreshold, options_.edgePollInterval),
      forwarder_(options_.edge, options_.mouseSensitivity, options_.scrollScale),
      capture_(std::move(capture)),
      injector_(std::move(injector)),
      localLayout_(std::move(localLayout)) {
    if (options_.escapeCombo.empty()) {
        options_.escapeCombo = defaultEscapeCombo();
    }
    for (uint8_t& vk : options_.escapeCombo) {
        vk = genericVk(vk);
    }
    wire();
}

Engine::~Engine() {
    stop();
}

void Engine::wire() {
    session_.setConnectedHandler([this](const std::string& peerName) {
        modeSwitch_.setConnected(true);
        if (connectedHandler_) connectedHandler_(peerName);
    });
    session_.setDisconnectedHandler([this](const std::string& reason) {
        modeSwitch_.setConnected(false);
        forwarder_.releaseInjected();
        resetPeerBounds();
        if (disconnectedHandler_) disconnectedHandler_(reason);
    });
    session_.setScreenInfoHandler([this](const ScreenLayout& layout) {
        Bounds bounds = computeCombinedBounds(layout);
        if (!bounds.hasArea()) {
            Utils::Logger::GetInstance().Warning("Engine: peer layout has no area, keeping " +
                                                 boundsToString(modeSwitch_.peerBounds()));
        } else {
            modeSwitch_.setPeerBounds(bounds);
            forwarder_.setPeerBounds(bounds);
        }
        if (screenInfoHandler_) screenInfoHandler_(layout);
    });
    session_.setMessageHandler([this](const Network::WireMessage& message) { onSessionMessage(message); });
    session_.setStatusHandler([this](Network::SessionStatus status, const std::string& text) {
        if (statusHandler_) statusHandler_(status, text);
    });

    modeSwitch_.setSendHandler([this](const Network::ModeSwitch& message) { session_.send(message); });
    modeSwitch_.setForwardingHandler([this](bool forwarding, const Point& start) {
        if (forwarding) {
            forwarder_.beginForwarding(start);
        } else {
            forwarder_.endForwarding();
        }
        if (capture_) {
            capture_->setCursorVisible(!forwarding);
        }
    });
    modeSwitch_.setWarpHandler([this](const Point& point) {
        if (injector_) {
            injector_->moveAbsolute(point.x, point.y);
        } else {
            Utils::Logger::GetInstance().Debug("Engine: no injector, cursor not moved");
        }
    });
    modeSwitch_.setRemoteCursorSource([this]() -> std::optional<Point> {
        if (!forwarder_.isForwarding()) {
            return std::nullopt;
        }
        return forwarder_.virtualCursor();
    });
    modeSwitch_.setModeChangedHandler([this](const ModeState& state) { onModeChanged(state); });

    forwarder_.setSendHandler([this](const Network::WireMessage& message) { session_.send(message); });
    forwarder_.setReturnHandler([this](const Point& remote) { modeSwitch_.onRemoteCursorReturned(remote); });

    edgeDetector_.setCursorSource([this]() -> std::optional<Point> {
        return capture_ ? capture_->cursorPosition() : std::nullopt;
    });
    edgeDetector_.setEdgeHitHandler([this](const EdgeHit& hit) { modeSwitch_.onEdgeHit(hit); });
}

EngineState Engine::fail(EngineState state, const std::string& reason) {
    Utils::Logger::GetInstance().Error("Engine: " + reason);
    {
        std::lock_guard<std::mutex> lock(snapshotMutex_);
        lastError_ = reason;
    }
    if (capture_ && capture_->isRunning()) {
        capture_->stop();
    }
    edgeDetector_.setEnabled(false);
    modeSwitch_.reset("engine did not start");
    state_ = state;
    return state;
}

EngineState Engine::start() {
    auto& logger = Utils::Logger::GetInstance();
    if (state_.load() == EngineState::Running) {
        return EngineState::Running;
    }
    if (stopped_.load()) {
        logger.Warning("Engine: start after stop is not supported");
        return state_.load();
    }
    if (logHandler_) {
        logger.SetSink(logHandler_);
    }

    logger.Info("Engine: starting as " + Network::sessionRoleToString(options_.role) + " '" + options_.session.name +
                "', peer on the " + edgeToString(options_.edge) + ", escape " + comboToString(options_.escapeCombo));

    ScreenLayout layout;
    {
        std::lock_guard<std::mutex> lock(snapshotMutex_);
        layout = localLayout_;
    }

    if (usePlatformPorts_) {
        displayMonitor_ = std::make_unique<Input::DisplayMonitor>(io_context_);
        if (displayMonitor_->initialize()) {
            layout = displayMonitor_->layout();
            displayMonitor_->setLayoutChangedHandler([this](const ScreenLayout& changed) { applyLocalLayout(changed); });
        } else {
            logger.Warning("Engine: no display information, edges will never trigger");
        }
        try {
            capture_ = Input::createInputCapture();
        } catch (const std::runtime_error& e) {
            return fail(EngineState::Failed, e.what());
        }
    }
    applyLocalLayout(layout);

    if (usePlatformPorts_ && !injector_) {
        try {
            injector_ = Input::createInputInjector(computeCombinedBounds(layout));
        } catch (const std::runtime_error& e) {
            logger.Error("Engine: input injection unavailable: " + std::string(e.what()));
            std::lock_guard<std::mutex> lock(snapshotMutex_);
            lastError_ = e.what();
        }
    }
    forwarder_.setInjector(injector_.get());

    if (!capture_) {
        return fail(EngineState::Failed, "no input capture available");
    }
    Input::CaptureStatus captureStatus =
        capture_->start([this](const Input::RawInputEvent& event) { return onCapturedEvent(event); });
    if (captureStatus == Input::CaptureStatus::PermissionDenied) {
        return fail(EngineState::PermissionDenied, "permission denied opening input devices");
    }
    if (captureStatus != Input::CaptureStatus::Started) {
        return fail(EngineState::Failed, "input capture " + Input::captureStatusToString(captureStatus));
    }

    if (options_.role == Network::SessionRole::Host) {
        if (!session_.startHost(options_.port)) {
            return fail(EngineState::Failed, session_.snapshot().failureReason);
        }
    } else {
        session_.connect(options_.address, options_.port);
    }

    workGuard_.emplace(asio::make_work_guard(io_context_));
    ioThread_ = std::thread([this]() {
        try {
            io_context_.run();
        } catch (const std::exception& e) {
            Utils::Logger::GetInstance().Critical("Engine: event loop terminated: " + std::string(e.what()));
        }
    });

    asio::post(io_context_, [this]() {
        edgeDetector_.setEnabled(true);
        edgeDetector_.start();
        if (displayMonitor_) {
            displayMonitor_->start();
        }
    });

    state_ = EngineState::Running;
    logger.Info("Engine: running");
    return EngineState::Running;
}

void Engine::stop() {
    if (stopped_.exchange(true)) {
        return;
    }
    auto& logger = Utils::Logger::GetInstance();
    bool wasRunning = state_.load() == EngineState::Running;
    if (wasRunning) {
        logger.Info("Engine: stopping");
    }

    auto unwindLoopState = [this]() {
        session_.stop();
        modeSwitch_.reset("engine stopped");
        edgeDetector_.stop();
        if (displayMonitor_) {
            displayMonitor_->stop();
        }
        forwarder_.releaseInjected();
    };

    if (ioThread_.joinable()) {
        std::promise<void> done;
        std::future<void> finished = done.get_future();
        asio::post(io_context_, [&]() {
            unwindLoopState();
            done.set_value();
        });
        if (finished.wait_for(std::chrono::seconds(2)) != std::future_status::ready) {
            logger.Warning("Engine: event loop did not acknowledge shutdown");
        }
    } else {
        unwindLoopState();
    }

    if (capture_) {
        capture_->stop();
        capture_->setCursorVisible(true);
    }

    workGuard_.reset();
    io_context_.stop();
    if (ioThread_.joinable()) {
        ioThread_.join();
    }

    if (logHandler_) {
        logger.SetSink(nullptr);
    }
    if (wasRunning) {
        state_ = EngineState::Stopped;
        logger.Info("Engine: stopped");
    }
}

void Engine::reconnect() {
    if (options_.role != Network::SessionRole::Client || state_.load() != EngineState::Running) {
        return;
    }
    session_.connect(options_.address, options_.port);
}

EngineSnapshot Engine::snapshot() const {
    EngineSnapshot snap;
    snap.state = state_.load();
    snap.session = session_.snapshot();
    std::lock_guard<std::mutex> lock(snapshotMutex_);
    snap.lastError = lastError_;
    snap.mode = mode_;
    snap.localLayout = localLayout_;
    snap.localBounds = localBounds_;
    return snap;
}

bool Engine::trackEscapeCombo(const Input::KeyEvent& key) {
    uint8_t vk = genericVk(static_cast<uint8_t>(
        Utils::KeycodeConverter::toCanonical(Utils::KeycodeConverter::hostPlatform(), key.localCode)));

    auto held = std::find(heldVk_.begin(), heldVk_.end(), vk);
    if (key.pressed && held == heldVk_.end()) {
        heldVk_.push_back(vk);
    } else if (!key.pressed && held != heldVk_.end()) {
        heldVk_.erase(held);
    }

    if (swallowedVk_ != 0 && vk == swallowedVk_) {
        if (!key.pressed) {
            swallowedVk_ = 0;
        }
        return true;
    }

    bool comboHeld = std::all_of(options_.escapeCombo.begin(), options_.escapeCombo.end(), [this](uint8_t comboVk) {
        return std::find(heldVk_.begin(), heldVk_.end(), comboVk) != heldVk_.end();
    });
    if (!comboHeld) {
        comboLatched_ = false;
        return false;
    }
    if (key.pressed && !comboLatched_) {
        comboLatched_ = true;
        asio::post(io_context_, [this]() { modeSwitch_.onEscapeHotkey(); });
        // Local applications still see the chord while this side has the input.
        if (remoteHasControl_.load(std::memory_order_acquire) ||
            suppressLocalInput_.load(std::memory_order_acquire)) {
            swallowedVk_ = vk;
            return true;
        }
    }
    return false;
}

bool Engine::onCapturedEvent(const Input::RawInputEvent& event) {
    bool hotkey = false;
    if (const auto* key = std::get_if<Input::KeyEvent>(&event)) {
        hotkey = trackEscapeCombo(*key);
    }

    if (remoteHasControl_.load(std::memory_order_acquire)) {
        if (!hotkey) {
            asio::post(io_context_, [this, event]() { forwarder_.handleRawEvent(event); });
        }
        return true;
    }
    return hotkey || suppressLocalInput_.load(std::memory_order_acquire);
}

void Engine::applyLocalLayout(const ScreenLayout& layout) {
    Bounds bounds = computeCombinedBounds(layout);
    {
        std::lock_guard<std::mutex> lock(snapshotMutex_);
        localLayout_ = layout;
        localBounds_ = bounds;
    }
    edgeDetector_.setBounds(bounds);
    modeSwitch_.setLocalBounds(bounds);
    forwarder_.setLocalBounds(bounds);
    // TODO: recreate the uinput device when the bounds grow, its absolute range is fixed at creation.
    session_.sendScreenInfo(layout);
}

void Engine::onModeChanged(const ModeState& state) {
    bool wasSuppressed = suppressLocalInput_.load();
    remoteHasControl_.store(state.remoteHasControl, std::memory_order_release);
    suppressLocalInput_.store(state.suppressLocalInput, std::memory_order_release);
    if (wasSuppressed && !state.suppressLocalInput) {
        forwarder_.releaseInjected();
    }
    edgeDetector_.setEnabled(state.phase == ModePhase::LocalActive && !state.suppressLocalInput);
    {
        std::lock_guard<std::mutex> lock(snapshotMutex_);
        mode_ = state;
    }
    if (modeChangedHandler_) {
        modeChangedHandler_(state);
    }
}

void Engine::onSessionMessage(const Network::WireMessage& message) {
    if (const auto* modeSwitch = std::get_if<Network::ModeSwitch>(&message)) {
        modeSwitch_.onPeerModeSwitch(*modeSwitch);
        return;
    }
    if (std::holds_alternative<Network::ErrorMessage>(message)) {
        return;
    }
    if (!modeSwitch_.acceptsRemoteInput()) {
        Utils::Logger::GetInstance().Debug("Engine: dropping " + Network::messageTypeName(message) +
                                           ", the peer does not control this machine");
        return;
    }
    forwarder_.inject(message);
}

void Engine::resetPeerBounds() {
    modeSwitch_.setPeerBounds(defaultPeerBounds());
    forwarder_.setPeerBounds(defaultPeerBounds());
}

}
