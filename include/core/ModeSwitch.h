#pragma once

#include "core/EdgeDetector.h"
#include "core/ScreenGeometry.h"
#include "network/Message.h"

#include <asio.hpp>
#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace EdgeShare::Core {

enum class ModePhase {
    LocalActive,
    SwitchPending,
    RemoteActive
};

struct ModeState {
    ModePhase phase = ModePhase::LocalActive;
    // This machine drives the peer.
    bool remoteHasControl = false;
    // The peer drives this machine; local physical input is swallowed.
    bool suppressLocalInput = false;

    bool operator==(const ModeState& o) const {
        return phase == o.phase && remoteHasControl == o.remoteHasControl &&
               suppressLocalInput == o.suppressLocalInput;
    }
    bool operator!=(const ModeState& o) const { return !(*this == o); }
};

// What to do when both machines claim control at the same time.
enum class ConflictPolicy {
    KeepClaim,
    Yield
};

std::string modePhaseToString(ModePhase phase);
std::string modeStateToString(const ModeState& state);

class ModeSwitch {
public:
    using SendHandler = std::function<void(const Network::ModeSwitch&)>;
    // true: begin forwarding with the virtual cursor at the given peer position.
    using ForwardingHandler = std::function<void(bool forwarding, const Point& remoteStart)>;
    using WarpHandler = std::function<void(const Point&)>;
    using RemoteCursorSource = std::function<std::optional<Point>()>;
    using ModeChangedHandler = std::function<void(const ModeState&)>;

    ModeSwitch(asio::io_context& io_context, Edge configuredEdge, ConflictPolicy policy,
               std::chrono::milliseconds ackTimeout = std::chrono::milliseconds(2000));
    ~ModeSwitch();

    ModeSwitch(const ModeSwitch&) = delete;
    ModeSwitch& operator=(const ModeSwitch&) = delete;

    void setSendHandler(SendHandler handler) { sendHandler_ = std::move(handler); }
    void setForwardingHandler(ForwardingHandler handler) { forwardingHandler_ = std::move(handler); }
    void setWarpHandler(WarpHandler handler) { warpHandler_ = std::move(handler); }
    void setRemoteCursorSource(RemoteCursorSource source) { remoteCursorSource_ = std::move(source); }
    void setModeChangedHandler(ModeChangedHandler handler) { modeChangedHandler_ = std::move(handler); }

    void setConflictPolicy(ConflictPolicy policy) { policy_ = policy; }
    void setConfiguredEdge(Edge edge) { configuredEdge_ = edge; }
    Edge configuredEdge() const { return configuredEdge_; }

    void setLocalBounds(const Bounds& bounds) { localBounds_ = bounds; }
    void setPeerBounds(const Bounds& bounds) { peerBounds_ = bounds; }
    const Bounds& peerBounds() const { return peerBounds_; }

    // Session reached or left Connected. Leaving always forces local control.
    void setConnected(bool connected);
    bool isConnected() const { return connected_; }

    void onEdgeHit(const EdgeHit& hit);
    void onPeerModeSwitch(const Network::ModeSwitch& message);
    void onEscapeHotkey();

    // The virtual remote cursor reached the edge leading back to this machine.
    void onRemoteCursorReturned(const Point& remotePoint);

    // Forces LocalActive without notifying the peer.
    void reset(const std::string& reason);

    const ModeState& state() const { return state_; }
    bool acceptsRemoteInput() const { return connected_ && state_.suppressLocalInput; }

private:
    void setState(ModePhase phase, bool remoteHasControl, bool suppressLocalInput);
    void send(const Network::ModeSwitch& message);
    void cancelPending();
    void acceptPeerControl(const Network::ModeSwitch& message);
    void returnToLocal(bool notifyPeer, std::optional<Point> remotePoint);

    asio::steady_timer pendingTimer_;
    std::chrono::milliseconds ackTimeout_;
    Edge configuredEdge_;
    ConflictPolicy policy_;

    ModeState state_;
    bool connected_ = false;
    Bounds localBounds_;
    Bounds peerBounds_ = defaultPeerBounds();
    Point pendingEntry_;
    uint64_t pendingGeneration_ = 0;

    SendHandler sendHandler_;
    ForwardingHandler forwardingHandler_;
    WarpHandler warpHandler_;
    RemoteCursorSource remoteCursorSource_;
    ModeChangedHandler modeChangedHandler_;
};

}
