#include "core/ModeSwitch.h"
#include "utils/Logger.h"

namespace EdgeShare::Core {

std::string modePhaseToString(ModePhase phase) {
    switch (phase) {
        case ModePhase::LocalActive: return "LocalActive";
        case ModePhase::SwitchPending: return "SwitchPending";
        case ModePhase::RemoteActive: return "RemoteActive";
    }
    return "Unknown";
}

std::string modeStateToString(const ModeState& state) {
    std::string text = modePhaseToString(state.phase);
    if (state.suppressLocalInput) {
        text += " (driven by peer)";
    }
    return text;
}

ModeSwitch::ModeSwitch(asio::io_context& io_context, Edge configuredEdge, ConflictPolicy policy,
                       std::chrono::milliseconds ackTimeout)
    : pendingTimer_(io_context),
      ackTimeout_(ackTimeout),
      configuredEdge_(configuredEdge),
      policy_(policy) {}

ModeSwitch::~ModeSwitch() {
    pendingTimer_.cancel();
}

void ModeSwitch::setState(ModePhase phase, bool remoteHasControl, bool suppressLocalInput) {
    ModeState next{phase, remoteHasControl, suppressLocalInput};
    if (next == state_) {
        return;
    }
    Utils::Logger::GetInstance().Info("ModeSwitch: " + modeStateToString(state_) + " -> " + modeStateToString(next));
    state_ = next;
    if (modeChangedHandler_) {
        modeChangedHandler_(state_);
    }
}

void ModeSwitch::send(const Network::ModeSwitch& message) {
    if (sendHandler_) {
        sendHandler_(message);
    }
}

void ModeSwitch::cancelPending() {
    pendingGeneration_++;
    pendingTimer_.cancel();
}

void ModeSwitch::setConnected(bool connected) {
    if (connected_ == connected) {
        return;
    }
    connected_ = connected;
    if (!connected) {
        reset("session disconnected");
    }
}

void ModeSwitch::reset(const std::string& reason) {
    cancelPending();
    bool wasForwarding = state_.phase == ModePhase::RemoteActive;
    if (wasForwarding && forwardingHandler_) {
        forwardingHandler_(false, Point{});
    }
    if (state_ != ModeState{}) {
        Utils::Logger::GetInstance().Info("ModeSwitch: Forcing local control (" + reason + ")");
    }
    setState(ModePhase::LocalActive, false, false);
}

void ModeSwitch::onEdgeHit(const EdgeHit& hit) {
    if (!connected_) {
        Utils::Logger::GetInstance().Debug("ModeSwitch: Edge hit ignored, no connected peer");
        return;
    }
    if (state_.suppressLocalInput || state_.phase != ModePhase::LocalActive) {
        return;
    }
    if (hit.edge != configuredEdge_) {
        return;
    }

    const Bounds& local = localBounds_.hasArea() ? localBounds_ : hit.bounds;
    pendingEntry_ = entryPoint(hit.edge, hit.position, local, peerBounds_);

    setState(ModePhase::SwitchPending, false, false);

    Network::ModeSwitch request;
    request.active = true;
    request.x = pendingEntry_.x;
    request.y = pendingEntry_.y;
    send(request);

    uint64_t generation = ++pendingGeneration_;
    pendingTimer_.expires_after(ackTimeout_);
    pendingTimer_.async_wait([this, generation](const std::error_code& ec) {
        if (ec == asio::error::operation_aborted) {
            return;
        }
        if (generation == pendingGeneration_ && state_.phase == ModePhase::SwitchPending) {
            Utils::Logger::GetInstance().Warning("ModeSwitch: Peer did not acknowledge switch within " +
                                                 std::to_string(ackTimeout_.count()) + "ms");
            setState(ModePhase::LocalActive, false, false);
        }
    });
}

void ModeSwitch::acceptPeerControl(const Network::ModeSwitch& message) {
    bool alreadyDriven = state_.suppressLocalInput;
    setState(ModePhase::LocalActive, false, true);

    if (!alreadyDriven && message.x && message.y && warpHandler_) {
        Point target{*message.x, *message.y};
        if (localBounds_.hasArea()) {
            target = clampToBounds(target, localBounds_);
        }
        warpHandler_(target);
    }

    Network::ModeSwitch ack;
    ack.active = true;
    ack.ack = true;
    send(ack);
}

void ModeSwitch::onPeerModeSwitch(const Network::ModeSwitch& message) {
    auto& logger = Utils::Logger::GetInstance();
    if (!connected_) {
        logger.Warning("ModeSwitch: mode_switch received while not connected, ignoring");
        return;
    }

    if (message.active && message.ack) {
        switch (state_.phase) {
            case ModePhase::SwitchPending:
                cancelPending();
                setState(ModePhase::RemoteActive, true, false);
                if (forwardingHandler_) {
                    forwardingHandler_(true, pendingEntry_);
                }
                break;
            case ModePhase::RemoteActive:
                logger.Debug("ModeSwitch: Duplicate acknowledgement ignored");
                break;
            case ModePhase::LocalActive:
                if (!state_.suppressLocalInput) {
                    // The claim it answers already expired; release the peer again.
                    logger.Warning("ModeSwitch: Stale acknowledgement, releasing peer");
                    Network::ModeSwitch release;
                    release.active = false;
                    send(release);
                } else {
                    logger.Warning("ModeSwitch: Acknowledgement received while driven by peer, ignoring");
                }
                break;
        }
        return;
    }

    if (message.active) {
        switch (state_.phase) {
            case ModePhase::LocalActive:
                acceptPeerControl(message);
                break;
            case ModePhase::SwitchPending:
                if (policy_ == ConflictPolicy::KeepClaim) {
                    logger.Warning("ModeSwitch: Peer claimed control while our claim is pending, keeping ours");
                } else {
                    logger.Warning("ModeSwitch: Peer claimed control while our claim is pending, yielding");
                    cancelPending();
                    setState(ModePhase::LocalActive, false, false);
                    acceptPeerControl(message);
                }
                break;
            case ModePhase::RemoteActive:
                logger.Warning("ModeSwitch: Peer claimed control while we hold it, ignoring");
                break;
        }
        return;
    }

    if (state_.phase == ModePhase::RemoteActive) {
        logger.Info("ModeSwitch: Peer reclaimed its input");
        std::optional<Point> remote = remoteCursorSource_ ? remoteCursorSource_() : std::nullopt;
        returnToLocal(false, remote);
    } else if (state_.suppressLocalInput) {
        logger.Info("ModeSwitch: Peer released control back to this machine");
        setState(ModePhase::LocalActive, false, false);
    } else {
        logger.Debug("ModeSwitch: Release received while already local, ignoring");
    }
}

void ModeSwitch::onEscapeHotkey() {
    auto& logger = Utils::Logger::GetInstance();
    switch (state_.phase) {
        case ModePhase::RemoteActive: {
            logger.Info("ModeSwitch: Escape hotkey, returning control to this machine");
            std::optional<Point> remote = remoteCursorSource_ ? remoteCursorSource_() : std::nullopt;
            returnToLocal(true, remote);
            return;
        }
        case ModePhase::SwitchPending: {
            logger.Info("ModeSwitch: Escape hotkey, abandoning pending switch");
            cancelPending();
            setState(ModePhase::LocalActive, false, false);
            Network::ModeSwitch release;
            release.active = false;
            send(release);
            return;
        }
        case ModePhase::LocalActive:
            break;
    }

    if (state_.suppressLocalInput) {
        logger.Info("ModeSwitch: Escape hotkey, reclaiming local input from peer");
        setState(ModePhase::LocalActive, false, false);
        if (connected_) {
            Network::ModeSwitch release;
            release.active = false;
            send(release);
        }
    }
}

void ModeSwitch::onRemoteCursorReturned(const Point& remotePoint) {
    if (state_.phase != ModePhase::RemoteActive) {
        return;
    }
    returnToLocal(true, remotePoint);
}

void ModeSwitch::returnToLocal(bool notifyPeer, std::optional<Point> remotePoint) {
    if (state_.phase == ModePhase::RemoteActive && forwardingHandler_) {
        forwardingHandler_(false, Point{});
    }
    setState(ModePhase::LocalActive, false, false);

    if (notifyPeer) {
        Network::ModeSwitch release;
        release.active = false;
        send(release);
    }

    if (remotePoint && warpHandler_ && localBounds_.hasArea()) {
        // Leaving the peer through the edge facing us lands next to our configured edge.
        Point back = entryPoint(oppositeEdge(configuredEdge_), *remotePoint, peerBounds_, localBounds_);
        warpHandler_(back);
    }
}

}
