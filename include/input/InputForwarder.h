#pragma once

#include "core/ScreenGeometry.h"
#include "input/InputManager.h"
#include "network/Message.h"

#include <functional>
#include <set>
#include <utility>

namespace EdgeShare::Input {

// Turns local raw input into wire messages while this machine drives the
// peer, and replays the peer's messages through an injector while the peer
// drives this machine. Runs on the engine's event loop only.
class InputForwarder {
public:
    using SendHandler = std::function<void(const Network::WireMessage&)>;
    // The virtual cursor was pushed out through the edge facing this machine.
    using ReturnHandler = std::function<void(const Core::Point& remotePoint)>;

    InputForwarder(Core::Edge configuredEdge, float sensitivity = 1.0f,
                   int32_t scrollScale = ScrollAccumulator::UNITS_PER_NOTCH);

    void setSendHandler(SendHandler handler) { sendHandler_ = std::move(handler); }
    void setReturnHandler(ReturnHandler handler) { returnHandler_ = std::move(handler); }
    void setInjector(InputInjector* injector) { injector_ = injector; }

    void setConfiguredEdge(Core::Edge edge) { configuredEdge_ = edge; }
    void setPeerBounds(const Core::Bounds& bounds);
    const Core::Bounds& peerBounds() const { return peerBounds_; }
    void setLocalBounds(const Core::Bounds& bounds) { localBounds_ = bounds; }
    void setSensitivity(float sensitivity) { sensitivity_ = sensitivity; }

    void beginForwarding(const Core::Point& remoteStart);
    // Sends releases for anything still held on the peer.
    void endForwarding();
    bool isForwarding() const { return forwarding_; }

    void handleRawEvent(const RawInputEvent& event);

    Core::Point virtualCursor() const;
    Network::KeyModifiers modifiers() const;

    // Returns false when the message is not an input event.
    bool inject(const Network::WireMessage& message);
    // Lifts keys and buttons the peer left pressed on this machine.
    void releaseInjected();

private:
    void send(const Network::WireMessage& message);
    void handleMotion(const MouseMotionEvent& motion);
    bool pastReturnEdge(double x, double y) const;

    Core::Edge configuredEdge_;
    float sensitivity_;
    int32_t scrollScale_;
    Core::Bounds peerBounds_ = Core::defaultPeerBounds();
    Core::Bounds localBounds_;

    bool forwarding_ = false;
    bool returnRaised_ = false;
    double cursorX_ = 0.0;
    double cursorY_ = 0.0;

    std::set<uint16_t> heldKeys_;
    std::set<Network::MouseButtonId> heldButtons_;
    std::set<uint16_t> injectedKeys_;
    std::set<Network::MouseButtonId> injectedButtons_;

    InputInjector* injector_ = nullptr;
    SendHandler sendHandler_;
    ReturnHandler returnHandler_;
};

}
