#include "input/InputForwarder.h"
#include "utils/KeycodeConverter.h"
#include "utils/Logger.h"

#include <algorithm>
#include <cmath>
#include <type_traits>
#include <vector>

namespace EdgeShare::Input {

InputForwarder::InputForwarder(Core::Edge configuredEdge, float sensitivity, int32_t scrollScale)
    : configuredEdge_(configuredEdge),
      sensitivity_(sensitivity),
      scrollScale_(scrollScale) {}

void InputForwarder::setPeerBounds(const Core::Bounds& bounds) {
    peerBounds_ = bounds.hasArea() ? bounds : Core::defaultPeerBounds();
    if (forwarding_) {
        Core::Point clamped = Core::clampToBounds(virtualCursor(), peerBounds_);
        cursorX_ = clamped.x;
        cursorY_ = clamped.y;
    }
}

void InputForwarder::send(const Network::WireMessage& message) {
    if (sendHandler_) {
        sendHandler_(message);
    }
}

Core::Point InputForwarder::virtualCursor() const {
    return Core::Point{static_cast<int32_t>(std::lround(cursorX_)), static_cast<int32_t>(std::lround(cursorY_))};
}

Network::KeyModifiers InputForwarder::modifiers() const {
    Network::KeyModifiers mods;
    for (uint16_t vk : heldKeys_) {
        switch (vk) {
            case VK_SHIFT: case VK_LSHIFT: case VK_RSHIFT: mods.shift = true; break;
            case VK_CONTROL: case VK_LCONTROL: case VK_RCONTROL: mods.control = true; break;
            case VK_MENU: case VK_LMENU: case VK_RMENU: mods.alt = true; break;
            case VK_LWIN: case VK_RWIN: mods.meta = true; break;
            default: break;
        }
    }
    return mods;
}

void InputForwarder::beginForwarding(const Core::Point& remoteStart) {
    Core::Point start = Core::clampToBounds(remoteStart, peerBounds_);
    cursorX_ = start.x;
    cursorY_ = start.y;
    forwarding_ = true;
    returnRaised_ = false;
    heldKeys_.clear();
    heldButtons_.clear();
    Utils::Logger::GetInstance().Info("InputForwarder: forwarding to peer from (" + std::to_string(start.x) + "," +
                                      std::to_string(start.y) + ") within " + Core::boundsToString(peerBounds_));
    send(Network::MouseMove{start.x, start.y, Network::nowMillis()});
}

void InputForwarder::endForwarding() {
    if (!forwarding_) {
        return;
    }
    Core::Point at = virtualCursor();
    int64_t now = Network::nowMillis();
    for (Network::MouseButtonId button : heldButtons_) {
        send(Network::MouseButton{button, Network::PressAction::Up, at.x, at.y, now});
    }
    heldButtons_.clear();
    // Modifiers last so the peer sees ordinary keys released with them still held.
    std::vector<uint16_t> order(heldKeys_.begin(), heldKeys_.end());
    std::stable_partition(order.begin(), order.end(), [](uint16_t vk) {
        return !Utils::KeycodeConverter::isVkModifier(static_cast<uint8_t>(vk));
    });
    for (uint16_t vk : order) {
        heldKeys_.erase(vk);
        send(Network::Key{vk, Network::PressAction::Up, modifiers(), now});
    }
    heldKeys_.clear();
    forwarding_ = false;
    Utils::Logger::GetInstance().Info("InputForwarder: forwarding stopped");
}

bool InputForwarder::pastReturnEdge(double x, double y) const {
    switch (Core::oppositeEdge(configuredEdge_)) {
        case Core::Edge::Left: return x < peerBounds_.minX;
        case Core::Edge::Right: return x > peerBounds_.maxX - 1;
        case Core::Edge::Top: return y < peerBounds_.minY;
        case Core::Edge::Bottom: return y > peerBounds_.maxY - 1;
    }
    return false;
}

void InputForwarder::handleMotion(const MouseMotionEvent& motion) {
    Core::Point before = virtualCursor();
    double nextX = cursorX_ + motion.dx * static_cast<double>(sensitivity_);
    double nextY = cursorY_ + motion.dy * static_cast<double>(sensitivity_);

    bool leaving = pastReturnEdge(nextX, nextY);

    cursorX_ = std::clamp(nextX, static_cast<double>(peerBounds_.minX), static_cast<double>(peerBounds_.maxX - 1));
    cursorY_ = std::clamp(nextY, static_cast<double>(peerBounds_.minY), static_cast<double>(peerBounds_.maxY - 1));
    Core::Point after = virtualCursor();

    if (leaving) {
        if (!returnRaised_) {
            returnRaised_ = true;
            Utils::Logger::GetInstance().Debug("InputForwarder: virtual cursor left the peer through the " +
                                               Core::edgeToString(Core::oppositeEdge(configuredEdge_)) + " edge");
            if (returnHandler_) {
                returnHandler_(after);
            }
        }
        return;
    }

    if (after != before) {
        send(Network::MouseMove{after.x, after.y, Network::nowMillis()});
    }
}

void InputForwarder::handleRawEvent(const RawInputEvent& event) {
    if (!forwarding_) {
        return;
    }
    std::visit([this](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, MouseMotionEvent>) {
            handleMotion(e);
        } else if constexpr (std::is_same_v<T, MouseButtonEvent>) {
            if (e.pressed) {
                heldButtons_.insert(e.button);
            } else {
                heldButtons_.erase(e.button);
            }
            Core::Point at = virtualCursor();
            send(Network::MouseButton{e.button, e.pressed ? Network::PressAction::Down : Network::PressAction::Up,
                                      at.x, at.y, Network::nowMillis()});
        } else if constexpr (std::is_same_v<T, MouseWheelEvent>) {
            send(Network::MouseScroll{e.dx * scrollScale_, e.dy * scrollScale_, Network::nowMillis()});
        } else if constexpr (std::is_same_v<T, KeyEvent>) {
            uint16_t canonical = Utils::KeycodeConverter::toCanonical(Utils::KeycodeConverter::hostPlatform(), e.localCode);
            if (e.pressed) {
                heldKeys_.insert(canonical);
            } else {
                heldKeys_.erase(canonical);
            }
            send(Network::Key{canonical, e.pressed ? Network::PressAction::Down : Network::PressAction::Up,
                              modifiers(), Network::nowMillis()});
        }
    }, event);
}

bool InputForwarder::inject(const Network::WireMessage& message) {
    auto& logger = Utils::Logger::GetInstance();
    return std::visit([&](const auto& m) -> bool {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, Network::MouseMove>) {
            Core::Point target{m.x, m.y};
            if (localBounds_.hasArea()) {
                target = Core::clampToBounds(target, localBounds_);
            }
            if (injector_) injector_->moveAbsolute(target.x, target.y);
            return true;
        } else if constexpr (std::is_same_v<T, Network::MouseButton>) {
            bool pressed = m.action == Network::PressAction::Down;
            if (pressed) {
                injectedButtons_.insert(m.button);
            } else {
                injectedButtons_.erase(m.button);
            }
            if (injector_) injector_->button(m.button, pressed);
            return true;
        } else if constexpr (std::is_same_v<T, Network::MouseScroll>) {
            if (injector_) injector_->scroll(m.deltaX, m.deltaY);
            return true;
        } else if constexpr (std::is_same_v<T, Network::Key>) {
            uint16_t local = Utils::KeycodeConverter::fromCanonical(Utils::KeycodeConverter::hostPlatform(), m.keyCode);
            bool pressed = m.action == Network::PressAction::Down;
            if (pressed) {
                injectedKeys_.insert(local);
            } else {
                injectedKeys_.erase(local);
            }
            logger.Trace("InputForwarder: key " + Utils::Logger::getKeyName(static_cast<uint8_t>(m.keyCode)) +
                         (pressed ? " down" : " up"));
            if (injector_) injector_->key(local, pressed);
            return true;
        } else {
            return false;
        }
    }, message);
}

void InputForwarder::releaseInjected() {
    if (injectedButtons_.empty() && injectedKeys_.empty()) {
        return;
    }
    Utils::Logger::GetInstance().Debug("InputForwarder: releasing " +
                                       std::to_string(injectedButtons_.size() + injectedKeys_.size()) +
                                       " input(s) held by the peer");
    if (injector_) {
        for (Network::MouseButtonId button : injectedButtons_) {
            injector_->button(button, false);
        }
        for (uint16_t key : injectedKeys_) {
            injector_->key(key, false);
        }
    }
    injectedButtons_.clear();
    injectedKeys_.clear();
}

}
