#include "core/ScreenGeometry.h"
#include <algorithm>
#include <cctype>
#include <limits>

namespace EdgeShare::Core {

bool isPlausibleRect(const ScreenRect& rect) {
    auto inRange = [](int32_t value, int32_t low) { return value >= low && value <= MAX_COORDINATE; };
    return inRange(rect.x, -MAX_COORDINATE) && inRange(rect.y, -MAX_COORDINATE) &&
           inRange(rect.width, 0) && inRange(rect.height, 0);
}

Bounds computeCombinedBounds(const ScreenLayout& rects) {
    bool any = false;
    Bounds bounds{
        std::numeric_limits<int32_t>::max(),
        std::numeric_limits<int32_t>::max(),
        std::numeric_limits<int32_t>::min(),
        std::numeric_limits<int32_t>::min()
    };
    for (const auto& rect : rects) {
        if (!isPlausibleRect(rect)) {
            continue;
        }
        any = true;
        bounds.minX = std::min(bounds.minX, rect.x);
        bounds.minY = std::min(bounds.minY, rect.y);
        bounds.maxX = std::max(bounds.maxX, rect.x + rect.width);
        bounds.maxY = std::max(bounds.maxY, rect.y + rect.height);
    }
    return any ? bounds : Bounds{};
}

std::optional<Edge> classifyEdge(const Point& point, const Bounds& bounds, int32_t threshold) {
    if (!bounds.hasArea()) {
        return std::nullopt;
    }

    if (point.x <= bounds.minX + threshold) {
        return Edge::Left;
    }
    if (point.x >= bounds.maxX - threshold) {
        return Edge::Right;
    }
    if (point.y <= bounds.minY + threshold) {
        return Edge::Top;
    }
    if (point.y >= bounds.maxY - threshold) {
        return Edge::Bottom;
    }
    return std::nullopt;
}

Edge oppositeEdge(Edge edge) {
    switch (edge) {
        case Edge::Left: return Edge::Right;
        case Edge::Right: return Edge::Left;
        case Edge::Top: return Edge::Bottom;
        case Edge::Bottom: return Edge::Top;
    }
    return Edge::Left;
}

Point clampToBounds(const Point& point, const Bounds& bounds) {
    if (!bounds.hasArea()) {
        return Point{bounds.minX, bounds.minY};
    }
    return Point{
        std::clamp(point.x, bounds.minX, bounds.maxX - 1),
        std::clamp(point.y, bounds.minY, bounds.maxY - 1)
    };
}

namespace {
    int32_t mapAlong(int32_t value, int32_t fromMin, int32_t fromLength, int32_t toMin, int32_t toLength) {
        if (fromLength <= 0 || toLength <= 0) {
            return toMin;
        }
        double ratio = static_cast<double>(value - fromMin) / static_cast<double>(fromLength);
        ratio = std::clamp(ratio, 0.0, 1.0);
        return toMin + static_cast<int32_t>(ratio * static_cast<double>(toLength - 1));
    }
}

Point entryPoint(Edge exitEdge, const Point& exitPoint, const Bounds& local, const Bounds& peer, int32_t inset) {
    Point result{};
    switch (exitEdge) {
        case Edge::Right:
            result.x = peer.minX + inset;
            result.y = mapAlong(exitPoint.y, local.minY, local.height(), peer.minY, peer.height());
            break;
        case Edge::Left:
            result.x = peer.maxX - 1 - inset;
            result.y = mapAlong(exitPoint.y, local.minY, local.height(), peer.minY, peer.height());
            break;
        case Edge::Bottom:
            result.x = mapAlong(exitPoint.x, local.minX, local.width(), peer.minX, peer.width());
            result.y = peer.minY + inset;
            break;
        case Edge::Top:
            result.x = mapAlong(exitPoint.x, local.minX, local.width(), peer.minX, peer.width());
            result.y = peer.maxY - 1 - inset;
            break;
    }
    return clampToBounds(result, peer);
}

Bounds defaultPeerBounds() {
    return Bounds{0, 0, DEFAULT_PEER_WIDTH, DEFAULT_PEER_HEIGHT};
}

std::string edgeToString(Edge edge) {
    switch (edge) {
        case Edge::Left: return "left";
        case Edge::Right: return "right";
        case Edge::Top: return "top";
        case Edge::Bottom: return "bottom";
    }
    return "unknown";
}

std::optional<Edge> edgeFromString(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "left") return Edge::Left;
    if (lower == "right") return Edge::Right;
    if (lower == "top") return Edge::Top;
    if (lower == "bottom") return Edge::Bottom;
    return std::nullopt;
}

std::string boundsToString(const Bounds& bounds) {
    return "(" + std::to_string(bounds.minX) + "," + std::to_string(bounds.minY) + ")-(" +
           std::to_string(bounds.maxX) + "," + std::to_string(bounds.maxY) + ")";
}

}
