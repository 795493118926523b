#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace EdgeShare::Core {

struct Point {
    int32_t x = 0;
    int32_t y = 0;

    bool operator==(const Point& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Point& other) const { return !(*this == other); }
};

struct ScreenRect {
    int32_t x = 0;
    int32_t y = 0;
    int32_t width = 0;
    int32_t height = 0;
    bool isPrimary = false;

    bool operator==(const ScreenRect& other) const {
        return x == other.x && y == other.y && width == other.width &&
               height == other.height && isPrimary == other.isPrimary;
    }
    bool operator!=(const ScreenRect& other) const { return !(*this == other); }
};

using ScreenLayout = std::vector<ScreenRect>;

struct Bounds {
    int32_t minX = 0;
    int32_t minY = 0;
    int32_t maxX = 0;
    int32_t maxY = 0;

    int32_t width() const { return maxX - minX; }
    int32_t height() const { return maxY - minY; }
    bool hasArea() const { return width() > 0 && height() > 0; }

    bool operator==(const Bounds& other) const {
        return minX == other.minX && minY == other.minY && maxX == other.maxX && maxY == other.maxY;
    }
    bool operator!=(const Bounds& other) const { return !(*this == other); }
};

enum class Edge {
    Left,
    Right,
    Top,
    Bottom
};

// Inset applied when a cursor enters a screen from an edge, so it does not
// land back on the edge it crossed.
constexpr int32_t ENTRY_INSET = 50;

// Bounds used for a peer that has not reported its screens yet.
constexpr int32_t DEFAULT_PEER_WIDTH = 1920;
constexpr int32_t DEFAULT_PEER_HEIGHT = 1080;

// Largest coordinate or extent accepted for a screen. Keeps every far edge and
// every bounds width well inside int32.
constexpr int32_t MAX_COORDINATE = 1 << 24;

bool isPlausibleRect(const ScreenRect& rect);

// Rects failing isPlausibleRect() are left out.
Bounds computeCombinedBounds(const ScreenLayout& rects);

// left/right are tested before top/bottom; the first match wins.
std::optional<Edge> classifyEdge(const Point& point, const Bounds& bounds, int32_t threshold);

Edge oppositeEdge(Edge edge);

Point clampToBounds(const Point& point, const Bounds& bounds);

// Maps the position where the cursor left `local` through `exitEdge` onto the
// opposite edge of `peer`, keeping the relative offset along that edge.
Point entryPoint(Edge exitEdge, const Point& exitPoint, const Bounds& local, const Bounds& peer,
                 int32_t inset = ENTRY_INSET);

Bounds defaultPeerBounds();

std::string edgeToString(Edge edge);
std::optional<Edge> edgeFromString(const std::string& name);
std::string boundsToString(const Bounds& bounds);

}
