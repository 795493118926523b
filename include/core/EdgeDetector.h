#pragma once

#include "core/ScreenGeometry.h"

#include <asio.hpp>
#include <chrono>
#include <functional>
#include <optional>

namespace EdgeShare::Core {

struct EdgeHit {
    Edge edge = Edge::Right;
    Point position;
    Bounds bounds;
};

// Debounce state for one configured edge. A hit needs REQUIRED_HITS
// consecutive samples that are on the edge and strictly farther toward it
// than the sample before.
class EdgeDebouncer {
public:
    static constexpr int REQUIRED_HITS = 3;

    EdgeDebouncer(Edge edge, int32_t threshold, int requiredHits = REQUIRED_HITS);

    std::optional<EdgeHit> sample(const Point& point, const Bounds& bounds);
    void reset();

    void setEdge(Edge edge);
    void setThreshold(int32_t threshold) { threshold_ = threshold; }

    Edge edge() const { return edge_; }
    int32_t threshold() const { return threshold_; }
    int consecutiveHits() const { return consecutiveHits_; }
    bool hasLastSample() const { return hasLastSample_; }
    const Point& lastSample() const { return lastSample_; }

private:
    bool movingOutward(const Point& point) const;

    Edge edge_;
    int32_t threshold_;
    int requiredHits_;
    int consecutiveHits_ = 0;
    Point lastSample_;
    bool hasLastSample_ = false;
};

class EdgeDetector {
public:
    using CursorSource = std::function<std::optional<Point>()>;
    using EdgeHitHandler = std::function<void(const EdgeHit&)>;

    EdgeDetector(asio::io_context& io_context, Edge edge, int32_t threshold,
                 std::chrono::milliseconds pollInterval = std::chrono::milliseconds(16));
    ~EdgeDetector();

    EdgeDetector(const EdgeDetector&) = delete;
    EdgeDetector& operator=(const EdgeDetector&) = delete;

    void setCursorSource(CursorSource source) { cursorSource_ = std::move(source); }
    void setEdgeHitHandler(EdgeHitHandler handler) { edgeHitHandler_ = std::move(handler); }

    void start();
    void stop();

    // Must be called on the io_context thread.
    void setEnabled(bool enabled);
    bool isEnabled() const { return enabled_; }

    void setBounds(const Bounds& bounds) { bounds_ = bounds; }
    const Bounds& bounds() const { return bounds_; }

    void setEdge(Edge edge);
    Edge edge() const { return debouncer_.edge(); }

    // One poll step; the timer calls this, tests may call it directly.
    void poll();

    const EdgeDebouncer& debouncer() const { return debouncer_; }

private:
    void schedule();

    asio::steady_timer timer_;
    std::chrono::milliseconds pollInterval_;
    EdgeDebouncer debouncer_;
    Bounds bounds_;
    bool running_ = false;
    bool enabled_ = false;

    CursorSource cursorSource_;
    EdgeHitHandler edgeHitHandler_;
};

}
