#include "core/EdgeDetector.h"
#include "utils/Logger.h"

namespace EdgeShare::Core {

EdgeDebouncer::EdgeDebouncer(Edge edge, int32_t threshold, int requiredHits)
    : edge_(edge), threshold_(threshold), requiredHits_(requiredHits > 0 ? requiredHits : 1) {}

bool EdgeDebouncer::movingOutward(const Point& point) const {
    // Nothing to compare against yet: the sample can only be judged by position.
    if (!hasLastSample_) {
        return true;
    }
    switch (edge_) {
        case Edge::Left: return point.x < lastSample_.x;
        case Edge::Right: return point.x > lastSample_.x;
        case Edge::Top: return point.y < lastSample_.y;
        case Edge::Bottom: return point.y > lastSample_.y;
    }
    return false;
}

std::optional<EdgeHit> EdgeDebouncer::sample(const Point& point, const Bounds& bounds) {
    std::optional<Edge> classified = classifyEdge(point, bounds, threshold_);
    bool onEdge = classified.has_value() && *classified == edge_;
    bool outward = movingOutward(point);

    lastSample_ = point;
    hasLastSample_ = true;

    if (!onEdge || !outward) {
        consecutiveHits_ = 0;
        return std::nullopt;
    }

    consecutiveHits_++;
    if (consecutiveHits_ < requiredHits_) {
        return std::nullopt;
    }

    consecutiveHits_ = 0;
    return EdgeHit{edge_, point, bounds};
}

void EdgeDebouncer::reset() {
    consecutiveHits_ = 0;
    hasLastSample_ = false;
    lastSample_ = Point{};
}

void EdgeDebouncer::setEdge(Edge edge) {
    if (edge != edge_) {
        edge_ = edge;
        reset();
    }
}

EdgeDetector::EdgeDetector(asio::io_context& io_context, Edge edge, int32_t threshold,
                           std::chrono::milliseconds pollInterval)
    : timer_(io_context),
      pollInterval_(pollInterval),
      debouncer_(edge, threshold) {}

EdgeDetector::~EdgeDetector() {
    stop();
}

void EdgeDetector::start() {
    if (running_) {
        return;
    }
    running_ = true;
    Utils::Logger::GetInstance().Info("EdgeDetector: Watching " + edgeToString(debouncer_.edge()) +
                                      " edge every " + std::to_string(pollInterval_.count()) + "ms");
    schedule();
}

void EdgeDetector::stop() {
    if (!running_) {
        return;
    }
    running_ = false;
    timer_.cancel();
}

void EdgeDetector::setEnabled(bool enabled) {
    if (enabled_ == enabled) {
        return;
    }
    enabled_ = enabled;
    debouncer_.reset();
    Utils::Logger::GetInstance().Debug(std::string("EdgeDetector: ") + (enabled ? "enabled" : "disabled"));
}

void EdgeDetector::setEdge(Edge edge) {
    debouncer_.setEdge(edge);
}

void EdgeDetector::schedule() {
    if (!running_) {
        return;
    }
    timer_.expires_after(pollInterval_);
    timer_.async_wait([this](const std::error_code& ec) {
        if (ec == asio::error::operation_aborted || !running_) {
            return;
        }
        poll();
        schedule();
    });
}

void EdgeDetector::poll() {
    if (!enabled_ || !cursorSource_) {
        return;
    }
    std::optional<Point> cursor = cursorSource_();
    if (!cursor) {
        return;
    }
    std::optional<EdgeHit> hit = debouncer_.sample(*cursor, bounds_);
    if (hit) {
        Utils::Logger::GetInstance().Info("EdgeDetector: Edge hit " + edgeToString(hit->edge) + " at (" +
                                          std::to_string(hit->position.x) + "," + std::to_string(hit->position.y) + ")");
        if (edgeHitHandler_) {
            edgeHitHandler_(*hit);
        }
    }
}

}
