#include <gtest/gtest.h>

#include "core/EdgeDetector.h"

#include <deque>
#include <vector>

using namespace EdgeShare::Core;

namespace
{
    const Bounds kDesktop{0, 0, 3840, 1080};
}

TEST(EdgeDebouncer, TwoOutwardSamplesDoNotFire)
{
    EdgeDebouncer d(Edge::Right, 2);
    EXPECT_FALSE(d.sample(Point{3839, 500}, kDesktop));
    EXPECT_FALSE(d.sample(Point{3840, 500}, kDesktop));
    EXPECT_EQ(d.consecutiveHits(), 2);
}

TEST(EdgeDebouncer, ThirdOutwardSampleFiresOnce)
{
    EdgeDebouncer d(Edge::Right, 2);
    EXPECT_FALSE(d.sample(Point{3839, 500}, kDesktop));
    EXPECT_FALSE(d.sample(Point{3840, 500}, kDesktop));

    auto hit = d.sample(Point{3841, 500}, kDesktop);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->edge, Edge::Right);
    EXPECT_EQ(hit->position, (Point{3841, 500}));
    EXPECT_EQ(hit->bounds, kDesktop);

    EXPECT_FALSE(d.sample(Point{3842, 500}, kDesktop));
    EXPECT_EQ(d.consecutiveHits(), 1);
}

TEST(EdgeDebouncer, StationaryCursorResetsCount)
{
    EdgeDebouncer d(Edge::Right, 2);
    EXPECT_FALSE(d.sample(Point{3839, 500}, kDesktop));
    EXPECT_FALSE(d.sample(Point{3840, 500}, kDesktop));
    EXPECT_FALSE(d.sample(Point{3840, 500}, kDesktop));
    EXPECT_EQ(d.consecutiveHits(), 0);
}

TEST(EdgeDebouncer, OtherEdgeDoesNotCount)
{
    EdgeDebouncer d(Edge::Right, 2);
    EXPECT_FALSE(d.sample(Point{2, 500}, kDesktop));
    EXPECT_FALSE(d.sample(Point{1, 500}, kDesktop));
    EXPECT_FALSE(d.sample(Point{0, 500}, kDesktop));
    EXPECT_EQ(d.consecutiveHits(), 0);
}

TEST(EdgeDebouncer, LeavingTheEdgeResets)
{
    EdgeDebouncer d(Edge::Left, 2);
    EXPECT_FALSE(d.sample(Point{2, 10}, kDesktop));
    EXPECT_FALSE(d.sample(Point{1, 10}, kDesktop));
    EXPECT_FALSE(d.sample(Point{400, 10}, kDesktop));
    EXPECT_FALSE(d.sample(Point{2, 10}, kDesktop));
    EXPECT_FALSE(d.sample(Point{1, 10}, kDesktop));
    EXPECT_TRUE(d.sample(Point{0, 10}, kDesktop).has_value());
}

TEST(EdgeDebouncer, ChangingEdgeResetsHistory)
{
    EdgeDebouncer d(Edge::Right, 2);
    d.sample(Point{3839, 500}, kDesktop);
    d.sample(Point{3840, 500}, kDesktop);
    d.setEdge(Edge::Bottom);
    EXPECT_EQ(d.consecutiveHits(), 0);
    EXPECT_FALSE(d.hasLastSample());
}

TEST(EdgeDetector, PollDrivesDebouncerFromCursorSource)
{
    asio::io_context io;
    EdgeDetector detector(io, Edge::Right, 2);
    detector.setBounds(kDesktop);

    std::deque<Point> samples{{3839, 500}, {3840, 500}, {3841, 500}, {3842, 500}};
    detector.setCursorSource([&]() -> std::optional<Point> {
        if (samples.empty()) return std::nullopt;
        Point p = samples.front();
        samples.pop_front();
        return p;
    });

    std::vector<EdgeHit> hits;
    detector.setEdgeHitHandler([&](const EdgeHit& hit) { hits.push_back(hit); });
    detector.setEnabled(true);

    for (int i = 0; i < 4; ++i) {
        detector.poll();
    }
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].position.x, 3841);
}

TEST(EdgeDetector, DisabledDetectorIgnoresCursor)
{
    asio::io_context io;
    EdgeDetector detector(io, Edge::Right, 2);
    detector.setBounds(kDesktop);

    int x = 3838;
    int reads = 0;
    detector.setCursorSource([&]() -> std::optional<Point> {
        ++reads;
        return Point{++x, 500};
    });
    int hits = 0;
    detector.setEdgeHitHandler([&](const EdgeHit&) { ++hits; });

    for (int i = 0; i < 5; ++i) {
        detector.poll();
    }
    EXPECT_EQ(reads, 0);
    EXPECT_EQ(hits, 0);
}

TEST(EdgeDetector, TimerPollsWhileRunning)
{
    asio::io_context io;
    EdgeDetector detector(io, Edge::Right, 2, std::chrono::milliseconds(1));
    detector.setBounds(kDesktop);

    int x = 3838;
    detector.setCursorSource([&]() -> std::optional<Point> { return Point{++x, 500}; });
    int hits = 0;
    detector.setEdgeHitHandler([&](const EdgeHit&) {
        ++hits;
        detector.stop();
    });
    detector.setEnabled(true);
    detector.start();

    io.run_for(std::chrono::seconds(2));
    EXPECT_EQ(hits, 1);
}
