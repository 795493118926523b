#include <gtest/gtest.h>

#include "core/ScreenGeometry.h"

#include <limits>

using namespace EdgeShare::Core;

namespace
{
    ScreenLayout TwoSideBySide()
    {
        return {
            ScreenRect{0, 0, 1920, 1080, true},
            ScreenRect{1920, 0, 1920, 1080, false}
        };
    }
}

TEST(ScreenGeometry, CombinedBoundsOfTwoMonitors)
{
    Bounds b = computeCombinedBounds(TwoSideBySide());
    EXPECT_EQ(b, (Bounds{0, 0, 3840, 1080}));
    EXPECT_EQ(b.width(), 3840);
    EXPECT_EQ(b.height(), 1080);
}

TEST(ScreenGeometry, CombinedBoundsIsTightBoxForOffsetScreens)
{
    ScreenLayout layout{
        ScreenRect{-1280, 200, 1280, 1024, false},
        ScreenRect{0, 0, 2560, 1440, true},
        ScreenRect{2560, -300, 1080, 1920, false}
    };
    Bounds b = computeCombinedBounds(layout);
    EXPECT_EQ(b.minX, -1280);
    EXPECT_EQ(b.minY, -300);
    EXPECT_EQ(b.maxX, 3640);
    EXPECT_EQ(b.maxY, 1620);
}

TEST(ScreenGeometry, OutOfRangeRectsAreLeftOutOfBounds)
{
    ScreenRect farAway{2147483000, 0, 2000, 1080, false};
    EXPECT_FALSE(isPlausibleRect(farAway));
    EXPECT_FALSE(isPlausibleRect(ScreenRect{0, 0, -5, 1080, false}));
    EXPECT_FALSE(isPlausibleRect(ScreenRect{0, std::numeric_limits<int32_t>::min(), 10, 10, false}));
    EXPECT_TRUE(isPlausibleRect(ScreenRect{-MAX_COORDINATE, 0, MAX_COORDINATE, 1080, false}));

    Bounds alone = computeCombinedBounds({farAway});
    EXPECT_FALSE(alone.hasArea());
    EXPECT_EQ(alone, Bounds{});

    ScreenLayout layout = TwoSideBySide();
    layout.push_back(farAway);
    EXPECT_EQ(computeCombinedBounds(layout), (Bounds{0, 0, 3840, 1080}));
}

TEST(ScreenGeometry, WidestAcceptedLayoutKeepsPositiveExtent)
{
    ScreenLayout layout{
        ScreenRect{-MAX_COORDINATE, -MAX_COORDINATE, 1920, 1080, false},
        ScreenRect{MAX_COORDINATE, MAX_COORDINATE, MAX_COORDINATE, MAX_COORDINATE, true}
    };
    Bounds b = computeCombinedBounds(layout);
    EXPECT_TRUE(b.hasArea());
    EXPECT_EQ(b.width(), 3 * MAX_COORDINATE);
    EXPECT_EQ(b.height(), 3 * MAX_COORDINATE);
}

TEST(ScreenGeometry, EmptyLayoutGivesZeroRectangle)
{
    Bounds b = computeCombinedBounds({});
    EXPECT_EQ(b, Bounds{});
    EXPECT_FALSE(b.hasArea());
}

TEST(ScreenGeometry, PointNearRightEdgeIsRight)
{
    Bounds b = computeCombinedBounds(TwoSideBySide());
    auto edge = classifyEdge(Point{3838, 500}, b, 2);
    ASSERT_TRUE(edge.has_value());
    EXPECT_EQ(*edge, Edge::Right);
}

TEST(ScreenGeometry, ThresholdBoundaryOnLeft)
{
    Bounds b{0, 0, 1920, 1080};

    auto atMin = classifyEdge(Point{0, 500}, b, 0);
    ASSERT_TRUE(atMin.has_value());
    EXPECT_EQ(*atMin, Edge::Left);

    EXPECT_EQ(classifyEdge(Point{5, 500}, b, 5), Edge::Left);
    EXPECT_FALSE(classifyEdge(Point{6, 500}, b, 5).has_value());
}

TEST(ScreenGeometry, CornerPrefersHorizontalEdges)
{
    Bounds b{0, 0, 1920, 1080};
    EXPECT_EQ(classifyEdge(Point{0, 0}, b, 2), Edge::Left);
    EXPECT_EQ(classifyEdge(Point{1919, 1079}, b, 2), Edge::Right);
    EXPECT_EQ(classifyEdge(Point{900, 1}, b, 2), Edge::Top);
    EXPECT_EQ(classifyEdge(Point{900, 1078}, b, 2), Edge::Bottom);
    EXPECT_FALSE(classifyEdge(Point{900, 500}, b, 2).has_value());
}

TEST(ScreenGeometry, ZeroAreaNeverClassifies)
{
    EXPECT_FALSE(classifyEdge(Point{0, 0}, Bounds{}, 10).has_value());
    EXPECT_FALSE(classifyEdge(Point{0, 0}, Bounds{0, 0, 100, 0}, 10).has_value());
}

TEST(ScreenGeometry, EntryPointKeepsRelativePosition)
{
    Bounds local{0, 0, 3840, 1080};
    Bounds peer{0, 0, 1920, 2160};

    Point p = entryPoint(Edge::Right, Point{3841, 540}, local, peer);
    EXPECT_EQ(p.x, ENTRY_INSET);
    EXPECT_NEAR(p.y, 1079, 1);

    Point q = entryPoint(Edge::Left, Point{-2, 0}, local, peer);
    EXPECT_EQ(q.x, 1919 - ENTRY_INSET);
    EXPECT_EQ(q.y, 0);
}

TEST(ScreenGeometry, EntryPointIsClampedIntoPeer)
{
    Point p = entryPoint(Edge::Bottom, Point{5000, 1100}, Bounds{0, 0, 1920, 1080}, Bounds{0, 0, 40, 30});
    EXPECT_GE(p.x, 0);
    EXPECT_LT(p.x, 40);
    EXPECT_GE(p.y, 0);
    EXPECT_LT(p.y, 30);
}

TEST(ScreenGeometry, EdgeNamesRoundTrip)
{
    for (Edge e : {Edge::Left, Edge::Right, Edge::Top, Edge::Bottom}) {
        EXPECT_EQ(edgeFromString(edgeToString(e)), e);
        EXPECT_EQ(oppositeEdge(oppositeEdge(e)), e);
    }
    EXPECT_EQ(edgeFromString("RIGHT"), Edge::Right);
    EXPECT_FALSE(edgeFromString("north").has_value());
}
