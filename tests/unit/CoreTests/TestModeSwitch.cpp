#include <gtest/gtest.h>

#include "core/ModeSwitch.h"

#include <deque>
#include <memory>
#include <optional>
#include <random>
#include <vector>

using namespace EdgeShare;
using namespace EdgeShare::Core;

namespace
{
    const Bounds kHostDesktop{0, 0, 3840, 1080};
    const Bounds kClientDesktop{0, 0, 1920, 1080};

    // One machine of a pair, with its outgoing FIFO channel.
    struct Machine
    {
        Machine(asio::io_context& io, Edge edge, ConflictPolicy policy, const Bounds& local, const Bounds& peer)
            : modeSwitch(io, edge, policy, std::chrono::milliseconds(0))
        {
            modeSwitch.setLocalBounds(local);
            modeSwitch.setPeerBounds(peer);
            modeSwitch.setSendHandler([this](const Network::ModeSwitch& m) { outbox.push_back(m); });
            modeSwitch.setForwardingHandler([this](bool on, const Point& start) {
                forwarding = on;
                if (on) forwardStart = start;
            });
            modeSwitch.setWarpHandler([this](const Point& p) { warps.push_back(p); });
            modeSwitch.setRemoteCursorSource([]() -> std::optional<Point> { return Point{5, 300}; });
            modeSwitch.setModeChangedHandler([this](const ModeState& s) { history.push_back(s); });
            modeSwitch.setConnected(true);
        }

        EdgeHit HitFor(Edge edge, const Bounds& bounds) const
        {
            Point p{bounds.width() / 2, bounds.height() / 2};
            if (edge == Edge::Right) p.x = bounds.maxX + 1;
            if (edge == Edge::Left) p.x = bounds.minX - 1;
            if (edge == Edge::Top) p.y = bounds.minY - 1;
            if (edge == Edge::Bottom) p.y = bounds.maxY + 1;
            return EdgeHit{edge, p, bounds};
        }

        ModeSwitch modeSwitch;
        std::deque<Network::ModeSwitch> outbox;
        std::vector<ModeState> history;
        std::vector<Point> warps;
        bool forwarding = false;
        Point forwardStart;
    };

    bool Deliver(Machine& from, Machine& to)
    {
        if (from.outbox.empty()) return false;
        Network::ModeSwitch m = from.outbox.front();
        from.outbox.pop_front();
        to.modeSwitch.onPeerModeSwitch(m);
        return true;
    }

    struct Pair
    {
        Pair()
            : host(io, Edge::Right, ConflictPolicy::KeepClaim, kHostDesktop, kClientDesktop),
              client(io, Edge::Left, ConflictPolicy::Yield, kClientDesktop, kHostDesktop)
        {}

        asio::io_context io;
        Machine host;
        Machine client;
    };
}

TEST(ModeSwitch, EdgeHitClaimsAndAckGrantsControl)
{
    Pair pair;
    Machine& host = pair.host;
    Machine& client = pair.client;

    host.modeSwitch.onEdgeHit(host.HitFor(Edge::Right, kHostDesktop));
    EXPECT_EQ(host.modeSwitch.state().phase, ModePhase::SwitchPending);
    ASSERT_EQ(host.outbox.size(), 1u);
    EXPECT_TRUE(host.outbox.front().active);
    EXPECT_FALSE(host.outbox.front().ack);
    ASSERT_TRUE(host.outbox.front().x.has_value());
    EXPECT_EQ(*host.outbox.front().x, ENTRY_INSET);

    ASSERT_TRUE(Deliver(host, client));
    EXPECT_TRUE(client.modeSwitch.state().suppressLocalInput);
    EXPECT_FALSE(client.modeSwitch.state().remoteHasControl);
    ASSERT_EQ(client.warps.size(), 1u);
    EXPECT_EQ(client.warps[0].x, ENTRY_INSET);
    ASSERT_EQ(client.outbox.size(), 1u);
    EXPECT_TRUE(client.outbox.front().ack);

    ASSERT_TRUE(Deliver(client, host));
    EXPECT_EQ(host.modeSwitch.state().phase, ModePhase::RemoteActive);
    EXPECT_TRUE(host.modeSwitch.state().remoteHasControl);
    EXPECT_TRUE(host.forwarding);
    EXPECT_EQ(host.forwardStart.x, ENTRY_INSET);
}

TEST(ModeSwitch, EdgeHitIgnoredWhenDisconnectedOrOtherEdge)
{
    Pair pair;
    pair.host.modeSwitch.onEdgeHit(pair.host.HitFor(Edge::Left, kHostDesktop));
    EXPECT_TRUE(pair.host.outbox.empty());

    pair.host.modeSwitch.setConnected(false);
    pair.host.modeSwitch.onEdgeHit(pair.host.HitFor(Edge::Right, kHostDesktop));
    EXPECT_TRUE(pair.host.outbox.empty());
    EXPECT_EQ(pair.host.modeSwitch.state(), ModeState{});
}

TEST(ModeSwitch, PendingClaimExpiresWithoutAck)
{
    Pair pair;
    pair.host.modeSwitch.onEdgeHit(pair.host.HitFor(Edge::Right, kHostDesktop));
    EXPECT_EQ(pair.host.modeSwitch.state().phase, ModePhase::SwitchPending);

    pair.io.poll();
    EXPECT_EQ(pair.host.modeSwitch.state().phase, ModePhase::LocalActive);
    EXPECT_FALSE(pair.host.forwarding);
}

TEST(ModeSwitch, StaleAckIsAnsweredWithRelease)
{
    Pair pair;
    pair.host.modeSwitch.onEdgeHit(pair.host.HitFor(Edge::Right, kHostDesktop));
    Deliver(pair.host, pair.client);
    pair.io.poll();
    ASSERT_EQ(pair.host.modeSwitch.state().phase, ModePhase::LocalActive);

    Deliver(pair.client, pair.host);
    EXPECT_FALSE(pair.host.modeSwitch.state().remoteHasControl);
    ASSERT_EQ(pair.host.outbox.size(), 1u);
    EXPECT_FALSE(pair.host.outbox.front().active);

    Deliver(pair.host, pair.client);
    EXPECT_FALSE(pair.client.modeSwitch.state().suppressLocalInput);
}

TEST(ModeSwitch, HotkeyReturnsControlAndWarpsBack)
{
    Pair pair;
    pair.host.modeSwitch.onEdgeHit(pair.host.HitFor(Edge::Right, kHostDesktop));
    Deliver(pair.host, pair.client);
    Deliver(pair.client, pair.host);
    ASSERT_TRUE(pair.host.modeSwitch.state().remoteHasControl);

    pair.host.modeSwitch.onEscapeHotkey();
    EXPECT_EQ(pair.host.modeSwitch.state(), ModeState{});
    EXPECT_FALSE(pair.host.forwarding);
    ASSERT_FALSE(pair.host.warps.empty());
    EXPECT_EQ(pair.host.warps.back().x, kHostDesktop.maxX - 1 - ENTRY_INSET);

    ASSERT_EQ(pair.host.outbox.size(), 1u);
    EXPECT_FALSE(pair.host.outbox.front().active);
    Deliver(pair.host, pair.client);
    EXPECT_FALSE(pair.client.modeSwitch.state().suppressLocalInput);
}

TEST(ModeSwitch, DrivenMachineReclaimsWithHotkey)
{
    Pair pair;
    pair.host.modeSwitch.onEdgeHit(pair.host.HitFor(Edge::Right, kHostDesktop));
    Deliver(pair.host, pair.client);
    Deliver(pair.client, pair.host);

    pair.client.modeSwitch.onEscapeHotkey();
    EXPECT_FALSE(pair.client.modeSwitch.state().suppressLocalInput);
    ASSERT_EQ(pair.client.outbox.size(), 1u);

    Deliver(pair.client, pair.host);
    EXPECT_EQ(pair.host.modeSwitch.state().phase, ModePhase::LocalActive);
    EXPECT_FALSE(pair.host.forwarding);
    EXPECT_TRUE(pair.host.outbox.empty());
}

TEST(ModeSwitch, RemoteCursorReturnEndsForwarding)
{
    Pair pair;
    pair.host.modeSwitch.onEdgeHit(pair.host.HitFor(Edge::Right, kHostDesktop));
    Deliver(pair.host, pair.client);
    Deliver(pair.client, pair.host);

    pair.host.modeSwitch.onRemoteCursorReturned(Point{0, 540});
    EXPECT_EQ(pair.host.modeSwitch.state().phase, ModePhase::LocalActive);
    ASSERT_EQ(pair.host.outbox.size(), 1u);
    EXPECT_FALSE(pair.host.outbox.front().active);
}

TEST(ModeSwitch, SimultaneousClaimsHostKeepsClientYields)
{
    Pair pair;
    pair.host.modeSwitch.onEdgeHit(pair.host.HitFor(Edge::Right, kHostDesktop));
    pair.client.modeSwitch.onEdgeHit(pair.client.HitFor(Edge::Left, kClientDesktop));
    ASSERT_EQ(pair.client.modeSwitch.state().phase, ModePhase::SwitchPending);

    Deliver(pair.client, pair.host);
    EXPECT_EQ(pair.host.modeSwitch.state().phase, ModePhase::SwitchPending);
    EXPECT_FALSE(pair.host.modeSwitch.state().suppressLocalInput);

    Deliver(pair.host, pair.client);
    EXPECT_EQ(pair.client.modeSwitch.state().phase, ModePhase::LocalActive);
    EXPECT_TRUE(pair.client.modeSwitch.state().suppressLocalInput);

    Deliver(pair.client, pair.host);
    EXPECT_TRUE(pair.host.modeSwitch.state().remoteHasControl);
    EXPECT_FALSE(pair.client.modeSwitch.state().remoteHasControl);
}

TEST(ModeSwitch, DisconnectForcesLocalControl)
{
    Pair pair;
    pair.host.modeSwitch.onEdgeHit(pair.host.HitFor(Edge::Right, kHostDesktop));
    Deliver(pair.host, pair.client);
    Deliver(pair.client, pair.host);

    pair.host.modeSwitch.setConnected(false);
    pair.client.modeSwitch.setConnected(false);
    EXPECT_EQ(pair.host.modeSwitch.state(), ModeState{});
    EXPECT_EQ(pair.client.modeSwitch.state(), ModeState{});
    EXPECT_FALSE(pair.host.forwarding);
}

TEST(ModeSwitch, AtMostOneControllerUnderRandomInterleavings)
{
    std::mt19937 rng(20240611);
    std::uniform_int_distribution<int> pick(0, 8);

    for (int run = 0; run < 500; ++run) {
        Pair pair;
        Machine& host = pair.host;
        Machine& client = pair.client;

        for (int step = 0; step < 40; ++step) {
            switch (pick(rng)) {
                case 0: host.modeSwitch.onEdgeHit(host.HitFor(Edge::Right, kHostDesktop)); break;
                case 1: client.modeSwitch.onEdgeHit(client.HitFor(Edge::Left, kClientDesktop)); break;
                case 2: host.modeSwitch.onEscapeHotkey(); break;
                case 3: client.modeSwitch.onEscapeHotkey(); break;
                case 4: case 5: Deliver(host, client); break;
                case 6: case 7: Deliver(client, host); break;
                case 8: pair.io.poll(); pair.io.restart(); break;
            }
            ASSERT_FALSE(host.modeSwitch.state().remoteHasControl && client.modeSwitch.state().remoteHasControl)
                << "run " << run << " step " << step;
            ASSERT_FALSE(host.modeSwitch.state().remoteHasControl && host.modeSwitch.state().suppressLocalInput);
            ASSERT_FALSE(client.modeSwitch.state().remoteHasControl && client.modeSwitch.state().suppressLocalInput);
        }
    }
}
