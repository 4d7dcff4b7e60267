#include <gtest/gtest.h>
#include "tacmesh/Protocol.hpp"
#include "tacmesh/SimulatedNetwork.hpp"

#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace tacmesh;

class SimulatedNetworkTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char* id : {"A", "B", "C"}) {
            transports.emplace(id, &net.attach(id));
            std::string self = id;
            net.setHandler(id, [this, self](const std::string& from, const Frame& frame) {
                received.push_back({from + "->" + self, frame});
                if (self == "B" && frame.type == FrameType::HELLO) {
                    transports.at("B")->send("C", makeFrame(FrameType::HEARTBEAT, {}));
                }
            });
        }
    }

    SimulatedNetwork net;
    std::map<std::string, Transport*> transports;
    std::vector<std::pair<std::string, Frame>> received;
};

TEST_F(SimulatedNetworkTest, SendRequiresLink) {
    EXPECT_FALSE(transports["A"]->send("B", makeFrame(FrameType::HEARTBEAT, {})));
    EXPECT_FALSE(transports["A"]->send("Z", makeFrame(FrameType::HEARTBEAT, {})));

    net.connect("A", "B");
    EXPECT_TRUE(net.linked("B", "A"));
    EXPECT_TRUE(transports["A"]->send("B", makeFrame(FrameType::MESH_MESSAGE, {1, 2})));
    EXPECT_EQ(net.pending(), 1u);

    EXPECT_EQ(net.pump(), 1u);
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0].first, "A->B");
    EXPECT_EQ(received[0].second.type, FrameType::MESH_MESSAGE);
    EXPECT_EQ(received[0].second.payload, (std::vector<uint8_t>{1, 2}));
}

TEST_F(SimulatedNetworkTest, FramesSentDuringRoundWaitForNextRound) {
    net.connect("A", "B");
    net.connect("B", "C");

    ASSERT_TRUE(transports["A"]->send("B", makeFrame(FrameType::HELLO, {})));
    EXPECT_EQ(net.pump(), 1u);
    EXPECT_EQ(received.size(), 1u);
    EXPECT_EQ(net.pending(), 1u);

    EXPECT_EQ(net.pumpUntilIdle(), 1u);
    ASSERT_EQ(received.size(), 2u);
    EXPECT_EQ(received[1].first, "B->C");
}

TEST_F(SimulatedNetworkTest, CutLinkDropsFramesInFlight) {
    net.connect("A", "B");
    ASSERT_TRUE(transports["A"]->send("B", makeFrame(FrameType::HEARTBEAT, {})));
    net.disconnect("A", "B");

    EXPECT_EQ(net.pump(), 0u);
    EXPECT_TRUE(received.empty());
    EXPECT_EQ(net.framesDropped(), 1u);
    EXPECT_EQ(net.framesDelivered(), 0u);
}

TEST_F(SimulatedNetworkTest, IsolateRemovesEveryLink) {
    net.connect("A", "B");
    net.connect("A", "C");
    net.connect("B", "C");

    net.isolate("A");
    EXPECT_TRUE(net.neighbours("A").empty());
    EXPECT_EQ(net.neighbours("B"), (std::vector<std::string>{"C"}));
}

TEST_F(SimulatedNetworkTest, DuplicateDeliverySendsTwice) {
    net.connect("A", "C");
    net.setDuplicateDelivery(true);

    ASSERT_TRUE(transports["A"]->send("C", makeFrame(FrameType::HEARTBEAT, {})));
    EXPECT_EQ(net.pumpUntilIdle(), 2u);
    EXPECT_EQ(received.size(), 2u);
}

TEST_F(SimulatedNetworkTest, RejectsBadTopology) {
    EXPECT_THROW(net.connect("A", "A"), std::invalid_argument);
    EXPECT_THROW(net.attach("A"), std::invalid_argument);
    EXPECT_THROW(net.setHandler("Z", [](const std::string&, const Frame&) {}), std::invalid_argument);
}
