#include <gtest/gtest.h>
#include "tacmesh/CryptoBase.hpp"
#include "tacmesh/NodeAgent.hpp"
#include "tacmesh/Signer.hpp"
#include "tacmesh/SimulatedNetwork.hpp"

#include <algorithm>
#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

using namespace tacmesh;
using namespace std::chrono_literals;

// ============================================================================
// FIXTURE: agents over a simulated radio network, driven by explicit time
// ============================================================================

class NodeAgentTest : public ::testing::Test {
protected:
    struct Member {
        std::unique_ptr<Ed25519Signer> signer;
        std::unique_ptr<NodeAgent> agent;
        std::vector<NodeEvent> events;
    };

    void SetUp() override {
        ASSERT_TRUE(CryptoBase::initialize()) << "Failed to initialize libsodium";
    }

    NodeConfig configFor(const std::string& id, const std::string& networkId = "net-1") {
        NodeConfig config;
        config.nodeId = id;
        config.networkId = networkId;
        config.authorityId = "HQ";
        return config;
    }

    NodeAgent& add(const NodeConfig& config) {
        auto member = std::make_unique<Member>();
        member->signer = std::make_unique<Ed25519Signer>(config.nodeId, ring);
        member->agent = std::make_unique<NodeAgent>(config, net.attach(config.nodeId), *member->signer);

        Member* raw = member.get();
        raw->agent->setEventHandler([raw](const NodeEvent& event) { raw->events.push_back(event); });
        net.setHandler(config.nodeId, [this, raw](const std::string& from, const Frame& frame) {
            raw->agent->onFrame(from, frame, now);
        });

        members[config.nodeId] = std::move(member);
        return *members[config.nodeId]->agent;
    }

    NodeAgent& add(const std::string& id) { return add(configFor(id)); }

    NodeAgent& agent(const std::string& id) { return *members.at(id)->agent; }
    std::vector<NodeEvent>& events(const std::string& id) { return members.at(id)->events; }

    void link(const std::string& a, const std::string& b) {
        net.connect(a, b);
        agent(a).addNeighbour(b);
        agent(b).addNeighbour(a);
        agent(a).onLinkUp(b, now);
        agent(b).onLinkUp(a, now);
    }

    void startAll() {
        for (auto& kv : members) kv.second->agent->start(now);
        net.pumpUntilIdle();
    }

    void advanceTo(SteadyTime target, Millis step = 5s) {
        while (now < target) {
            now += step;
            for (auto& kv : members) kv.second->agent->tick(now);
            net.pumpUntilIdle();
        }
    }

    size_t count(const std::string& id, EventKind kind, const std::string& messageId = "") {
        const auto& list = events(id);
        return static_cast<size_t>(std::count_if(list.begin(), list.end(), [&](const NodeEvent& e) {
            return e.kind == kind && (messageId.empty() || e.messageId == messageId);
        }));
    }

    std::vector<std::string> details(const std::string& id, EventKind kind) {
        std::vector<std::string> out;
        for (const auto& e : events(id)) {
            if (e.kind == kind) out.push_back(e.detail);
        }
        return out;
    }

    static std::vector<std::string> hashes(const std::vector<LedgerBlock>& chain) {
        std::vector<std::string> out;
        for (const auto& block : chain) out.push_back(block.hash());
        return out;
    }

    static std::vector<uint8_t> text(const std::string& s) {
        return std::vector<uint8_t>(s.begin(), s.end());
    }

    KeyRing ring;
    SimulatedNetwork net;
    std::map<std::string, std::unique_ptr<Member>> members;
    const SteadyTime t0 = SteadyTime{} + 1h;
    SteadyTime now = t0;
};

// ============================================================================
// NETWORK STATE
// ============================================================================

TEST_F(NodeAgentTest, HeartbeatLossFallsBackAndResyncRestoresAuthority) {
    add("HQ");
    add("A");
    add("B");
    link("HQ", "A");
    link("HQ", "B");
    link("A", "B");
    startAll();

    EXPECT_EQ(agent("A").state(), NetworkState::CENTRALIZED);
    EXPECT_TRUE(agent("HQ").isAuthority());

    // the radio link to the command post goes down
    advanceTo(t0 + 10s);
    net.disconnect("HQ", "A");

    advanceTo(t0 + 55s);
    EXPECT_EQ(agent("A").state(), NetworkState::CENTRALIZED);

    advanceTo(t0 + 60s);
    EXPECT_EQ(agent("A").state(), NetworkState::P2P_FALLBACK);
    EXPECT_EQ(agent("B").state(), NetworkState::CENTRALIZED);
    EXPECT_EQ(details("A", EventKind::STATE_CHANGED).size(), 1u);

    // B is the one reachable peer: one flooding round is enough
    advanceTo(t0 + 65s);
    std::string chat = agent("A").submit(MessageType::CHAT, text("contact north ridge"), "", now);
    net.pump();
    EXPECT_TRUE(agent("B").ledger().containsMessage(chat));
    EXPECT_EQ(count("A", EventKind::DELIVERY_OUTCOME, chat), 1u);
    EXPECT_EQ(details("A", EventKind::DELIVERY_OUTCOME).back(), "DELIVERED");

    // the authority is gated, so a report to it waits in the queue
    std::string report = agent("A").submit(MessageType::STATUS, text("ammo low"), "HQ", now);
    EXPECT_EQ(details("A", EventKind::DELIVERY_OUTCOME).back(), "QUEUED");
    EXPECT_EQ(agent("A").queuedCount(), 1u);
    net.pumpUntilIdle();

    advanceTo(t0 + 85s);

    // link restored: the next authority heartbeat starts the resync
    now = t0 + 90s;
    net.connect("HQ", "A");
    agent("HQ").tick(now);
    net.pump();
    EXPECT_TRUE(agent("A").isResyncing());
    EXPECT_TRUE(agent("A").hasActiveSession());
    EXPECT_EQ(agent("A").state(), NetworkState::P2P_FALLBACK);

    net.pump();   // HQ merges and answers
    EXPECT_TRUE(agent("A").isResyncing());
    EXPECT_EQ(agent("A").state(), NetworkState::P2P_FALLBACK);
    EXPECT_EQ(agent("HQ").pendingMergeCount(), 1u);
    EXPECT_FALSE(agent("HQ").ledger().containsMessage(report));

    net.pump();   // A adopts the canonical chain and acknowledges
    EXPECT_FALSE(agent("A").isResyncing());
    EXPECT_FALSE(agent("A").hasActiveSession());
    EXPECT_EQ(agent("A").state(), NetworkState::CENTRALIZED);

    net.pump();   // HQ adopts on the ack
    EXPECT_EQ(agent("HQ").pendingMergeCount(), 0u);
    EXPECT_EQ(hashes(agent("A").ledger().blocks()), hashes(agent("HQ").ledger().blocks()));
    EXPECT_TRUE(agent("HQ").ledger().containsMessage(chat));
    EXPECT_TRUE(agent("HQ").ledger().containsMessage(report));
    ASSERT_EQ(count("HQ", EventKind::MESSAGE_RECEIVED, report), 1u);
    EXPECT_NE(details("HQ", EventKind::MESSAGE_RECEIVED).back().find("via reconciliation with A"), std::string::npos);

    std::vector<std::string> transitions = details("A", EventKind::STATE_CHANGED);
    ASSERT_EQ(transitions.size(), 2u);
    EXPECT_EQ(transitions[1].rfind("P2P_FALLBACK -> CENTRALIZED", 0), 0u);

    // the queued report still goes out on its own retry timer; HQ already has it
    advanceTo(t0 + 150s);
    EXPECT_EQ(agent("A").queuedCount(), 0u);
    EXPECT_EQ(count("HQ", EventKind::MESSAGE_RECEIVED, report), 1u);
    std::vector<std::string> outcomes = details("A", EventKind::DELIVERY_OUTCOME);
    EXPECT_EQ(outcomes.back().rfind("DELIVERED: after", 0), 0u);
}

TEST_F(NodeAgentTest, AuthorityTrafficReachesNodeWhileResyncing) {
    add("HQ");
    add("A");
    add("B");
    link("HQ", "A");
    link("HQ", "B");
    link("A", "B");
    startAll();

    advanceTo(t0 + 10s);
    net.disconnect("HQ", "A");
    advanceTo(t0 + 85s);
    ASSERT_EQ(agent("A").state(), NetworkState::P2P_FALLBACK);

    // the link is back before the next authority heartbeat
    net.connect("HQ", "A");
    agent("A").onLinkUp("HQ", now);
    agent("HQ").onLinkUp("A", now);
    std::string command = agent("HQ").submit(MessageType::COMMAND, text("hold position"), "A", now);
    EXPECT_EQ(details("HQ", EventKind::DELIVERY_OUTCOME).back(), "DELIVERED");

    net.pumpUntilIdle();
    EXPECT_TRUE(agent("A").ledger().containsMessage(command));
    ASSERT_EQ(count("A", EventKind::MESSAGE_RECEIVED, command), 1u);
    EXPECT_EQ(details("A", EventKind::MESSAGE_RECEIVED).back(), "COMMAND from HQ after 1 hops");

    // the resync that follows does not report it a second time
    advanceTo(t0 + 120s);
    EXPECT_EQ(agent("A").state(), NetworkState::CENTRALIZED);
    EXPECT_EQ(hashes(agent("A").ledger().blocks()), hashes(agent("HQ").ledger().blocks()));
    EXPECT_EQ(count("A", EventKind::MESSAGE_RECEIVED, command), 1u);
}

TEST_F(NodeAgentTest, TooFewPeersPassesThroughFallbackToDegraded) {
    add("HQ");
    NodeConfig config = configFor("A");
    config.minPeers = 2;
    add(config);
    add("B");
    link("HQ", "A");
    link("A", "B");
    startAll();

    net.disconnect("HQ", "A");
    advanceTo(t0 + 60s);

    EXPECT_EQ(agent("A").state(), NetworkState::DEGRADED);
    std::vector<std::string> transitions = details("A", EventKind::STATE_CHANGED);
    ASSERT_EQ(transitions.size(), 2u);
    EXPECT_EQ(transitions[0].rfind("CENTRALIZED -> P2P_FALLBACK", 0), 0u);
    EXPECT_EQ(transitions[1].rfind("P2P_FALLBACK -> DEGRADED", 0), 0u);
}

TEST_F(NodeAgentTest, NoPeersAndNoAuthorityIsIsolated) {
    add("A");
    agent("A").addNeighbour("B");
    agent("A").start(now);

    std::string id = agent("A").submit(MessageType::ALERT, text("man down"), "B", now);
    EXPECT_EQ(details("A", EventKind::DELIVERY_OUTCOME).back(), "QUEUED");

    advanceTo(t0 + 60s);
    EXPECT_EQ(agent("A").state(), NetworkState::ISOLATED);
    EXPECT_EQ(agent("A").queuedCount(), 1u);

    // default expiry is ten minutes
    advanceTo(t0 + 10min);
    EXPECT_EQ(agent("A").queuedCount(), 0u);
    EXPECT_EQ(count("A", EventKind::DELIVERY_OUTCOME, id), 2u);
    EXPECT_EQ(details("A", EventKind::DELIVERY_OUTCOME).back().rfind("EXPIRED: unreachable after", 0), 0u);
    // the message itself stays on record
    EXPECT_TRUE(agent("A").ledger().containsMessage(id));
}

// ============================================================================
// MESSAGES
// ============================================================================

TEST_F(NodeAgentTest, DuplicateDeliveryAppendsOnce) {
    add("HQ");
    add("A");
    add("B");
    add("C");
    link("A", "B");
    link("A", "C");
    link("B", "C");
    startAll();
    net.setDuplicateDelivery(true);

    std::string id = agent("A").submit(MessageType::COMMAND, text("hold position"), "", now);
    net.pumpUntilIdle();

    for (const auto& name : {"B", "C"}) {
        EXPECT_EQ(count(name, EventKind::LEDGER_APPENDED, id), 1u) << name;
        EXPECT_EQ(count(name, EventKind::MESSAGE_RECEIVED, id), 1u) << name;
        EXPECT_TRUE(agent(name).ledger().containsMessage(id));
    }
    EXPECT_EQ(count("A", EventKind::LEDGER_APPENDED, id), 1u);
}

TEST_F(NodeAgentTest, DirectedMessageIsReportedOnlyAtDestination) {
    add("HQ");
    add("A");
    add("B");
    add("C");
    link("A", "B");
    link("B", "C");
    startAll();

    std::string id = agent("A").submit(MessageType::COMMAND, text("move to grid 4"), "C", now);
    net.pumpUntilIdle();

    EXPECT_EQ(count("C", EventKind::MESSAGE_RECEIVED, id), 1u);
    EXPECT_EQ(count("B", EventKind::MESSAGE_RECEIVED, id), 0u);
    // the relay still records it
    EXPECT_TRUE(agent("B").ledger().containsMessage(id));
    EXPECT_NE(details("C", EventKind::MESSAGE_RECEIVED).back().find("after 2 hops"), std::string::npos);
}

TEST_F(NodeAgentTest, ForgedMessageIsRejected) {
    add("HQ");
    add("A");
    add("B");
    link("A", "B");
    startAll();

    KeyRing otherRing;
    Ed25519Signer impostor("A", otherRing);
    ClockService clock("A");
    MeshMessage forged = MeshMessage::create(impostor, MessageType::COMMAND, text("retreat"), "", clock.stamp());

    const uint64_t before = agent("B").ledger().size();
    agent("B").onFrame("A", makeFrame(FrameType::MESH_MESSAGE, forged.relayCopy().encode()), now);

    EXPECT_EQ(agent("B").ledger().size(), before);
    EXPECT_FALSE(agent("B").ledger().containsMessage(forged.id()));
    EXPECT_EQ(count("B", EventKind::MESSAGE_RECEIVED), 0u);
}

TEST_F(NodeAgentTest, MalformedFramesAreDropped) {
    add("HQ");
    add("A");
    link("HQ", "A");
    startAll();

    const uint64_t before = agent("A").ledger().size();
    EXPECT_NO_THROW(agent("A").onFrame("HQ", makeFrame(FrameType::SYNC_OFFER, {1, 2, 3}), now));
    EXPECT_NO_THROW(agent("A").onFrame("HQ", makeFrame(FrameType::MESH_MESSAGE, {}), now));
    EXPECT_EQ(agent("A").ledger().size(), before);
    EXPECT_EQ(agent("A").state(), NetworkState::CENTRALIZED);
}

TEST_F(NodeAgentTest, CannotAddressItself) {
    add("A");
    EXPECT_THROW(agent("A").submit(MessageType::CHAT, text("hello me"), "A", now), std::invalid_argument);
}

// ============================================================================
// RECONCILIATION SESSIONS
// ============================================================================

TEST_F(NodeAgentTest, RestoredPeersConverge) {
    add("HQ");
    add("A");
    add("B");
    link("A", "B");
    startAll();

    net.disconnect("A", "B");
    std::string fromA = agent("A").submit(MessageType::STATUS, text("A holding"), "", now);
    std::string fromB = agent("B").submit(MessageType::STATUS, text("B holding"), "", now);
    EXPECT_FALSE(agent("B").ledger().containsMessage(fromA));

    net.connect("A", "B");
    agent("A").onLinkUp("B", now);
    agent("B").onLinkUp("A", now);
    advanceTo(now + 5s);

    EXPECT_TRUE(agent("A").ledger().containsMessage(fromB));
    EXPECT_TRUE(agent("B").ledger().containsMessage(fromA));
    EXPECT_EQ(hashes(agent("A").ledger().blocks()), hashes(agent("B").ledger().blocks()));
    EXPECT_FALSE(agent("A").hasActiveSession());
    EXPECT_FALSE(agent("B").hasActiveSession());
    EXPECT_EQ(agent("A").pendingMergeCount(), 0u);
    EXPECT_EQ(agent("B").pendingMergeCount(), 0u);
}

TEST_F(NodeAgentTest, DisconnectAbortsSessionAndLeavesLedgerUntouched) {
    add("HQ");
    add("A");
    add("B");
    link("A", "B");
    startAll();

    net.disconnect("A", "B");
    agent("A").submit(MessageType::CHAT, text("alone"), "", now);
    agent("B").submit(MessageType::CHAT, text("also alone"), "", now);

    net.connect("A", "B");
    agent("A").onLinkUp("B", now);
    agent("A").tick(now);
    ASSERT_TRUE(agent("A").hasActiveSession());
    std::vector<std::string> before = hashes(agent("A").ledger().blocks());
    std::vector<std::string> beforeB = hashes(agent("B").ledger().blocks());

    // B merges and answers, but the link drops before the result arrives
    net.pump();
    EXPECT_EQ(agent("B").pendingMergeCount(), 1u);
    net.disconnect("A", "B");
    agent("A").onLinkDown("B", now);
    agent("B").onLinkDown("A", now);
    net.pumpUntilIdle();

    EXPECT_FALSE(agent("A").hasActiveSession());
    EXPECT_EQ(hashes(agent("A").ledger().blocks()), before);
    EXPECT_TRUE(agent("A").ledger().superseded().empty());
    EXPECT_EQ(agent("B").pendingMergeCount(), 0u);
    EXPECT_EQ(hashes(agent("B").ledger().blocks()), beforeB);
    EXPECT_TRUE(agent("B").ledger().superseded().empty());
    ASSERT_EQ(count("A", EventKind::RECONCILIATION_ABORTED), 1u);
    EXPECT_NE(details("A", EventKind::RECONCILIATION_ABORTED).back().find("lost"), std::string::npos);
}

TEST_F(NodeAgentTest, UnansweredOfferTimesOutAndRetries) {
    add("HQ");
    add("A");
    add("B");
    link("A", "B");
    startAll();

    // B stays silent from here on
    net.setHandler("B", [](const std::string&, const Frame&) {});
    agent("A").onLinkDown("B", now);
    agent("A").onLinkUp("B", now);
    agent("A").tick(now);
    ASSERT_TRUE(agent("A").hasActiveSession());

    agent("A").onLinkUp("B", now + 19s);
    agent("A").tick(now + 19s);
    EXPECT_TRUE(agent("A").hasActiveSession());

    agent("A").onLinkUp("B", now + 20s);
    agent("A").tick(now + 20s);
    EXPECT_FALSE(agent("A").hasActiveSession());
    EXPECT_EQ(count("A", EventKind::RECONCILIATION_ABORTED), 1u);

    agent("A").onLinkUp("B", now + 25s);
    agent("A").tick(now + 25s);
    EXPECT_TRUE(agent("A").hasActiveSession());
}

TEST_F(NodeAgentTest, DivergentGenesisRaisesOperatorAlert) {
    add("HQ");
    add("A");
    add(configFor("B", "net-2"));
    link("A", "B");
    startAll();
    agent("A").submit(MessageType::CHAT, text("net-1 traffic"), "", now);
    net.pumpUntilIdle();
    std::vector<std::string> before = hashes(agent("A").ledger().blocks());

    // B's link to A flaps, so B offers its foreign chain
    agent("B").onLinkDown("A", now);
    agent("B").onLinkUp("A", now);
    agent("B").tick(now);
    net.pumpUntilIdle();

    EXPECT_EQ(count("A", EventKind::DIVERGENT_LEDGER), 1u);
    EXPECT_EQ(count("B", EventKind::RECONCILIATION_ABORTED), 1u);
    EXPECT_EQ(hashes(agent("A").ledger().blocks()), before);
    EXPECT_FALSE(agent("B").hasActiveSession());
}
