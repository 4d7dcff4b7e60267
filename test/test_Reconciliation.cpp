#include <gtest/gtest.h>
#include "tacmesh/CryptoBase.hpp"
#include "tacmesh/Errors.hpp"
#include "tacmesh/Ledger.hpp"
#include "tacmesh/Reconciliation.hpp"
#include "tacmesh/Signer.hpp"

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

using namespace tacmesh;

// ============================================================================
// FIXTURE: three nodes of one network, each with its own ledger
// ============================================================================

class ReconciliationTest : public ::testing::Test {
protected:
    struct Node {
        std::unique_ptr<Ed25519Signer> signer;
        std::unique_ptr<ClockService> clock;
        std::unique_ptr<Ledger> ledger;

        MeshMessage write(const std::string& text) {
            MeshMessage msg = MeshMessage::create(*signer, MessageType::CHAT,
                                                  std::vector<uint8_t>(text.begin(), text.end()),
                                                  "", clock->stamp());
            ledger->append({msg});
            return msg;
        }
    };

    void SetUp() override {
        ASSERT_TRUE(CryptoBase::initialize());
        for (const auto& id : {"alpha", "bravo", "charlie"}) {
            Node node;
            node.signer = std::make_unique<Ed25519Signer>(id, ring);
            node.clock = std::make_unique<ClockService>(id);
            node.ledger = std::make_unique<Ledger>("net-1", *node.clock, *node.signer);
            nodes.emplace(id, std::move(node));
        }
        service = std::make_unique<ReconciliationService>(nodes["alpha"].signer.get());
    }

    static std::vector<std::string> hashes(const std::vector<LedgerBlock>& chain) {
        std::vector<std::string> out;
        for (const auto& block : chain) out.push_back(block.hash());
        return out;
    }

    static std::set<std::string> messageIds(const std::vector<LedgerBlock>& chain) {
        std::set<std::string> out;
        for (const auto& block : chain) {
            for (const auto& msg : block.messages()) out.insert(msg.id());
        }
        return out;
    }

    KeyRing ring;
    std::map<std::string, Node> nodes;
    std::unique_ptr<ReconciliationService> service;
};

// ============================================================================
// MERGE
// ============================================================================

TEST_F(ReconciliationTest, PrefixChainsNeedNoMerge) {
    Node& alpha = nodes["alpha"];
    alpha.write("one");
    std::vector<LedgerBlock> shorter = alpha.ledger->blocks();
    alpha.write("two");

    ReconciliationResult result = service->reconcile(shorter, alpha.ledger->blocks());
    EXPECT_FALSE(result.forkIndex.has_value());
    EXPECT_TRUE(result.conflicts.empty());
    EXPECT_EQ(hashes(result.canonical), hashes(alpha.ledger->blocks()));

    ReconciliationResult reversed = service->reconcile(alpha.ledger->blocks(), shorter);
    EXPECT_EQ(hashes(reversed.canonical), hashes(alpha.ledger->blocks()));
}

TEST_F(ReconciliationTest, BothSidesComputeTheSameChain) {
    Node& alpha = nodes["alpha"];
    Node& bravo = nodes["bravo"];
    alpha.write("a1");
    alpha.write("a2");
    bravo.write("b1");

    ReconciliationResult fromAlpha = service->reconcile(alpha.ledger->blocks(), bravo.ledger->blocks());
    ReconciliationResult fromBravo = service->reconcile(bravo.ledger->blocks(), alpha.ledger->blocks());

    EXPECT_EQ(hashes(fromAlpha.canonical), hashes(fromBravo.canonical));
    EXPECT_EQ(fromAlpha.canonical.size(), 4u);
    EXPECT_TRUE(Ledger::validate(fromAlpha.canonical, alpha.signer.get()).valid);

    std::set<std::string> expected = messageIds(alpha.ledger->blocks());
    std::set<std::string> bravoIds = messageIds(bravo.ledger->blocks());
    expected.insert(bravoIds.begin(), bravoIds.end());
    EXPECT_EQ(messageIds(fromAlpha.canonical), expected);
}

TEST_F(ReconciliationTest, EqualLamportGoesToLowerNodeId) {
    Node& alpha = nodes["alpha"];
    Node& bravo = nodes["bravo"];
    MeshMessage b1 = bravo.write("bravo first");
    MeshMessage a1 = alpha.write("alpha first");
    ASSERT_EQ(alpha.ledger->tip().lamport(), bravo.ledger->tip().lamport());

    ReconciliationResult result = service->reconcile(bravo.ledger->blocks(), alpha.ledger->blocks());
    ASSERT_EQ(result.canonical.size(), 3u);
    EXPECT_EQ(result.canonical[1].creator(), "alpha");
    EXPECT_EQ(result.canonical[1].messages().front().id(), a1.id());
    EXPECT_EQ(result.canonical[2].creator(), "bravo");
    EXPECT_EQ(result.canonical[2].messages().front().id(), b1.id());
}

TEST_F(ReconciliationTest, ConflictsNameTheLosingBlocks) {
    Node& alpha = nodes["alpha"];
    Node& bravo = nodes["bravo"];
    alpha.write("a1");
    bravo.write("b1");

    std::vector<LedgerBlock> bravoChain = bravo.ledger->blocks();
    ReconciliationResult result = service->reconcile(bravoChain, alpha.ledger->blocks());

    ASSERT_TRUE(result.forkIndex.has_value());
    EXPECT_EQ(*result.forkIndex, 1u);
    ASSERT_EQ(result.conflicts.size(), 1u);

    const SyncConflict& conflict = result.conflicts.front();
    EXPECT_EQ(conflict.side, ConflictSide::LOCAL);
    EXPECT_EQ(conflict.contestedIndex, 1u);
    EXPECT_EQ(conflict.supersededHash, bravoChain[1].hash());
    EXPECT_EQ(conflict.supersededCreator, "bravo");
    ASSERT_TRUE(conflict.canonicalHash.has_value());
    EXPECT_EQ(conflict.winnerCreator, "alpha");
    EXPECT_EQ(conflict.rule, std::string(CONFLICT_RULE));
    EXPECT_TRUE(conflict.contentRetained);
    EXPECT_TRUE(conflict.concurrent);
    EXPECT_NE(conflict.toString().find("LOCAL"), std::string::npos);
}

TEST_F(ReconciliationTest, SharedMessagesAreNotDuplicated) {
    Node& alpha = nodes["alpha"];
    Node& bravo = nodes["bravo"];
    MeshMessage shared = alpha.write("seen by both");
    // bravo received the same message over the mesh
    bravo.ledger->append({shared});
    alpha.write("a2");

    ReconciliationResult result = service->reconcile(alpha.ledger->blocks(), bravo.ledger->blocks());

    size_t occurrences = 0;
    for (const auto& block : result.canonical) {
        for (const auto& msg : block.messages()) {
            if (msg.id() == shared.id()) ++occurrences;
        }
    }
    EXPECT_EQ(occurrences, 1u);
    EXPECT_EQ(messageIds(result.canonical).size(), 2u);
}

TEST_F(ReconciliationTest, PairwiseMergesConverge) {
    Node& alpha = nodes["alpha"];
    Node& bravo = nodes["bravo"];
    Node& charlie = nodes["charlie"];
    alpha.write("a1");
    bravo.write("b1");
    bravo.write("b2");
    charlie.write("c1");

    auto sync = [this](Node& initiator, Node& responder) {
        std::vector<LedgerBlock> offered = initiator.ledger->blocks();
        std::vector<LedgerBlock> local = responder.ledger->blocks();
        ReconciliationResult result = service->reconcile(local, offered);
        responder.ledger->adopt(result.canonical, local.size());
        initiator.ledger->adopt(responder.ledger->blocks(), offered.size());
    };

    sync(alpha, bravo);
    sync(bravo, charlie);
    sync(charlie, alpha);
    sync(alpha, bravo);

    EXPECT_EQ(hashes(alpha.ledger->blocks()), hashes(bravo.ledger->blocks()));
    EXPECT_EQ(hashes(bravo.ledger->blocks()), hashes(charlie.ledger->blocks()));
    EXPECT_EQ(messageIds(alpha.ledger->blocks()).size(), 4u);
}

// ============================================================================
// FAILURES
// ============================================================================

TEST_F(ReconciliationTest, ForeignGenesisIsDivergent) {
    Node& alpha = nodes["alpha"];
    ClockService clock("alpha");
    Ledger foreign("net-2", clock, *alpha.signer);
    alpha.write("a1");

    EXPECT_THROW(service->reconcile(alpha.ledger->blocks(), foreign.blocks()), DivergentLedgerError);
    EXPECT_THROW(service->reconcile({}, foreign.blocks()), DivergentLedgerError);
}

TEST_F(ReconciliationTest, BrokenRemoteChainIsAnIntegrityError) {
    Node& alpha = nodes["alpha"];
    Node& bravo = nodes["bravo"];
    alpha.write("a1");
    bravo.write("b1");
    bravo.write("b2");

    std::vector<LedgerBlock> broken = bravo.ledger->blocks();
    broken[2] = broken[2].relinked(2, broken[0].hash());

    try {
        service->reconcile(alpha.ledger->blocks(), broken);
        FAIL() << "Expected IntegrityError";
    } catch (const IntegrityError& e) {
        EXPECT_EQ(e.offendingIndex(), 2);
        EXPECT_NE(std::string(e.what()).find("Remote"), std::string::npos);
    }
}
