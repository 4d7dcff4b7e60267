#include <gtest/gtest.h>
#include "tacmesh/CryptoBase.hpp"
#include "tacmesh/OutboundQueue.hpp"
#include "tacmesh/Signer.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

using namespace tacmesh;
using namespace std::chrono_literals;

class OutboundQueueTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(CryptoBase::initialize());
        signer = std::make_unique<Ed25519Signer>("alpha", ring);
    }

    MeshMessage make(MessageType type) {
        return MeshMessage::create(*signer, type, {0x01}, "bravo", clock.stamp());
    }

    KeyRing ring;
    ClockService clock{"alpha"};
    std::unique_ptr<Ed25519Signer> signer;
    SteadyTime t0 = SteadyTime{} + 1h;
};

TEST_F(OutboundQueueTest, DrainsByPriorityThenArrival) {
    OutboundQueue queue(1s, 60s, 10min);
    MeshMessage chat = make(MessageType::CHAT);
    MeshMessage status = make(MessageType::STATUS);
    MeshMessage command1 = make(MessageType::COMMAND);
    MeshMessage alert = make(MessageType::ALERT);
    MeshMessage command2 = make(MessageType::COMMAND);

    for (const auto& m : {chat, status, command1, alert, command2}) {
        ASSERT_TRUE(queue.enqueue(m, t0));
    }

    EXPECT_EQ(queue.orderedIds(),
              (std::vector<std::string>{alert.id(), command1.id(), command2.id(), status.id(), chat.id()}));

    std::vector<QueueEntry> due = queue.due(t0 + 1s);
    ASSERT_EQ(due.size(), 5u);
    EXPECT_EQ(due.front().message.id(), alert.id());
    EXPECT_EQ(due.back().message.id(), chat.id());
}

TEST_F(OutboundQueueTest, NothingDueBeforeFirstRetry) {
    OutboundQueue queue(1s, 60s, 10min);
    queue.enqueue(make(MessageType::CHAT), t0);
    EXPECT_TRUE(queue.due(t0 + 999ms).empty());
    EXPECT_EQ(queue.due(t0 + 1s).size(), 1u);
}

TEST_F(OutboundQueueTest, BackoffDoublesUpToCap) {
    OutboundQueue queue(1s, 5s, 10min);
    MeshMessage msg = make(MessageType::STATUS);
    ASSERT_TRUE(queue.enqueue(msg, t0));

    std::vector<Millis> observed;
    SteadyTime now = t0;
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(queue.markFailed(msg.id(), now));
        auto entry = queue.find(msg.id());
        ASSERT_TRUE(entry.has_value());
        observed.push_back(entry->backoff);
        EXPECT_EQ(entry->nextAttempt, now + entry->backoff);
        now = entry->nextAttempt;
    }

    EXPECT_EQ(observed, (std::vector<Millis>{2s, 4s, 5s, 5s, 5s}));
    EXPECT_EQ(queue.find(msg.id())->attempts, 5u);
}

TEST_F(OutboundQueueTest, FailedEntryDoesNotBlockOthers) {
    OutboundQueue queue(1s, 60s, 10min);
    MeshMessage stuck = make(MessageType::ALERT);
    MeshMessage fresh = make(MessageType::CHAT);
    queue.enqueue(stuck, t0);
    queue.markFailed(stuck.id(), t0 + 1s);   // next try at t0 + 3s
    queue.enqueue(fresh, t0 + 1s);           // next try at t0 + 2s

    std::vector<QueueEntry> due = queue.due(t0 + 2s);
    ASSERT_EQ(due.size(), 1u);
    EXPECT_EQ(due.front().message.id(), fresh.id());
}

TEST_F(OutboundQueueTest, ExpiredEntriesAreTakenOut) {
    OutboundQueue queue(1s, 60s, 30s);
    MeshMessage old = make(MessageType::COMMAND);
    MeshMessage young = make(MessageType::CHAT);
    queue.enqueue(old, t0);
    queue.enqueue(young, t0 + 20s);

    EXPECT_TRUE(queue.takeExpired(t0 + 29s).empty());

    std::vector<QueueEntry> expired = queue.takeExpired(t0 + 30s);
    ASSERT_EQ(expired.size(), 1u);
    EXPECT_EQ(expired.front().message.id(), old.id());
    EXPECT_EQ(queue.size(), 1u);
    EXPECT_FALSE(queue.find(old.id()).has_value());
    // an expired entry is never offered for delivery
    EXPECT_TRUE(queue.due(t0 + 50s).empty());
}

TEST_F(OutboundQueueTest, CapacityAndDuplicates) {
    OutboundQueue queue(1s, 60s, 10min, 2);
    MeshMessage a = make(MessageType::CHAT);
    EXPECT_TRUE(queue.enqueue(a, t0));
    EXPECT_FALSE(queue.enqueue(a, t0));
    EXPECT_TRUE(queue.enqueue(make(MessageType::CHAT), t0));
    EXPECT_FALSE(queue.enqueue(make(MessageType::ALERT), t0));
    EXPECT_EQ(queue.size(), 2u);

    EXPECT_TRUE(queue.remove(a.id()));
    EXPECT_FALSE(queue.remove(a.id()));
    EXPECT_FALSE(queue.markFailed(a.id(), t0));
    EXPECT_EQ(queue.size(), 1u);
}

TEST_F(OutboundQueueTest, RejectsBadBackoff) {
    EXPECT_THROW(OutboundQueue(0ms, 1s, 1min), std::invalid_argument);
    EXPECT_THROW(OutboundQueue(10s, 1s, 1min), std::invalid_argument);
}
