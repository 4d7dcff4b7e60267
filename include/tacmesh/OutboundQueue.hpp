#ifndef TACMESH_OUTBOUND_QUEUE_HPP
#define TACMESH_OUTBOUND_QUEUE_HPP

#include "tacmesh/MeshMessage.hpp"
#include "tacmesh/Types.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tacmesh {

    enum class DeliveryStatus {
        DELIVERED,
        QUEUED,
        EXPIRED
    };

    std::string deliveryStatusToString(DeliveryStatus status);

    struct QueueEntry {
        MeshMessage message;
        uint64_t sequence = 0;
        SteadyTime enqueuedAt{};
        SteadyTime nextAttempt{};
        SteadyTime expiresAt{};
        Millis backoff{0};
        uint32_t attempts = 0;
    };

    /**
     * Messages waiting for a reachable target. Drains ALERT before COMMAND
     * before STATUS before CHAT, FIFO within a priority. Every entry keeps its
     * own retry timer, so a dead target never holds back other entries.
     */
    class OutboundQueue {
    public:
        OutboundQueue(Millis initialBackoff = DEFAULT_RETRY_INITIAL,
                      Millis maxBackoff = DEFAULT_RETRY_MAX,
                      Millis expiry = DEFAULT_QUEUE_EXPIRY,
                      size_t capacity = MAX_MESSAGE_QUEUE);

        // False when the queue is full or the id is already queued
        bool enqueue(const MeshMessage& message, SteadyTime now);

        // Entries whose retry timer has fired, in drain order
        std::vector<QueueEntry> due(SteadyTime now) const;

        // Doubles the entry's backoff (up to the cap) and re-arms its timer
        bool markFailed(const std::string& messageId, SteadyTime now);
        bool remove(const std::string& messageId);

        // Removes and returns every entry past its deadline
        std::vector<QueueEntry> takeExpired(SteadyTime now);

        std::optional<QueueEntry> find(const std::string& messageId) const;
        std::vector<std::string> orderedIds() const;
        size_t size() const;
        bool empty() const { return size() == 0; }
        size_t capacity() const { return maxEntries; }

    private:
        using Key = std::pair<int, uint64_t>; // (priority rank, sequence)

        Millis initialBackoff;
        Millis maxBackoff;
        Millis expiry;
        size_t maxEntries;

        mutable std::mutex mtx;
        uint64_t nextSequence = 0;
        std::map<Key, QueueEntry> entries;
        std::unordered_map<std::string, Key> index;
    };

} // namespace tacmesh

#endif // TACMESH_OUTBOUND_QUEUE_HPP
