#include "tacmesh/OutboundQueue.hpp"

#include <algorithm>
#include <stdexcept>

namespace tacmesh {

std::string deliveryStatusToString(DeliveryStatus status) {
    switch (status) {
        case DeliveryStatus::DELIVERED: return "DELIVERED";
        case DeliveryStatus::QUEUED:    return "QUEUED";
        case DeliveryStatus::EXPIRED:   return "EXPIRED";
    }
    return "UNKNOWN";
}

OutboundQueue::OutboundQueue(Millis initialBackoff, Millis maxBackoff, Millis expiry, size_t capacity)
    : initialBackoff(initialBackoff), maxBackoff(maxBackoff), expiry(expiry), maxEntries(capacity) {
    if (initialBackoff.count() <= 0 || maxBackoff < initialBackoff) {
        throw std::invalid_argument("Retry backoff must be positive and below its cap");
    }
}

bool OutboundQueue::enqueue(const MeshMessage& message, SteadyTime now) {
    std::lock_guard<std::mutex> lock(mtx);
    if (entries.size() >= maxEntries || index.count(message.id())) {
        return false;
    }

    QueueEntry entry;
    entry.message = message;
    entry.sequence = nextSequence++;
    entry.enqueuedAt = now;
    entry.backoff = initialBackoff;
    entry.nextAttempt = now + initialBackoff;
    entry.expiresAt = now + expiry;

    Key key(priorityRank(message.type()), entry.sequence);
    index.emplace(message.id(), key);
    entries.emplace(key, std::move(entry));
    return true;
}

std::vector<QueueEntry> OutboundQueue::due(SteadyTime now) const {
    std::lock_guard<std::mutex> lock(mtx);
    std::vector<QueueEntry> out;
    for (const auto& kv : entries) {
        if (kv.second.nextAttempt <= now && kv.second.expiresAt > now) {
            out.push_back(kv.second);
        }
    }
    return out;
}

bool OutboundQueue::markFailed(const std::string& messageId, SteadyTime now) {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = index.find(messageId);
    if (it == index.end()) return false;

    QueueEntry& entry = entries.at(it->second);
    entry.attempts++;
    entry.backoff = std::min(entry.backoff * 2, maxBackoff);
    entry.nextAttempt = now + entry.backoff;
    return true;
}

bool OutboundQueue::remove(const std::string& messageId) {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = index.find(messageId);
    if (it == index.end()) return false;

    entries.erase(it->second);
    index.erase(it);
    return true;
}

std::vector<QueueEntry> OutboundQueue::takeExpired(SteadyTime now) {
    std::lock_guard<std::mutex> lock(mtx);
    std::vector<QueueEntry> expired;
    for (auto it = entries.begin(); it != entries.end();) {
        if (it->second.expiresAt <= now) {
            index.erase(it->second.message.id());
            expired.push_back(std::move(it->second));
            it = entries.erase(it);
        } else {
            ++it;
        }
    }
    return expired;
}

std::optional<QueueEntry> OutboundQueue::find(const std::string& messageId) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = index.find(messageId);
    if (it == index.end()) return std::nullopt;
    return entries.at(it->second);
}

std::vector<std::string> OutboundQueue::orderedIds() const {
    std::lock_guard<std::mutex> lock(mtx);
    std::vector<std::string> ids;
    ids.reserve(entries.size());
    for (const auto& kv : entries) ids.push_back(kv.second.message.id());
    return ids;
}

size_t OutboundQueue::size() const {
    std::lock_guard<std::mutex> lock(mtx);
    return entries.size();
}

} // namespace tacmesh
