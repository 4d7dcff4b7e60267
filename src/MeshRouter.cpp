#include "tacmesh/MeshRouter.hpp"
#include "tacmesh/Protocol.hpp"

#include <algorithm>

namespace tacmesh {

MeshRouter::MeshRouter(std::string selfId, Transport& transport, PeerTable& peers, Millis dedupRetention)
    : self(std::move(selfId)), transport(transport), peers(peers), retention(dedupRetention) {}

// ==== MESSAGES ====

ReceiveReport MeshRouter::receive(const MeshMessage& message,
                                  const std::string& fromNodeId,
                                  SteadyTime now,
                                  const Processor& process) {
    ReceiveReport report;
    report.link = markSeen(fromNodeId, now);
    MeshMessage arrived = message.arrivedAt(self);

    {
        std::lock_guard<std::mutex> lock(mtx);
        for (const auto& hop : message.route()) {
            if (hop != self) observed[hop] = now;
        }
        if (!rememberLocked(message.id(), now)) {
            report.duplicate = true;
            return report;
        }
    }

    if (message.sender() == self) {
        // our own message echoed back by a neighbour
        report.duplicate = true;
        return report;
    }

    report.accepted = process(arrived);
    if (!report.accepted) {
        return report;
    }

    if (!arrived.addressedTo(self)) {
        report.relay = broadcast(arrived, fromNodeId);
    }
    return report;
}

SendReport MeshRouter::originate(const MeshMessage& message, SteadyTime now) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        rememberLocked(message.id(), now);
    }
    return broadcast(message);
}

SendReport MeshRouter::broadcast(const MeshMessage& message, const std::string& except) {
    SendReport report;
    if (message.ttl() == 0) return report;

    std::vector<std::string> targets = targetsFor(message, except);
    if (targets.empty()) return report;

    Frame frame = makeFrame(FrameType::MESH_MESSAGE, message.relayCopy().encode());
    for (const auto& peer : targets) {
        if (sendDirect(peer, frame, report.lostLinks)) {
            ++report.sent;
        }
    }
    return report;
}

bool MeshRouter::sendDirect(const std::string& peerId, const Frame& frame, std::vector<std::string>& lostLinks) {
    if (transport.send(peerId, frame)) {
        return true;
    }
    if (peers.markFailed(peerId) == LinkChange::LOST) {
        lostLinks.push_back(peerId);
    }
    return false;
}

std::vector<std::string> MeshRouter::targetsFor(const MeshMessage& message, const std::string& except) const {
    std::vector<std::string> live = peers.liveLinks();

    // a directed message goes straight to its destination when it is a neighbour
    if (!message.isBroadcast() &&
        std::find(live.begin(), live.end(), message.destination()) != live.end()) {
        return {message.destination()};
    }

    std::vector<std::string> targets;
    for (const auto& peer : live) {
        if (peer == except || message.visited(peer)) continue;
        targets.push_back(peer);
    }
    return targets;
}

// ==== DEDUP ====

bool MeshRouter::rememberLocked(const std::string& messageId, SteadyTime now) {
    pruneLocked(now);
    if (seenIds.count(messageId)) {
        return false;
    }
    seenIds.emplace(messageId, now);
    seenOrder.emplace_back(now, messageId);

    while (seenIds.size() > MAX_DEDUP_ENTRIES && !seenOrder.empty()) {
        seenIds.erase(seenOrder.front().second);
        seenOrder.pop_front();
    }
    return true;
}

void MeshRouter::pruneLocked(SteadyTime now) {
    while (!seenOrder.empty() && now - seenOrder.front().first > retention) {
        seenIds.erase(seenOrder.front().second);
        seenOrder.pop_front();
    }
}

bool MeshRouter::hasSeen(const std::string& messageId) const {
    std::lock_guard<std::mutex> lock(mtx);
    return seenIds.count(messageId) > 0;
}

size_t MeshRouter::dedupSize() const {
    std::lock_guard<std::mutex> lock(mtx);
    return seenIds.size();
}

// ==== LINKS ====

LinkChange MeshRouter::markSeen(const std::string& nodeId, SteadyTime now) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        observed[nodeId] = now;
    }
    return peers.markSeen(nodeId, now);
}

std::vector<std::string> MeshRouter::sweep(SteadyTime now) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        pruneLocked(now);
        for (auto it = observed.begin(); it != observed.end();) {
            if (now - it->second > peers.timeout()) {
                it = observed.erase(it);
            } else {
                ++it;
            }
        }
    }
    return peers.sweep(now);
}

void MeshRouter::setGated(const std::string& nodeId, bool gated) {
    peers.setGated(nodeId, gated);
}

bool MeshRouter::isReachable(const std::string& nodeId, SteadyTime now) const {
    if (peers.isGated(nodeId)) return false;
    if (peers.isAlive(nodeId)) return true;

    std::lock_guard<std::mutex> lock(mtx);
    auto it = observed.find(nodeId);
    return it != observed.end() && now - it->second <= peers.timeout();
}

} // namespace tacmesh
