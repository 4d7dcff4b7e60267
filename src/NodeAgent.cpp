#include "tacmesh/NodeAgent.hpp"
#include "tacmesh/CryptoBase.hpp"
#include "tacmesh/Errors.hpp"
#include "tacmesh/Signer.hpp"

#include <iostream>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace tacmesh {

NodeAgent::NodeAgent(const NodeConfig& cfg, Transport& transport, const Signer& signer)
    : config(cfg),
      signer(signer),
      clock_(cfg.nodeId),
      ledger_(cfg.networkId, clock_, signer),
      peers_(cfg.peerTimeout),
      router_(cfg.nodeId, transport, peers_, cfg.dedupRetention),
      queue_(cfg.retryInitial, cfg.retryMax, cfg.queueExpiry),
      reconciler(&signer) {
    std::string error;
    if (!config.validate(error)) {
        throw std::invalid_argument("Invalid node config: " + error);
    }
    if (signer.signerId() != config.nodeId) {
        throw std::invalid_argument("Signer " + signer.signerId() + " does not belong to node " + config.nodeId);
    }
    for (const auto& peer : config.peers) {
        PeerLink link;
        link.nodeId = peer.nodeId;
        link.host = peer.host;
        link.port = peer.port;
        peers_.addKnownPeer(link);
    }
}

void NodeAgent::setEventHandler(EventHandler handler) {
    std::lock_guard<std::mutex> lock(mtx);
    eventHandler = std::move(handler);
}

void NodeAgent::addNeighbour(const PeerLink& link) {
    if (link.nodeId == config.nodeId) {
        throw std::invalid_argument("A node cannot be its own neighbour");
    }
    peers_.addKnownPeer(link);
}

void NodeAgent::addNeighbour(const std::string& nodeId) {
    PeerLink link;
    link.nodeId = nodeId;
    addNeighbour(link);
}

bool NodeAgent::restoreLedger(const std::vector<LedgerBlock>& chain, const std::vector<LedgerBlock>& archive) {
    return ledger_.restore(chain, archive);
}

bool NodeAgent::loadKnownPeers(const std::string& filename) {
    return peers_.loadFromDisk(filename);
}

bool NodeAgent::saveKnownPeers(const std::string& filename) const {
    return peers_.persist(filename);
}

// ==== EVENTS ====

void NodeAgent::emit(Events& events, EventKind kind, const std::string& messageId, const std::string& detail) const {
    NodeEvent event;
    event.kind = kind;
    event.nodeId = config.nodeId;
    event.lamport = clock_.lamport();
    event.state = state_;
    event.messageId = messageId;
    event.detail = detail;
    events.push_back(std::move(event));
}

void NodeAgent::dispatch(const Events& events) {
    if (events.empty()) return;

    EventHandler handler;
    {
        std::lock_guard<std::mutex> lock(mtx);
        handler = eventHandler;
    }
    if (!handler) return;
    for (const auto& event : events) {
        handler(event);
    }
}

// ==== INPUTS ====

void NodeAgent::start(SteadyTime now) {
    Events events;
    {
        std::lock_guard<std::mutex> lock(mtx);
        started = true;
        lastAuthorityBeat = now;
        authorityAlive = true;
        std::cout << "Node " << config.nodeId << " started"
                  << (isAuthority() ? " as authority" : "")
                  << " (" << peers_.size() << " known peers)" << std::endl;
        sendHeartbeats(now, events);
    }
    dispatch(events);
}

std::string NodeAgent::submit(MessageType type,
                              const std::vector<uint8_t>& payload,
                              const std::string& destination,
                              SteadyTime now) {
    if (destination == config.nodeId) {
        throw std::invalid_argument("A node cannot address a message to itself");
    }

    Events events;
    std::string messageId;
    {
        std::lock_guard<std::mutex> lock(mtx);
        MeshMessage message = MeshMessage::create(signer, type, payload, destination,
                                                  clock_.stamp(), config.initialTtl);
        messageId = message.id();

        LedgerBlock block = ledger_.append({message});
        emit(events, EventKind::LEDGER_APPENDED, messageId, "block #" + std::to_string(block.index()));

        if (tryDeliver(message, now, events)) {
            emit(events, EventKind::DELIVERY_OUTCOME, messageId, deliveryStatusToString(DeliveryStatus::DELIVERED));
        } else if (queue_.enqueue(message, now)) {
            emit(events, EventKind::DELIVERY_OUTCOME, messageId, deliveryStatusToString(DeliveryStatus::QUEUED));
        } else {
            std::cerr << "Warning: Outbound queue full, dropping " << messageId << std::endl;
            emit(events, EventKind::DELIVERY_OUTCOME, messageId,
                 deliveryStatusToString(DeliveryStatus::EXPIRED) + ": queue full");
        }
    }
    dispatch(events);
    return messageId;
}

void NodeAgent::onFrame(const std::string& fromNodeId, const Frame& frame, SteadyTime now) {
    Events events;
    {
        std::lock_guard<std::mutex> lock(mtx);
        try {
            switch (frame.type) {
                case FrameType::HELLO: {
                    Hello hello = Hello::decode(frame.payload);
                    if (hello.nodeId != fromNodeId) {
                        std::cerr << "Warning: HELLO from " << fromNodeId << " names " << hello.nodeId << std::endl;
                        break;
                    }
                    handleLinkChange(fromNodeId, router_.markSeen(fromNodeId, now), now, events);
                    break;
                }
                case FrameType::HEARTBEAT: {
                    Heartbeat beat = Heartbeat::decode(frame.payload);
                    LinkChange change = router_.markSeen(fromNodeId, now);
                    if (beat.fromAuthority && beat.nodeId == fromNodeId && fromNodeId == config.authorityId) {
                        onAuthorityBeat(now, events);
                    }
                    handleLinkChange(fromNodeId, change, now, events);
                    evaluateState(now, events);
                    break;
                }
                case FrameType::MESH_MESSAGE:
                    handleMeshMessage(fromNodeId, frame, now, events);
                    break;
                case FrameType::SYNC_OFFER:
                    handleLinkChange(fromNodeId, router_.markSeen(fromNodeId, now), now, events);
                    handleSyncOffer(fromNodeId, frame, now, events);
                    break;
                case FrameType::SYNC_RESULT:
                    handleLinkChange(fromNodeId, router_.markSeen(fromNodeId, now), now, events);
                    handleSyncResult(fromNodeId, frame, now, events);
                    break;
                case FrameType::SYNC_ABORT:
                    handleSyncAbort(fromNodeId, frame, now, events);
                    break;
                case FrameType::SYNC_ACK:
                    handleLinkChange(fromNodeId, router_.markSeen(fromNodeId, now), now, events);
                    handleSyncAck(fromNodeId, frame, events);
                    break;
                case FrameType::DISCONNECT:
                    handleLinkChange(fromNodeId, peers_.markFailed(fromNodeId), now, events);
                    break;
            }
        } catch (const std::runtime_error& e) {
            std::cerr << "Error: Dropping " << frameTypeToString(frame.type) << " frame from "
                      << fromNodeId << ": " << e.what() << std::endl;
        }
    }
    dispatch(events);
}

void NodeAgent::onLinkUp(const std::string& peerId, SteadyTime now) {
    Events events;
    {
        std::lock_guard<std::mutex> lock(mtx);
        handleLinkChange(peerId, router_.markSeen(peerId, now), now, events);
    }
    dispatch(events);
}

void NodeAgent::onLinkDown(const std::string& peerId, SteadyTime now) {
    Events events;
    {
        std::lock_guard<std::mutex> lock(mtx);
        handleLinkChange(peerId, peers_.markFailed(peerId), now, events);
    }
    dispatch(events);
}

void NodeAgent::tick(SteadyTime now) {
    Events events;
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (!started) {
            started = true;
            lastAuthorityBeat = now;
        }

        handleLostLinks(router_.sweep(now), now, events);

        if (!lastHeartbeatSent || now - *lastHeartbeatSent >= config.heartbeatInterval) {
            sendHeartbeats(now, events);
        }
        evaluateState(now, events);

        if (session && now - session->startedAt >= config.syncTimeout) {
            abortSession("session timed out", true, true, now, events);
        }
        for (auto it = pendingMerges.begin(); it != pendingMerges.end();) {
            if (now - it->second.answeredAt >= config.syncTimeout) {
                std::cerr << "Warning: No SYNC_ACK from " << it->first << ", dropping answered merge" << std::endl;
                it = pendingMerges.erase(it);
            } else {
                ++it;
            }
        }
        runPendingSessions(now, events);

        for (const auto& entry : queue_.takeExpired(now)) {
            emit(events, EventKind::DELIVERY_OUTCOME, entry.message.id(),
                 deliveryStatusToString(DeliveryStatus::EXPIRED) + ": unreachable after " +
                 std::to_string(entry.attempts + 1) + " attempts");
        }
        drainQueue(now, events);
    }
    dispatch(events);
}

// ==== QUERIES ====

NetworkState NodeAgent::state() const {
    std::lock_guard<std::mutex> lock(mtx);
    return state_;
}

bool NodeAgent::isResyncing() const {
    std::lock_guard<std::mutex> lock(mtx);
    return resyncing;
}

bool NodeAgent::hasActiveSession() const {
    std::lock_guard<std::mutex> lock(mtx);
    return session.has_value();
}

size_t NodeAgent::pendingMergeCount() const {
    std::lock_guard<std::mutex> lock(mtx);
    return pendingMerges.size();
}

size_t NodeAgent::queuedCount() const {
    return queue_.size();
}

// ==== STATE MACHINE ====

void NodeAgent::evaluateState(SteadyTime now, Events& events) {
    if (isAuthority()) return;

    if (authorityAlive && now - lastAuthorityBeat >= config.authorityTimeout()) {
        onAuthorityLost(now, events);
    }
    // CENTRALIZED, or waiting for a resync to finish
    if (authorityAlive) return;

    const size_t live = peers_.liveLinks().size();
    const double quality = peers_.meanQuality();

    NetworkState target = NetworkState::P2P_FALLBACK;
    if (live == 0) {
        target = NetworkState::ISOLATED;
    } else if (live < config.minPeers || quality < config.degradedQuality) {
        target = NetworkState::DEGRADED;
    }
    if (target == state_) return;

    std::stringstream reason;
    reason << "authority unreachable, " << live << " live peers, quality " << quality;

    if (state_ == NetworkState::CENTRALIZED && target == NetworkState::DEGRADED) {
        transition(NetworkState::P2P_FALLBACK, reason.str(), events);
    }
    transition(target, reason.str(), events);
}

void NodeAgent::transition(NetworkState next, const std::string& reason, Events& events) {
    if (next == state_) return;

    const NetworkState previous = state_;
    state_ = next;
    std::cout << "Node " << config.nodeId << ": " << networkStateToString(previous)
              << " -> " << networkStateToString(next) << " (" << reason << ")" << std::endl;
    emit(events, EventKind::STATE_CHANGED, "",
         networkStateToString(previous) + " -> " + networkStateToString(next) + ": " + reason);
}

void NodeAgent::onAuthorityBeat(SteadyTime now, Events& events) {
    lastAuthorityBeat = now;
    if (isAuthority() || authorityAlive) return;

    // back in contact: reconcile before trusting the authority again
    authorityAlive = true;
    resyncing = true;
    resyncAt = now;
    router_.setGated(config.authorityId, true);
    std::cout << "Node " << config.nodeId << ": authority " << config.authorityId
              << " is back, resyncing" << std::endl;
    runPendingSessions(now, events);
}

void NodeAgent::onAuthorityLost(SteadyTime now, Events& events) {
    authorityAlive = false;
    resyncing = false;
    resyncAt.reset();
    router_.setGated(config.authorityId, true);
    std::cerr << "Warning: Node " << config.nodeId << " lost authority " << config.authorityId << std::endl;

    if (session && session->withAuthority) {
        abortSession("authority lost", false, false, now, events);
    }
}

void NodeAgent::sendHeartbeats(SteadyTime now, Events& events) {
    Heartbeat beat;
    beat.nodeId = config.nodeId;
    beat.fromAuthority = isAuthority();
    beat.chainLength = ledger_.size();
    const Frame frame = makeFrame(FrameType::HEARTBEAT, beat.encode());

    std::vector<std::string> lost;
    for (const auto& peer : peers_.getKnownPeers()) {
        // failures land in lost; a neighbour never heard from simply stays down
        router_.sendDirect(peer.nodeId, frame, lost);
    }
    lastHeartbeatSent = now;
    handleLostLinks(lost, now, events);
}

// ==== LINKS ====

void NodeAgent::handleLinkChange(const std::string& peerId, LinkChange change, SteadyTime now, Events& events) {
    switch (change) {
        case LinkChange::NONE:
            return;
        case LinkChange::FOUND:
            std::cout << "Node " << config.nodeId << ": new peer " << peerId << std::endl;
            emit(events, EventKind::PEER_FOUND, "", peerId + " first contact");
            break;
        case LinkChange::RESTORED:
            std::cout << "Node " << config.nodeId << ": peer " << peerId << " is back" << std::endl;
            emit(events, EventKind::PEER_FOUND, "", peerId + " link restored");
            if (!isAuthority() && peerId != config.authorityId) {
                pendingOffers[peerId] = now;
            }
            break;
        case LinkChange::LOST:
            std::cerr << "Warning: Node " << config.nodeId << " lost peer " << peerId << std::endl;
            emit(events, EventKind::PEER_LOST, "", peerId);
            pendingOffers.erase(peerId);
            dropPendingMerge(peerId, "peer lost");
            if (session && session->peerId == peerId) {
                abortSession("peer " + peerId + " lost", false, false, now, events);
            }
            break;
    }
    if (started) {
        evaluateState(now, events);
    }
}

void NodeAgent::handleLostLinks(const std::vector<std::string>& lost, SteadyTime now, Events& events) {
    for (const auto& peerId : lost) {
        handleLinkChange(peerId, LinkChange::LOST, now, events);
    }
}

// ==== OUTBOUND ====

bool NodeAgent::deliverable(const MeshMessage& message, SteadyTime now) const {
    if (peers_.liveLinks().empty()) return false;
    if (message.isBroadcast()) return true;
    if (router_.isReachable(message.destination(), now)) return true;
    return state_ == NetworkState::CENTRALIZED && !resyncing;
}

bool NodeAgent::tryDeliver(const MeshMessage& message, SteadyTime now, Events& events) {
    if (!deliverable(message, now)) return false;

    SendReport report = router_.originate(message, now);
    handleLostLinks(report.lostLinks, now, events);
    return report.sent > 0;
}

void NodeAgent::drainQueue(SteadyTime now, Events& events) {
    for (const auto& entry : queue_.due(now)) {
        const std::string& id = entry.message.id();
        if (tryDeliver(entry.message, now, events)) {
            queue_.remove(id);
            emit(events, EventKind::DELIVERY_OUTCOME, id,
                 deliveryStatusToString(DeliveryStatus::DELIVERED) + ": after " +
                 std::to_string(entry.attempts + 1) + " retries");
        } else {
            queue_.markFailed(id, now);
        }
    }
}

// ==== INBOUND ====

void NodeAgent::handleMeshMessage(const std::string& from, const Frame& frame, SteadyTime now, Events& events) {
    // gating only holds back what we send; traffic from a gated peer is still accepted
    MeshMessage message = MeshMessage::decode(frame.payload);
    ReceiveReport report = router_.receive(message, from, now,
        [this, &events](const MeshMessage& arrived) { return acceptMessage(arrived, events); });

    handleLinkChange(from, report.link, now, events);
    handleLostLinks(report.relay.lostLinks, now, events);
}

bool NodeAgent::acceptMessage(const MeshMessage& arrived, Events& events) {
    if (!arrived.verify(signer)) {
        std::cerr << "Error: Rejecting message " << arrived.id() << " from " << arrived.sender()
                  << ": invalid signature" << std::endl;
        return false;
    }

    clock_.merge(arrived.vectorClock(), arrived.lamport());

    // already recorded through a reconciliation, which reported it
    if (ledger_.containsMessage(arrived.id())) {
        return true;
    }

    LedgerBlock block = ledger_.append({arrived});
    emit(events, EventKind::LEDGER_APPENDED, arrived.id(), "block #" + std::to_string(block.index()));

    if (arrived.isBroadcast() || arrived.addressedTo(config.nodeId)) {
        emit(events, EventKind::MESSAGE_RECEIVED, arrived.id(),
             messageTypeToString(arrived.type()) + " from " + arrived.sender() +
             " after " + std::to_string(arrived.hops()) + " hops");
    }
    return true;
}

void NodeAgent::handleSyncOffer(const std::string& from, const Frame& frame, SteadyTime now, Events& events) {
    SyncOffer offer = SyncOffer::decode(frame.payload);
    std::vector<LedgerBlock> local = ledger_.blocks();
    std::vector<std::string> lost;

    try {
        ReconciliationResult result = reconciler.reconcile(local, offer.chain);

        // nothing is adopted until the initiator confirms it adopted the same chain
        PendingMerge pending;
        pending.sessionId = offer.sessionId;
        pending.canonical = result.canonical;
        pending.preMergeLength = local.size();
        pending.preMergeTip = local.back().hash();
        pending.answeredAt = now;
        for (const auto& conflict : result.conflicts) {
            pending.conflicts.push_back(conflict.toString());
        }
        pendingMerges[from] = std::move(pending);

        SyncResult reply;
        reply.sessionId = offer.sessionId;
        reply.forkIndex = result.forkIndex;
        reply.chain = result.canonical;
        reply.conflictCount = static_cast<uint32_t>(result.conflicts.size());
        if (!router_.sendDirect(from, makeFrame(FrameType::SYNC_RESULT, reply.encode()), lost)) {
            pendingMerges.erase(from);
        }

        std::cout << "Node " << config.nodeId << ": merged offer from " << from
                  << " (fork " << (result.forkIndex ? std::to_string(*result.forkIndex) : "none")
                  << ", " << result.conflicts.size() << " conflicts), waiting for ack" << std::endl;
    } catch (const DivergentLedgerError& e) {
        std::cerr << "Error: Divergent ledger offered by " << from << ": " << e.what() << std::endl;
        emit(events, EventKind::DIVERGENT_LEDGER, "", from + ": " + e.what());
        SyncAbort abort{offer.sessionId, e.what()};
        router_.sendDirect(from, makeFrame(FrameType::SYNC_ABORT, abort.encode()), lost);
    } catch (const IntegrityError& e) {
        std::cerr << "Error: Integrity failure merging with " << from << ": " << e.what() << std::endl;
        emit(events, EventKind::INTEGRITY_ALERT, "",
             from + " index " + std::to_string(e.offendingIndex()) + ": " + e.what());
        SyncAbort abort{offer.sessionId, e.what()};
        router_.sendDirect(from, makeFrame(FrameType::SYNC_ABORT, abort.encode()), lost);
    }

    handleLostLinks(lost, now, events);
}

void NodeAgent::handleSyncResult(const std::string& from, const Frame& frame, SteadyTime now, Events& events) {
    SyncResult result = SyncResult::decode(frame.payload);
    if (!session || session->sessionId != result.sessionId || session->peerId != from) {
        std::cerr << "Warning: Ignoring sync result for unknown session " << result.sessionId << std::endl;
        return;
    }

    const SyncSession current = *session;
    const std::vector<std::string> knownBefore = ledger_.messageIds();
    try {
        AdoptionResult adoption = ledger_.adopt(result.chain, current.preMergeLength);
        session.reset();

        std::vector<std::string> lost;
        router_.sendDirect(from, makeFrame(FrameType::SYNC_ACK, SyncAck{current.sessionId}.encode()), lost);

        if (result.conflictCount > 0) {
            emit(events, EventKind::CONFLICT_REPORT, "",
                 std::to_string(result.conflictCount) + " conflicts resolved with " + from);
        }
        reportGainedMessages(knownBefore, from, events);
        std::cout << "Node " << config.nodeId << ": adopted canonical chain from " << from
                  << " (" << result.chain.size() << " blocks, " << adoption.rebased << " rebased, "
                  << adoption.superseded.size() << " superseded)" << std::endl;

        if (current.withAuthority && resyncing) {
            resyncing = false;
            resyncAt.reset();
            router_.setGated(config.authorityId, false);
            transition(NetworkState::CENTRALIZED, "reconciled with authority", events);
        }
        handleLostLinks(lost, now, events);
    } catch (const DivergentLedgerError& e) {
        std::cerr << "Error: Divergent ledger from " << from << ": " << e.what() << std::endl;
        emit(events, EventKind::DIVERGENT_LEDGER, "", from + ": " + e.what());
        abortSession(e.what(), true, true, now, events);
    } catch (const IntegrityError& e) {
        std::cerr << "Error: Rejected canonical chain from " << from << ": " << e.what() << std::endl;
        emit(events, EventKind::INTEGRITY_ALERT, "",
             from + " index " + std::to_string(e.offendingIndex()) + ": " + e.what());
        abortSession(e.what(), true, true, now, events);
    }
}

void NodeAgent::handleSyncAck(const std::string& from, const Frame& frame, Events& events) {
    SyncAck ack = SyncAck::decode(frame.payload);
    auto it = pendingMerges.find(from);
    if (it == pendingMerges.end() || it->second.sessionId != ack.sessionId) {
        std::cerr << "Warning: Ignoring sync ack for unknown session " << ack.sessionId << std::endl;
        return;
    }
    const PendingMerge pending = std::move(it->second);
    pendingMerges.erase(it);

    const std::vector<std::string> knownBefore = ledger_.messageIds();
    try {
        std::vector<LedgerBlock> local = ledger_.blocks();
        AdoptionResult adoption;
        if (local.size() >= pending.preMergeLength &&
            local[pending.preMergeLength - 1].hash() == pending.preMergeTip) {
            adoption = ledger_.adopt(pending.canonical, pending.preMergeLength);
        } else {
            // our chain was replaced while waiting: merge the answered chain into it
            ReconciliationResult again = reconciler.reconcile(local, pending.canonical);
            adoption = ledger_.adopt(again.canonical, local.size());
        }

        for (const auto& conflict : pending.conflicts) {
            emit(events, EventKind::CONFLICT_REPORT, "", conflict);
        }
        reportGainedMessages(knownBefore, from, events);
        std::cout << "Node " << config.nodeId << ": reconciled with " << from << " ("
                  << adoption.rebased << " rebased, " << adoption.superseded.size() << " superseded)" << std::endl;
    } catch (const DivergentLedgerError& e) {
        std::cerr << "Error: Divergent ledger acknowledged by " << from << ": " << e.what() << std::endl;
        emit(events, EventKind::DIVERGENT_LEDGER, "", from + ": " + e.what());
    } catch (const IntegrityError& e) {
        std::cerr << "Error: Cannot adopt merge acknowledged by " << from << ": " << e.what() << std::endl;
        emit(events, EventKind::INTEGRITY_ALERT, "",
             from + " index " + std::to_string(e.offendingIndex()) + ": " + e.what());
    }
}

void NodeAgent::handleSyncAbort(const std::string& from, const Frame& frame, SteadyTime now, Events& events) {
    SyncAbort abort = SyncAbort::decode(frame.payload);
    auto it = pendingMerges.find(from);
    if (it != pendingMerges.end() && it->second.sessionId == abort.sessionId) {
        dropPendingMerge(from, "aborted by " + from + ": " + abort.reason);
    }
    if (session && session->sessionId == abort.sessionId && session->peerId == from) {
        abortSession("aborted by " + from + ": " + abort.reason, false, true, now, events);
    }
}

void NodeAgent::dropPendingMerge(const std::string& peerId, const std::string& reason) {
    if (pendingMerges.erase(peerId) > 0) {
        std::cerr << "Warning: Dropping merge answered to " << peerId << ": " << reason << std::endl;
    }
}

void NodeAgent::reportGainedMessages(const std::vector<std::string>& knownBefore, const std::string& via, Events& events) {
    const std::unordered_set<std::string> known(knownBefore.begin(), knownBefore.end());
    for (const auto& block : ledger_.blocks()) {
        for (const auto& msg : block.messages()) {
            if (known.count(msg.id()) || msg.sender() == config.nodeId) continue;
            if (msg.isBroadcast() || msg.addressedTo(config.nodeId)) {
                emit(events, EventKind::MESSAGE_RECEIVED, msg.id(),
                     messageTypeToString(msg.type()) + " from " + msg.sender() + " via reconciliation with " + via);
            }
        }
    }
}

// ==== SESSIONS ====

void NodeAgent::startSession(const std::string& peerId, bool withAuthority, SteadyTime now, Events& events) {
    SyncSession next;
    next.sessionId = CryptoBase::randomId(MESSAGE_ID_BYTES);
    next.peerId = peerId;
    next.withAuthority = withAuthority;
    next.startedAt = now;

    SyncOffer offer;
    offer.sessionId = next.sessionId;
    offer.nodeId = config.nodeId;
    offer.chain = ledger_.blocks();
    next.preMergeLength = offer.chain.size();
    session = next;

    std::vector<std::string> lost;
    if (!router_.sendDirect(peerId, makeFrame(FrameType::SYNC_OFFER, offer.encode()), lost)) {
        abortSession("offer to " + peerId + " not sent", false, true, now, events);
    } else {
        std::cout << "Node " << config.nodeId << ": sync session " << next.sessionId.substr(0, 8)
                  << " with " << peerId << " (" << offer.chain.size() << " blocks)" << std::endl;
    }
    handleLostLinks(lost, now, events);
}

void NodeAgent::abortSession(const std::string& reason, bool notifyPeer, bool retry, SteadyTime now, Events& events) {
    if (!session) return;

    const SyncSession aborted = *session;
    session.reset();

    std::vector<std::string> lost;
    if (notifyPeer) {
        SyncAbort abort{aborted.sessionId, reason};
        router_.sendDirect(aborted.peerId, makeFrame(FrameType::SYNC_ABORT, abort.encode()), lost);
    }

    std::cerr << "Warning: Reconciliation with " << aborted.peerId << " aborted: " << reason << std::endl;
    emit(events, EventKind::RECONCILIATION_ABORTED, "",
         "session " + aborted.sessionId + " with " + aborted.peerId + ": " + reason);

    if (retry) {
        if (aborted.withAuthority) {
            if (resyncing) resyncAt = now + config.resyncRetry;
        } else {
            pendingOffers[aborted.peerId] = now + config.resyncRetry;
        }
    }
    handleLostLinks(lost, now, events);
}

void NodeAgent::runPendingSessions(SteadyTime now, Events& events) {
    if (session) return;

    if (resyncing && resyncAt && *resyncAt <= now) {
        resyncAt.reset();
        startSession(config.authorityId, true, now, events);
        return;
    }

    for (auto it = pendingOffers.begin(); it != pendingOffers.end(); ++it) {
        if (it->second > now) continue;
        const std::string peerId = it->first;
        pendingOffers.erase(it);
        if (peers_.isAlive(peerId)) {
            startSession(peerId, false, now, events);
        }
        return;
    }
}

} // namespace tacmesh
