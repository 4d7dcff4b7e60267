#ifndef TACMESH_NODE_AGENT_HPP
#define TACMESH_NODE_AGENT_HPP

#include "tacmesh/ClockService.hpp"
#include "tacmesh/Ledger.hpp"
#include "tacmesh/MeshRouter.hpp"
#include "tacmesh/NodeConfig.hpp"
#include "tacmesh/NodeEvent.hpp"
#include "tacmesh/OutboundQueue.hpp"
#include "tacmesh/PeerTable.hpp"
#include "tacmesh/Protocol.hpp"
#include "tacmesh/Reconciliation.hpp"
#include "tacmesh/Transport.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tacmesh {

    class Signer;

    /**
     * One battlefield node: network-state machine, outbound queue, inbound
     * handling and reconciliation sessions on top of the clock, ledger and
     * router it owns.
     *
     * Time never comes from a clock inside the agent; every entry point takes
     * the current steady time. Events are dispatched after the agent lock is
     * released, so a handler may call back into the agent.
     */
    class NodeAgent {
    public:
        NodeAgent(const NodeConfig& config, Transport& transport, const Signer& signer);

        NodeAgent(const NodeAgent&) = delete;
        NodeAgent& operator=(const NodeAgent&) = delete;

        void setEventHandler(EventHandler handler);

        // Direct neighbour reachable over the transport
        void addNeighbour(const PeerLink& link);
        void addNeighbour(const std::string& nodeId);

        // Replaces the genesis-only ledger with a stored one
        bool restoreLedger(const std::vector<LedgerBlock>& chain, const std::vector<LedgerBlock>& archive);

        // Known peer addresses (host:port:nodeId per line)
        bool loadKnownPeers(const std::string& filename);
        bool saveKnownPeers(const std::string& filename) const;

        // ==== INPUTS ====

        // Starts the authority liveness window and sends the first heartbeats
        void start(SteadyTime now);

        /**
         * Creates, signs and records a message, then sends it or queues it.
         * The outcome arrives as a DELIVERY_OUTCOME event. Returns the id.
         */
        std::string submit(MessageType type,
                           const std::vector<uint8_t>& payload,
                           const std::string& destination,
                           SteadyTime now);

        void onFrame(const std::string& fromNodeId, const Frame& frame, SteadyTime now);
        void onLinkUp(const std::string& peerId, SteadyTime now);
        void onLinkDown(const std::string& peerId, SteadyTime now);

        // Heartbeats, liveness, session timeouts, retries and expiry
        void tick(SteadyTime now);

        // ==== QUERIES ====
        const std::string& id() const { return config.nodeId; }
        bool isAuthority() const { return config.isAuthority(); }
        NetworkState state() const;
        bool isResyncing() const;
        bool hasActiveSession() const;
        // Merges answered as responder and waiting for the initiator's SYNC_ACK
        size_t pendingMergeCount() const;
        size_t queuedCount() const;

        Ledger& ledger() { return ledger_; }
        const Ledger& ledger() const { return ledger_; }
        ClockService& clock() { return clock_; }
        const MeshRouter& router() const { return router_; }
        const PeerTable& peers() const { return peers_; }
        const OutboundQueue& queue() const { return queue_; }

    private:
        struct SyncSession {
            std::string sessionId;
            std::string peerId;
            bool withAuthority = false;
            uint64_t preMergeLength = 0;
            SteadyTime startedAt{};
        };

        // Canonical chain sent back to an initiator, adopted once it acknowledges
        struct PendingMerge {
            std::string sessionId;
            std::vector<LedgerBlock> canonical;
            uint64_t preMergeLength = 0;
            std::string preMergeTip;
            std::vector<std::string> conflicts;
            SteadyTime answeredAt{};
        };

        using Events = std::vector<NodeEvent>;

        void emit(Events& events, EventKind kind, const std::string& messageId, const std::string& detail) const;
        void dispatch(const Events& events);

        // ==== STATE MACHINE ====
        void evaluateState(SteadyTime now, Events& events);
        void transition(NetworkState next, const std::string& reason, Events& events);
        void onAuthorityBeat(SteadyTime now, Events& events);
        void onAuthorityLost(SteadyTime now, Events& events);
        void sendHeartbeats(SteadyTime now, Events& events);

        // ==== LINKS ====
        void handleLinkChange(const std::string& peerId, LinkChange change, SteadyTime now, Events& events);
        void handleLostLinks(const std::vector<std::string>& lost, SteadyTime now, Events& events);

        // ==== OUTBOUND ====
        bool deliverable(const MeshMessage& message, SteadyTime now) const;
        bool tryDeliver(const MeshMessage& message, SteadyTime now, Events& events);
        void drainQueue(SteadyTime now, Events& events);

        // ==== INBOUND ====
        void handleMeshMessage(const std::string& from, const Frame& frame, SteadyTime now, Events& events);
        bool acceptMessage(const MeshMessage& arrived, Events& events);
        void reportGainedMessages(const std::vector<std::string>& knownBefore, const std::string& via, Events& events);
        void handleSyncOffer(const std::string& from, const Frame& frame, SteadyTime now, Events& events);
        void handleSyncResult(const std::string& from, const Frame& frame, SteadyTime now, Events& events);
        void handleSyncAbort(const std::string& from, const Frame& frame, SteadyTime now, Events& events);
        void handleSyncAck(const std::string& from, const Frame& frame, Events& events);
        void dropPendingMerge(const std::string& peerId, const std::string& reason);

        // ==== SESSIONS ====
        void startSession(const std::string& peerId, bool withAuthority, SteadyTime now, Events& events);
        void abortSession(const std::string& reason, bool notifyPeer, bool retry, SteadyTime now, Events& events);
        void runPendingSessions(SteadyTime now, Events& events);

        NodeConfig config;
        const Signer& signer;

        ClockService clock_;
        Ledger ledger_;
        PeerTable peers_;
        MeshRouter router_;
        OutboundQueue queue_;
        ReconciliationService reconciler;

        mutable std::mutex mtx;
        EventHandler eventHandler;

        NetworkState state_ = NetworkState::CENTRALIZED;
        bool resyncing = false;
        bool authorityAlive = true;
        bool started = false;
        SteadyTime lastAuthorityBeat{};
        std::optional<SteadyTime> lastHeartbeatSent;

        std::optional<SyncSession> session;
        std::optional<SteadyTime> resyncAt;              // next offer to the authority
        std::map<std::string, SteadyTime> pendingOffers; // peer -> when to offer
        std::map<std::string, PendingMerge> pendingMerges; // initiator -> answered merge
    };

} // namespace tacmesh

#endif // TACMESH_NODE_AGENT_HPP
