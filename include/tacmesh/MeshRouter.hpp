#ifndef TACMESH_MESH_ROUTER_HPP
#define TACMESH_MESH_ROUTER_HPP

#include "tacmesh/MeshMessage.hpp"
#include "tacmesh/PeerTable.hpp"
#include "tacmesh/Transport.hpp"
#include "tacmesh/Types.hpp"

#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tacmesh {

    struct SendReport {
        size_t sent = 0;
        std::vector<std::string> lostLinks;   // links that went down on send
    };

    struct ReceiveReport {
        LinkChange link = LinkChange::NONE;   // link to the sender
        bool duplicate = false;
        bool accepted = false;
        SendReport relay;
    };

    /**
     * TTL-bounded flooding over direct links with duplicate suppression.
     *
     * A message leaves its origin with the configured TTL. Every hop hands its
     * neighbours a copy with TTL - 1 and the receiver appends itself to the
     * route, so no message ever travels more than the initial TTL in hops.
     * Each message id is processed at most once per node within the retention
     * window.
     */
    class MeshRouter {
    public:
        // Local handling of a newly arrived message. Return false to reject it
        // (it is then not relayed).
        using Processor = std::function<bool(const MeshMessage& arrived)>;

        MeshRouter(std::string selfId,
                   Transport& transport,
                   PeerTable& peers,
                   Millis dedupRetention = DEFAULT_DEDUP_RETENTION);

        // ==== MESSAGES ====

        /**
         * Handles a message received from a direct neighbour. process runs
         * without any router lock held.
         */
        ReceiveReport receive(const MeshMessage& message,
                              const std::string& fromNodeId,
                              SteadyTime now,
                              const Processor& process);

        /**
         * Hands a copy with TTL - 1 to every live, non-gated neighbour that is
         * not already on the route (and is not except). Sends nothing at TTL 0.
         */
        SendReport broadcast(const MeshMessage& message, const std::string& except = std::string());

        // Sends a locally created message to the mesh
        SendReport originate(const MeshMessage& message, SteadyTime now);

        // Sends a control frame to one direct neighbour
        bool sendDirect(const std::string& peerId, const Frame& frame, std::vector<std::string>& lostLinks);

        // ==== LINKS ====
        LinkChange markSeen(const std::string& nodeId, SteadyTime now);
        std::vector<std::string> sweep(SteadyTime now);
        void setGated(const std::string& nodeId, bool gated);

        /**
         * True when nodeId is a live direct link or was observed in mesh
         * traffic within the peer timeout. Gated nodes are never reachable.
         */
        bool isReachable(const std::string& nodeId, SteadyTime now) const;
        bool hasSeen(const std::string& messageId) const;
        size_t dedupSize() const;

        const std::string& selfId() const { return self; }

    private:
        // Returns false if the id was already known
        bool rememberLocked(const std::string& messageId, SteadyTime now);
        void pruneLocked(SteadyTime now);
        std::vector<std::string> targetsFor(const MeshMessage& message, const std::string& except) const;

        std::string self;
        Transport& transport;
        PeerTable& peers;
        Millis retention;

        mutable std::mutex mtx;
        std::unordered_map<std::string, SteadyTime> seenIds;
        std::deque<std::pair<SteadyTime, std::string>> seenOrder;
        std::unordered_map<std::string, SteadyTime> observed;   // nodes seen in routes
    };

} // namespace tacmesh

#endif // TACMESH_MESH_ROUTER_HPP
