#ifndef TACMESH_PEER_TABLE_HPP
#define TACMESH_PEER_TABLE_HPP

#include "tacmesh/Types.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tacmesh {

    struct PeerLink {
        std::string nodeId;
        std::string host;   // empty for links without a dial address
        uint16_t port = 0;
        SteadyTime lastSeen{};
        double quality = 0.0;   // EWMA of delivery success, 0..1
        uint32_t failedAttempts = 0;
        bool alive = false;
        bool everSeen = false;
        bool gated = false;     // excluded from routing

        std::string address() const {
            return host + ":" + std::to_string(port);
        }

        bool isDialable() const {
            return !host.empty() && port > 0;
        }
    };

    enum class LinkChange {
        NONE,
        FOUND,      // first contact
        RESTORED,   // back after being lost
        LOST
    };

    /**
     * Direct neighbours of a node and the health of each link. Thread-safe.
     */
    class PeerTable {
        public:
            explicit PeerTable(Millis peerTimeout = DEFAULT_PEER_TIMEOUT);

            /**
             * Adds a provisioned neighbour. An existing entry keeps its health
             * and only takes the new dial address.
             */
            void addKnownPeer(const PeerLink& link);
            bool removePeer(const std::string& nodeId);

            /**
             * Records traffic from a neighbour: refreshes lastSeen, pulls the
             * quality towards 1 and revives the link.
             */
            LinkChange markSeen(const std::string& nodeId, SteadyTime now);

            /**
             * Records a failed send or dial: pulls the quality towards 0 and
             * drops the link.
             */
            LinkChange markFailed(const std::string& nodeId);

            // Drops live links silent for longer than the peer timeout
            std::vector<std::string> sweep(SteadyTime now);

            void setGated(const std::string& nodeId, bool gated);
            bool isGated(const std::string& nodeId) const;
            bool isAlive(const std::string& nodeId) const;

            // Live links, gated ones excluded unless asked for
            std::vector<std::string> liveLinks(bool includeGated = false) const;
            size_t liveCount() const;
            // Mean quality over live links; 0 without any
            double meanQuality(bool includeGated = false) const;

            std::optional<PeerLink> getPeer(const std::string& nodeId) const;
            std::vector<PeerLink> getKnownPeers() const;
            // Dialable peers without a live link, best quality first
            std::vector<PeerLink> selectPeersToConnect(size_t maxCount) const;

            // One line per dialable peer: host:port:nodeId
            bool persist(const std::string& filename) const;
            bool loadFromDisk(const std::string& filename);

            size_t size() const;
            Millis timeout() const { return peerTimeout; }

        private:
            static double blend(double quality, double sample);

            Millis peerTimeout;
            mutable std::mutex mtx;
            std::unordered_map<std::string, PeerLink> peers; // key = nodeId
    };

} // namespace tacmesh

#endif // TACMESH_PEER_TABLE_HPP
