#ifndef TACMESH_SIMULATED_NETWORK_HPP
#define TACMESH_SIMULATED_NETWORK_HPP

#include "tacmesh/Transport.hpp"

#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace tacmesh {

    /**
     * In-memory radio network for simulations and tests. Links are symmetric
     * and can be cut and restored at any time. Frames travel as serialized
     * bytes and are delivered in rounds by pump(); a frame whose link is cut
     * before delivery is lost.
     */
    class SimulatedNetwork {
    public:
        SimulatedNetwork() = default;
        SimulatedNetwork(const SimulatedNetwork&) = delete;
        SimulatedNetwork& operator=(const SimulatedNetwork&) = delete;

        // Registers a node and returns its transport endpoint
        Transport& attach(const std::string& nodeId);
        void setHandler(const std::string& nodeId, FrameHandler handler);

        // ==== TOPOLOGY ====
        void connect(const std::string& a, const std::string& b);
        void disconnect(const std::string& a, const std::string& b);
        void isolate(const std::string& nodeId);
        bool linked(const std::string& a, const std::string& b) const;
        std::vector<std::string> neighbours(const std::string& nodeId) const;

        // Every frame sent while enabled is delivered twice
        void setDuplicateDelivery(bool enabled);

        // ==== DELIVERY ====

        /**
         * Delivers the frames queued before the call. Frames sent by handlers
         * during the round wait for the next one. Returns the number delivered.
         */
        size_t pump();
        size_t pumpUntilIdle(size_t maxRounds = 1000);
        size_t pending() const;

        uint64_t framesDelivered() const;
        uint64_t framesDropped() const;

    private:
        class Endpoint : public Transport {
        public:
            Endpoint(SimulatedNetwork& network, std::string nodeId)
                : network(network), nodeId(std::move(nodeId)) {}

            bool send(const std::string& peerId, const Frame& frame) override {
                return network.enqueue(nodeId, peerId, frame);
            }

        private:
            SimulatedNetwork& network;
            std::string nodeId;
        };

        struct InFlight {
            std::string from;
            std::string to;
            std::vector<uint8_t> bytes;
        };

        bool enqueue(const std::string& from, const std::string& to, const Frame& frame);
        static std::pair<std::string, std::string> linkKey(const std::string& a, const std::string& b);

        mutable std::mutex mtx;
        std::map<std::string, std::unique_ptr<Endpoint>> endpoints;
        std::map<std::string, FrameHandler> handlers;
        std::set<std::pair<std::string, std::string>> links;
        std::deque<InFlight> queue;
        bool duplicate = false;
        uint64_t delivered = 0;
        uint64_t dropped = 0;
    };

} // namespace tacmesh

#endif // TACMESH_SIMULATED_NETWORK_HPP
