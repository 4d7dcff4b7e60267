#ifndef TACMESH_NODE_RUNTIME_HPP
#define TACMESH_NODE_RUNTIME_HPP

#include "tacmesh/LedgerStore.hpp"
#include "tacmesh/NodeAgent.hpp"
#include "tacmesh/NodeConfig.hpp"
#include "tacmesh/PeerConnection.hpp"
#include "tacmesh/Transport.hpp"

#include <boost/asio.hpp>
#include <atomic>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <unordered_map>

namespace tacmesh {

    class Signer;

    /**
     * Runs a NodeAgent over TCP: accepts and dials neighbours, drives the
     * agent's tick from a steady timer and persists the ledger after changes.
     * Neighbours are keyed by the node id they announce in HELLO.
     */
    class NodeRuntime : public Transport {
        public:
            NodeRuntime(const NodeConfig& config, const Signer& signer, LedgerStore& store);
            ~NodeRuntime() override;

            bool start();
            void stop();

            bool send(const std::string& peerId, const Frame& frame) override;

            std::string submit(MessageType type, const std::vector<uint8_t>& payload, const std::string& destination);

            NodeAgent& agent() { return agent_; }
            size_t connectionCount() const;

        private:
            void doAccept();
            void dial(const PeerLink& peer);
            void attach(const PeerConnection::Ptr& conn);
            void handleFrame(const PeerConnection::Ptr& conn, const Frame& frame);
            void handleClosed(const PeerConnection::Ptr& conn);

            void scheduleMaintenance();
            void maintenance();
            void persistLedger();
            std::string peersFile() const;

            NodeConfig config;
            LedgerStore& store;
            NodeAgent agent_;

            boost::asio::io_context io;
            boost::asio::executor_work_guard<boost::asio::io_context::executor_type> workGuard;
            tcp::acceptor acceptor;
            boost::asio::steady_timer maintenanceTimer;

            mutable std::mutex connMtx;
            std::unordered_map<std::string, PeerConnection::Ptr> connections; // by node id
            std::set<PeerConnection::Ptr> pending;                          // before HELLO
            std::set<std::string> dialing;

            std::thread ioThread;
            std::atomic<bool> running{false};
            std::string savedTipHash;
            size_t savedArchiveSize = 0;
    };

} // namespace tacmesh

#endif // TACMESH_NODE_RUNTIME_HPP
