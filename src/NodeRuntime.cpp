#include "tacmesh/NodeRuntime.hpp"
#include "tacmesh/Protocol.hpp"

#include <chrono>
#include <iostream>

namespace tacmesh {

    namespace {
        SteadyTime nowSteady() {
            return std::chrono::steady_clock::now();
        }

        constexpr size_t MAX_DIALS_PER_ROUND = 8;
    }

    NodeRuntime::NodeRuntime(const NodeConfig& cfg, const Signer& signer, LedgerStore& store)
        : config(cfg),
          store(store),
          agent_(cfg, *this, signer),
          io(),
          workGuard(boost::asio::make_work_guard(io)),
          acceptor(io),
          maintenanceTimer(io) {}

    NodeRuntime::~NodeRuntime() {
        stop();
    }

    bool NodeRuntime::start() {
        if (running) return true;

        if (store.hasChain()) {
            std::vector<LedgerBlock> chain;
            std::vector<LedgerBlock> archive;
            if (!store.loadChain(chain) || !store.loadArchive(archive)) {
                std::cerr << "Error: Cannot load stored ledger from " << store.directory() << std::endl;
                return false;
            }
            if (!agent_.restoreLedger(chain, archive)) {
                return false;
            }
            std::cout << "Restored ledger with " << chain.size() << " blocks" << std::endl;
        }
        if (agent_.loadKnownPeers(peersFile())) {
            std::cout << "Loaded known peers from " << peersFile() << std::endl;
        }
        savedTipHash = agent_.ledger().tip().hash();
        savedArchiveSize = agent_.ledger().superseded().size();

        boost::system::error_code ec;
        tcp::endpoint endpoint(tcp::v4(), config.listenPort);
        acceptor.open(endpoint.protocol(), ec);
        if (!ec) acceptor.set_option(tcp::acceptor::reuse_address(true), ec);
        if (!ec) acceptor.bind(endpoint, ec);
        if (!ec) acceptor.listen(boost::asio::socket_base::max_listen_connections, ec);
        if (ec) {
            std::cerr << "Error: Cannot listen on port " << config.listenPort << ": " << ec.message() << std::endl;
            return false;
        }

        running = true;
        doAccept();
        for (const auto& peer : agent_.peers().selectPeersToConnect(MAX_DIALS_PER_ROUND)) {
            dial(peer);
        }
        agent_.start(nowSteady());
        scheduleMaintenance();

        ioThread = std::thread([this] { io.run(); });
        std::cout << "Node " << config.nodeId << " listening on port " << config.listenPort << std::endl;
        return true;
    }

    void NodeRuntime::stop() {
        if (!running.exchange(false)) return;

        workGuard.reset();
        boost::system::error_code ec;
        acceptor.close(ec);
        maintenanceTimer.cancel();

        {
            std::lock_guard<std::mutex> lk(connMtx);
            // peers see the closed socket as link down
            for (auto& kv : connections) kv.second->close();
            for (const auto& conn : pending) conn->close();
        }

        io.stop();
        if (ioThread.joinable()) ioThread.join();

        {
            std::lock_guard<std::mutex> lk(connMtx);
            connections.clear();
            pending.clear();
            dialing.clear();
        }
        persistLedger();
        if (!agent_.saveKnownPeers(peersFile())) {
            std::cerr << "Warning: Could not save known peers to " << peersFile() << std::endl;
        }
    }

    std::string NodeRuntime::peersFile() const {
        return store.directory() + "/peers.txt";
    }

    // ==== TRANSPORT ====

    bool NodeRuntime::send(const std::string& peerId, const Frame& frame) {
        std::lock_guard<std::mutex> lk(connMtx);
        auto it = connections.find(peerId);
        if (it == connections.end() || !it->second->isOpen()) {
            return false;
        }
        it->second->sendFrame(frame);
        return true;
    }

    std::string NodeRuntime::submit(MessageType type, const std::vector<uint8_t>& payload, const std::string& destination) {
        return agent_.submit(type, payload, destination, nowSteady());
    }

    size_t NodeRuntime::connectionCount() const {
        std::lock_guard<std::mutex> lk(connMtx);
        return connections.size();
    }

    // ==== CONNECTIONS ====

    void NodeRuntime::doAccept() {
        auto conn = std::make_shared<PeerConnection>(io);
        acceptor.async_accept(conn->socket(), [this, conn](const boost::system::error_code& ec) {
            if (!ec) {
                attach(conn);
                conn->start();
            } else if (running) {
                std::cerr << "Warning: Accept failed: " << ec.message() << std::endl;
            }
            if (running) doAccept();
        });
    }

    void NodeRuntime::dial(const PeerLink& peer) {
        {
            std::lock_guard<std::mutex> lk(connMtx);
            if (connections.count(peer.nodeId) || !dialing.insert(peer.nodeId).second) return;
        }

        auto conn = std::make_shared<PeerConnection>(io);
        conn->connectTo(peer, [this, peer](const PeerConnection::Ptr& c, bool connected) {
            {
                std::lock_guard<std::mutex> lk(connMtx);
                dialing.erase(peer.nodeId);
            }
            if (!connected) {
                agent_.onLinkDown(peer.nodeId, nowSteady());
                return;
            }
            attach(c);
        });
    }

    void NodeRuntime::attach(const PeerConnection::Ptr& conn) {
        conn->setFrameHandler([this](const PeerConnection::Ptr& c, const Frame& f) { handleFrame(c, f); });
        conn->setCloseHandler([this](const PeerConnection::Ptr& c) { handleClosed(c); });
        {
            std::lock_guard<std::mutex> lk(connMtx);
            pending.insert(conn);
        }
        Hello hello{config.nodeId};
        conn->sendFrame(makeFrame(FrameType::HELLO, hello.encode()));
    }

    void NodeRuntime::handleFrame(const PeerConnection::Ptr& conn, const Frame& frame) {
        std::string peerId = conn->remoteNodeId();

        if (peerId.empty()) {
            if (frame.type != FrameType::HELLO) {
                std::cerr << "Warning: " << frameTypeToString(frame.type) << " before HELLO, closing" << std::endl;
                conn->close();
                return;
            }
            Hello hello;
            try {
                hello = Hello::decode(frame.payload);
            } catch (const std::runtime_error& e) {
                std::cerr << "Error: Bad HELLO: " << e.what() << std::endl;
                conn->close();
                return;
            }
            if (hello.nodeId == config.nodeId) {
                conn->close();
                return;
            }

            PeerConnection::Ptr replaced;
            {
                std::lock_guard<std::mutex> lk(connMtx);
                pending.erase(conn);
                conn->setRemoteNodeId(hello.nodeId);
                auto it = connections.find(hello.nodeId);
                if (it != connections.end() && it->second != conn) replaced = it->second;
                connections[hello.nodeId] = conn;
            }
            if (replaced) replaced->close();
            peerId = hello.nodeId;
        }

        agent_.onFrame(peerId, frame, nowSteady());
    }

    void NodeRuntime::handleClosed(const PeerConnection::Ptr& conn) {
        const std::string peerId = conn->remoteNodeId();
        bool wasCurrent = false;
        {
            std::lock_guard<std::mutex> lk(connMtx);
            pending.erase(conn);
            auto it = connections.find(peerId);
            if (!peerId.empty() && it != connections.end() && it->second == conn) {
                connections.erase(it);
                wasCurrent = true;
            }
        }
        if (wasCurrent && running) {
            agent_.onLinkDown(peerId, nowSteady());
        }
    }

    // ==== MAINTENANCE ====

    void NodeRuntime::scheduleMaintenance() {
        maintenanceTimer.expires_after(MAINTENANCE_PERIOD);
        maintenanceTimer.async_wait([this](const boost::system::error_code& ec) {
            if (ec || !running) return;
            maintenance();
            scheduleMaintenance();
        });
    }

    void NodeRuntime::maintenance() {
        agent_.tick(nowSteady());

        for (const auto& peer : agent_.peers().selectPeersToConnect(MAX_DIALS_PER_ROUND)) {
            dial(peer);
        }
        persistLedger();
    }

    void NodeRuntime::persistLedger() {
        const std::vector<LedgerBlock> chain = agent_.ledger().blocks();
        const std::vector<LedgerBlock> archive = agent_.ledger().superseded();
        if (chain.back().hash() == savedTipHash && archive.size() == savedArchiveSize) return;

        if (!store.saveChain(chain)) {
            std::cerr << "Warning: Ledger not persisted, will retry" << std::endl;
            return;
        }
        if (!store.saveArchive(archive)) {
            std::cerr << "Warning: Superseded archive not persisted, will retry" << std::endl;
            return;
        }
        savedTipHash = chain.back().hash();
        savedArchiveSize = archive.size();
    }

} // namespace tacmesh
