#ifndef TACMESH_PEER_CONNECTION_HPP
#define TACMESH_PEER_CONNECTION_HPP

#include "tacmesh/Frame.hpp"
#include "tacmesh/PeerTable.hpp"

#include <boost/asio.hpp>
#include <atomic>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tacmesh {

    using tcp = boost::asio::ip::tcp;

    /**
     * One TCP link to a neighbour. Reads frames in a loop and queues writes so
     * that at most one async_write is in flight.
     */
    class PeerConnection : public std::enable_shared_from_this<PeerConnection> {
    public:
        using Ptr = std::shared_ptr<PeerConnection>;
        using FrameCallback = std::function<void(const Ptr&, const Frame&)>;
        using CloseCallback = std::function<void(const Ptr&)>;
        using ConnectCallback = std::function<void(const Ptr&, bool connected)>;

        explicit PeerConnection(boost::asio::io_context& ctx);
        ~PeerConnection();

        tcp::socket& socket();

        // Starts the read loop
        void start();

        /**
         * Resolves and connects to peer. onConnected runs on the io thread with
         * the outcome; the read loop starts on success.
         */
        void connectTo(const PeerLink& peer, ConnectCallback onConnected);

        // Thread-safe; the write happens on the io thread
        void sendFrame(const Frame& frame);
        void close();
        bool isOpen() const { return !closed; }

        void setFrameHandler(FrameCallback cb);
        void setCloseHandler(CloseCallback cb);

        // Known once the remote side has said HELLO
        std::string remoteNodeId() const;
        void setRemoteNodeId(const std::string& nodeId);

    private:
        void asyncReadHeader();
        void asyncReadPayload(uint64_t payloadLen);
        void handleDisconnect();
        void doWrite();

        boost::asio::io_context& io;
        tcp::socket sock;
        FrameCallback onFrame;
        CloseCallback onClose;

        std::vector<uint8_t> headerBuf;
        std::vector<uint8_t> payloadBuf;

        mutable std::mutex stateMtx;
        std::string nodeId;
        std::deque<std::vector<uint8_t>> writeQueue;
        std::atomic<bool> closed{false};
    };

} // namespace tacmesh

#endif // TACMESH_PEER_CONNECTION_HPP
